#include "gitident/person_ident.hpp"

#include <functional>
#include <iostream>
#include <unordered_set>

using gitident::PersonIdent;

int main() {
  const std::hash<PersonIdent> h;

  // same second, different ms and different zone: equal
  const PersonIdent a{"A U Thor", "author@example.com", 1142878449000LL, -300};
  const PersonIdent b{"A U Thor", "author@example.com", 1142878449500LL, 120};
  if (!(a == b) || a != b) {
    std::cerr << "same-second idents differ\n";
    return 1;
  }
  if (h(a) != h(b)) {
    std::cerr << "equal idents hash differently\n";
    return 1;
  }

  // crossing a second boundary: unequal
  const PersonIdent c{"A U Thor", "author@example.com", 1142878448999LL, -300};
  if (a == c) {
    std::cerr << "idents one second apart compare equal\n";
    return 1;
  }

  // name and email both count
  if (a == PersonIdent{"Someone Else", "author@example.com", 1142878449000LL, -300}) {
    std::cerr << "name ignored by equality\n";
    return 1;
  }
  if (a == PersonIdent{"A U Thor", "other@example.com", 1142878449000LL, -300}) {
    std::cerr << "email ignored by equality\n";
    return 1;
  }

  // stored text is compared verbatim, not sanitized
  if (a == PersonIdent{" A U Thor ", "author@example.com", 1142878449000LL, -300}) {
    std::cerr << "padding ignored by equality\n";
    return 1;
  }

  // truncation toward zero: -999 ms and +999 ms are both second 0
  const PersonIdent neg{"N", "n@example.com", -999, 0};
  const PersonIdent pos{"N", "n@example.com", 999, 0};
  if (!(neg == pos) || h(neg) != h(pos)) {
    std::cerr << "-999ms and 999ms should share second 0\n";
    return 1;
  }
  // -1000 ms is second -1
  if (neg == PersonIdent{"N", "n@example.com", -1000, 0}) {
    std::cerr << "-999ms and -1000ms should differ\n";
    return 1;
  }

  std::unordered_set<PersonIdent> seen;
  seen.insert(a);
  seen.insert(b);
  seen.insert(c);
  if (seen.size() != 2) {
    std::cerr << "unordered_set size " << seen.size() << ", want 2\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
