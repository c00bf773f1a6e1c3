#include "gitident/config.hpp"

#include "gitident/consts.hpp"
#include "gitident/fs.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

// One value per line: a line break would end the value early or start a new key.
void require_single_line(const std::optional<std::string> &value, std::string_view key) {
  if (value && value->find_first_of("\r\n") != std::string::npos) {
    throw std::invalid_argument("config: " + std::string(key) + " value contains a line break");
  }
}

} // namespace

namespace gitident {

std::filesystem::path config_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kGitDir / consts::kConfigFile;
}

auto load_user_config(const std::filesystem::path &repo_root) -> UserConfig {
  UserConfig out{};
  const auto path = config_path(repo_root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  std::istringstream iss(std::string(bytes.begin(), bytes.end()));

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(consts::kNameKey)) {
      out.name = trim(sv.substr(consts::kNameKey.size()));
    } else if (sv.starts_with(consts::kEmailKey)) {
      out.email = trim(sv.substr(consts::kEmailKey.size()));
    }
  }
  return out;
}

void save_user_config(const std::filesystem::path &repo_root, const UserConfig &cfg) {
  require_single_line(cfg.name, consts::kNameKey);
  require_single_line(cfg.email, consts::kEmailKey);

  std::ostringstream os;
  if (cfg.name)
    os << consts::kNameKey << ' ' << *cfg.name << '\n';
  if (cfg.email)
    os << consts::kEmailKey << ' ' << *cfg.email << '\n';

  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::write_file_atomic(config_path(repo_root), std::span(data, s.size()));
}

} // namespace gitident
