#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace gitident {

// Where the committer name/email come from. Either may be absent.
class ConfigSource {
public:
  virtual ~ConfigSource() = default;
  [[nodiscard]] virtual auto committer_name() const -> std::optional<std::string> = 0;
  [[nodiscard]] virtual auto committer_email() const -> std::optional<std::string> = 0;
};

struct UserConfig final : ConfigSource {
  std::optional<std::string> name;
  std::optional<std::string> email;

  UserConfig() = default;
  UserConfig(std::optional<std::string> n, std::optional<std::string> e)
    : name(std::move(n)), email(std::move(e)) {}

  [[nodiscard]] auto committer_name() const -> std::optional<std::string> override { return name; }
  [[nodiscard]] auto committer_email() const -> std::optional<std::string> override {
    return email;
  }
};

auto config_path(const std::filesystem::path &repo_root) -> std::filesystem::path;

// Read .gitident/config; keys that are missing (or the whole file) stay absent.
auto load_user_config(const std::filesystem::path &repo_root) -> UserConfig;

// Overwrite .gitident/config with the keys present in `cfg`.
// Throws std::invalid_argument if a value contains '\n' or '\r'.
void save_user_config(const std::filesystem::path &repo_root, const UserConfig &cfg);

} // namespace gitident
