#pragma once
#include "gitgate/consts.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

class Logger;

struct ServerConfig {
  int port = consts::kDefaultPort;
  std::string listen = std::string(consts::kDefaultListen);
  std::filesystem::path data_dir = std::string(consts::kDefaultDataDir);
  std::string git_bin_dir; // empty: resolve programs through PATH

  [[nodiscard]] auto repos_dir() const -> std::filesystem::path { return data_dir / consts::kReposDir; }
  [[nodiscard]] auto users_file() const -> std::filesystem::path { return data_dir / consts::kUsersFile; }
  [[nodiscard]] auto repos_file() const -> std::filesystem::path { return data_dir / consts::kReposFile; }
  [[nodiscard]] auto admin_key_file() const -> std::filesystem::path {
    return data_dir / consts::kAdminKeyFile;
  }
  [[nodiscard]] auto host_key_file() const -> std::filesystem::path {
    return data_dir / consts::kHostKeyFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path { return data_dir / consts::kConfigFile; }

  // Program path for `name`, honouring git_bin_dir.
  [[nodiscard]] auto program(std::string_view name) const -> std::string;
};

// Apply "key: value" lines from `text` onto `cfg`. Unknown keys and
// unparsable values are skipped; their names are returned for reporting.
std::vector<std::string> apply_config_text(ServerConfig &cfg, std::string_view text);

// defaults -> <data>/gitgate.conf -> GITGATE_DATA / GITGATE_PORT
// Rejected config keys are reported through `log`.
ServerConfig load_config(Logger &log);

// Parse a TCP port; returns 0 if `s` is not a number in 1..65535.
int parse_port(std::string_view s);

} // namespace gitgate
