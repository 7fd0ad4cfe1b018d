#include "gitgate/config.hpp"

#include "gitgate/fs.hpp"
#include "gitgate/log.hpp"
#include "gitgate/util.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string_view>

namespace gitgate {

auto ServerConfig::program(std::string_view name) const -> std::string {
  if (git_bin_dir.empty())
    return std::string(name);
  return (std::filesystem::path(git_bin_dir) / name).string();
}

int parse_port(std::string_view s) {
  int v = 0;
  const auto *end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc{} || ptr != end || v <= 0 || v > 65535)
    return 0;
  return v;
}

std::vector<std::string> apply_config_text(ServerConfig &cfg, std::string_view text) {
  constexpr std::string_view k_port = "port:";
  constexpr std::string_view k_listen = "listen:";
  constexpr std::string_view k_git_bin = "git-bin-dir:";

  std::vector<std::string> rejected;
  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    const std::string trimmed = strutil::trim(line);
    std::string_view sv{trimmed};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_port)) {
      const int port = parse_port(strutil::trim(sv.substr(k_port.size())));
      if (port != 0)
        cfg.port = port;
      else
        rejected.emplace_back("port");
    } else if (sv.starts_with(k_listen)) {
      cfg.listen = strutil::trim(sv.substr(k_listen.size()));
    } else if (sv.starts_with(k_git_bin)) {
      cfg.git_bin_dir = strutil::trim(sv.substr(k_git_bin.size()));
    } else {
      rejected.emplace_back(sv.substr(0, sv.find(':')));
    }
  }
  return rejected;
}

ServerConfig load_config(Logger &log) {
  ServerConfig cfg;
  if (const char *data = std::getenv(consts::kEnvData); data != nullptr && *data != '\0')
    cfg.data_dir = data;

  if (fs::exists(cfg.config_file())) {
    for (const auto &key : apply_config_text(cfg, fs::read_text(cfg.config_file())))
      log.warn("config: ignoring bad entry '" + key + "' in " + cfg.config_file().string());
  }

  if (const char *port = std::getenv(consts::kEnvPort); port != nullptr) {
    if (const int p = parse_port(port); p != 0)
      cfg.port = p;
  }
  return cfg;
}

} // namespace gitgate
