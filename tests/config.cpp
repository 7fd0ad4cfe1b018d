#include "gitgate/config.hpp"
#include "gitgate/log.hpp"
#include "support.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static int fail(const std::string &msg) {
  std::cerr << msg << "\n";
  return 1;
}

int main() {
  try {
    gitgate::ServerConfig defaults;
    if (defaults.port != 2222 || defaults.listen != "0.0.0.0" || defaults.data_dir != "data")
      return fail("defaults mismatch");
    if (defaults.repos_dir() != std::filesystem::path("data") / "repos" ||
        defaults.admin_key_file() != std::filesystem::path("data") / "admin.pub")
      return fail("data dir layout mismatch");
    if (defaults.program("git-upload-pack") != "git-upload-pack")
      return fail("program without git-bin-dir should be bare");

    if (gitgate::parse_port("22") != 22 || gitgate::parse_port("0") != 0 ||
        gitgate::parse_port("65536") != 0 || gitgate::parse_port("22x") != 0 ||
        gitgate::parse_port("") != 0)
      return fail("parse_port mismatch");

    gitgate::ServerConfig cfg;
    const auto rejected = gitgate::apply_config_text(cfg, "# gateway\n"
                                                          "port: 2022\n"
                                                          "listen: 127.0.0.1\n"
                                                          "git-bin-dir: /opt/git/bin\n"
                                                          "colour: blue\n");
    if (cfg.port != 2022 || cfg.listen != "127.0.0.1" || cfg.git_bin_dir != "/opt/git/bin")
      return fail("config text not applied");
    if (rejected.size() != 1 || rejected[0] != "colour")
      return fail("unknown key not reported");
    if (cfg.program("git-receive-pack") != "/opt/git/bin/git-receive-pack")
      return fail("git-bin-dir not applied to program");

    const auto bad_port = gitgate::apply_config_text(cfg, "port: http\n");
    if (cfg.port != 2022 || bad_port.size() != 1 || bad_port[0] != "port")
      return fail("invalid port overwrote the previous value");

    // file, then environment
    testsupport::TempDir tmp{"config"};
    {
      std::ofstream os(tmp.path() / "gitgate.conf");
      os << "port: 3000\nlisten: ::1\nbogus: 1\n";
    }
    ::setenv("GITGATE_DATA", tmp.path().c_str(), 1);
    ::unsetenv("GITGATE_PORT");

    std::ostringstream log_text;
    gitgate::Logger log{log_text};
    auto loaded = gitgate::load_config(log);
    if (loaded.data_dir != tmp.path() || loaded.port != 3000 || loaded.listen != "::1")
      return fail("config file not loaded");
    if (log_text.str().find("bogus") == std::string::npos)
      return fail("rejected key not logged: " + log_text.str());

    ::setenv("GITGATE_PORT", "4000", 1);
    loaded = gitgate::load_config(log);
    if (loaded.port != 4000)
      return fail("GITGATE_PORT did not win over the file");

    ::setenv("GITGATE_PORT", "not-a-port", 1);
    loaded = gitgate::load_config(log);
    if (loaded.port != 3000)
      return fail("invalid GITGATE_PORT should keep the file's port");
  } catch (const std::exception &e) {
    return fail(std::string("exception: ") + e.what());
  }
  std::cout << "config test OK\n";
  return 0;
}
