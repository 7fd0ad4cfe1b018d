#include "gitgate/config.hpp"
#include "gitgate/console.hpp"
#include "gitgate/consts.hpp"
#include "gitgate/fs.hpp"
#include "gitgate/identity.hpp"
#include "gitgate/log.hpp"
#include "gitgate/pubkey.hpp"
#include "gitgate/repo.hpp"
#include "gitgate/session.hpp"
#include "gitgate/ssh_server.hpp"

#include <libssh/libssh.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_stop_signal(int /*sig*/) { g_stop.store(true); }

void load_admin_key(const gitgate::ServerConfig &cfg, gitgate::IdentityStore &ids,
                    gitgate::Logger &log) {
  const auto path = cfg.admin_key_file();
  if (!gitgate::fs::exists(path)) {
    log.warn("no admin key at " + path.string() + "; administration console unavailable");
    return;
  }
  try {
    const auto keys = gitgate::read_authorized_keys(path);
    if (keys.empty()) {
      log.warn("no usable key in " + path.string() + "; administration console unavailable");
      return;
    }
    ids.set_admin_key(keys.front());
    log.info("admin key " + keys.front().fingerprint());
  } catch (const std::exception &e) {
    log.warn(std::string("reading admin key: ") + e.what());
  }
}

void save_tables(const gitgate::ServerConfig &cfg, const gitgate::IdentityStore &ids,
                 const gitgate::RepoTable &repos, gitgate::Logger &log) {
  try {
    ids.save_to_file(cfg.users_file());
  } catch (const std::exception &e) {
    log.warn(e.what());
  }
  try {
    repos.save_to_file(cfg.repos_file());
  } catch (const std::exception &e) {
    log.warn(e.what());
  }
}

} // namespace

int cmd_serve(int argc, char **argv) {
  gitgate::Logger log{std::cerr};
  try {
    gitgate::ServerConfig cfg = gitgate::load_config(log);
    if (argc >= 2) {
      const int port = gitgate::parse_port(argv[1]);
      if (port == 0) {
        std::cerr << "serve: invalid port " << argv[1] << "\n";
        return 2;
      }
      cfg.port = port;
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    std::filesystem::create_directories(cfg.repos_dir());
    if (gitgate::ensure_host_key(cfg.host_key_file()))
      log.info("generated host key " + cfg.host_key_file().string());

    gitgate::IdentityStore ids;
    load_admin_key(cfg, ids, log);
    try {
      ids.load_from_file(cfg.users_file());
    } catch (const std::exception &e) {
      log.warn(e.what());
    }

    gitgate::RepoTable repos{cfg.repos_dir(),
                             gitgate::make_git_initializer(cfg.program(gitgate::consts::kGitProgram))};
    try {
      repos.load_from_file(cfg.repos_file());
    } catch (const std::exception &e) {
      log.warn(e.what());
    }

    gitgate::ProcessGitExecutor git{cfg.git_bin_dir};
    gitgate::AdminConsole console{ids, repos, cfg.users_file(), cfg.repos_file(), log};
    gitgate::SessionRouter router{repos, console, git, log};

    if (ssh_init() != SSH_OK) {
      std::cerr << "serve: libssh initialization failed\n";
      return 1;
    }
    log.info("gitgate serving " + cfg.data_dir.string() + " (Ctrl+C to stop)");
    {
      gitgate::SshServer server{cfg, ids, router, log};
      server.run(g_stop);
    }
    log.info("shutting down");
    save_tables(cfg, ids, repos, log);
    if (ssh_finalize() != SSH_OK)
      log.debug("ssh_finalize failed");
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "serve: " << e.what() << "\n";
    return 1;
  }
}
