#include "gitgate/config.hpp"
#include "gitgate/fs.hpp"
#include "gitgate/log.hpp"
#include "gitgate/ssh_server.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  try {
    gitgate::Logger log{std::cerr};
    gitgate::ServerConfig cfg = gitgate::load_config(log);
    if (argc >= 2)
      cfg.data_dir = argv[1];

    std::filesystem::create_directories(cfg.repos_dir());
    if (!gitgate::fs::exists(cfg.users_file()))
      gitgate::fs::write_text_atomic(cfg.users_file(), "");
    if (!gitgate::fs::exists(cfg.repos_file()))
      gitgate::fs::write_text_atomic(cfg.repos_file(), "");
    if (gitgate::ensure_host_key(cfg.host_key_file()))
      std::cout << "Generated host key " << cfg.host_key_file() << "\n";

    std::cout << "Initialized gitgate data directory in " << cfg.data_dir << "\n";
    if (!gitgate::fs::exists(cfg.admin_key_file()))
      std::cout << "Place the administrator's public key in " << cfg.admin_key_file() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
