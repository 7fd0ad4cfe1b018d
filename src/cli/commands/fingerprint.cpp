#include "gitgate/pubkey.hpp"

#include <filesystem>
#include <iostream>

int cmd_fingerprint(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: gitgate fingerprint <pubkey-file>\n";
    return 2;
  }
  try {
    const auto keys = gitgate::read_authorized_keys(std::filesystem::path(argv[1]));
    if (keys.empty()) {
      std::cerr << "fingerprint: no public keys in " << argv[1] << "\n";
      return 1;
    }
    for (const auto &k : keys) {
      std::cout << k.fingerprint() << " " << k.type();
      if (!k.comment().empty())
        std::cout << " " << k.comment();
      std::cout << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "fingerprint: " << e.what() << "\n";
    return 1;
  }
}
