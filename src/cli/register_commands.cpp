#include "cli/registry.hpp"

int cmd_serve(int argc, char **argv);
int cmd_init(int argc, char **argv);
int cmd_fingerprint(int argc, char **argv);

namespace gitgate::cli {

void register_all_commands() {
  register_command("serve", ::cmd_serve,
                   "Run the SSH gateway: gitgate serve [port] (data dir from GITGATE_DATA)");
  register_command("init", ::cmd_init, "Create the data directory and host key: gitgate init [dir]");
  register_command("fingerprint", ::cmd_fingerprint,
                   "Print SHA256 fingerprints of public keys: gitgate fingerprint <file>");
}

} // namespace gitgate::cli
