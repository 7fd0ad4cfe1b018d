#pragma once
#include "gitgate/config.hpp"

#include <libssh/libssh.h>

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace gitgate {

class IdentityStore;
class Logger;
class SessionRouter;

// Create an Ed25519 host key at `path` (mode 0600) unless one exists.
// Returns true if a key was generated.
bool ensure_host_key(const std::filesystem::path &path);

/**
 * SSH front end. Every presented public key is accepted at the transport
 * level and resolved to an Identity (possibly Unknown); the SessionRouter
 * makes all authorization decisions. One thread per connection.
 */
class SshServer {
public:
  SshServer(ServerConfig cfg, const IdentityStore &ids, SessionRouter &router, Logger &log);
  SshServer(const SshServer &) = delete;
  SshServer &operator=(const SshServer &) = delete;
  ~SshServer();

  // Listen and serve until `stop` becomes true. Throws if the listening
  // socket cannot be set up. Sessions still running after a short grace
  // period are disconnected; no session thread outlives the call.
  void run(const std::atomic<bool> &stop);

private:
  struct Worker {
    std::thread thread;
    socket_t fd = -1;  // the connection's socket
    bool done = false; // guarded by workers_mu_
  };

  // Handle one accepted session; takes ownership of it.
  void serve_connection(ssh_session session);
  void start_worker(ssh_session session);
  void reap_finished();
  void stop_workers();

  ServerConfig cfg_;
  const IdentityStore &ids_;
  SessionRouter &router_;
  Logger &log_;

  std::mutex workers_mu_;
  std::condition_variable workers_cv_;
  std::list<std::unique_ptr<Worker>> workers_;
};

} // namespace gitgate
