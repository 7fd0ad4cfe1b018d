#include "gitgate/ssh_server.hpp"

#include "gitgate/fs.hpp"
#include "gitgate/hash.hpp"
#include "gitgate/identity.hpp"
#include "gitgate/log.hpp"
#include "gitgate/pubkey.hpp"
#include "gitgate/session.hpp"
#include "gitgate/session_io.hpp"

#include <libssh/callbacks.h>
#include <libssh/server.h>

#include <cerrno>
#include <chrono>
#include <memory>
#include <poll.h>
#include <sys/socket.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace stdfs = std::filesystem;

namespace gitgate {

namespace {

constexpr int kAcceptPollMs = 500;
constexpr int kEventPollMs = 100;
constexpr auto kRequestTimeout = std::chrono::seconds(60);
constexpr auto kShutdownGrace = std::chrono::seconds(5);

// SessionIo over one libssh channel in blocking mode.
class ChannelIo : public SessionIo {
public:
  ChannelIo(ssh_session session, ssh_channel channel) : session_(session), channel_(channel) {}

  auto read(std::span<std::uint8_t> buf, int timeout_ms) -> long override {
    const int n = ssh_channel_read_timeout(channel_, buf.data(), static_cast<uint32_t>(buf.size()),
                                           0, timeout_ms);
    if (n < 0)
      return kEof;
    if (n == 0)
      return ssh_channel_is_eof(channel_) != 0 || ssh_channel_is_closed(channel_) != 0 ? kEof : 0;
    return n;
  }

  auto wait_fd() const -> int override { return ssh_get_fd(session_); }

  void write(std::span<const std::uint8_t> data) override { send(data, false); }
  void write_stderr(std::span<const std::uint8_t> data) override { send(data, true); }

private:
  void send(std::span<const std::uint8_t> data, bool to_stderr) {
    while (!data.empty()) {
      const auto len = static_cast<uint32_t>(data.size());
      const int w = to_stderr ? ssh_channel_write_stderr(channel_, data.data(), len)
                              : ssh_channel_write(channel_, data.data(), len);
      if (w < 0) {
        throw std::runtime_error(std::string("channel write failed: ") + ssh_get_error(session_));
      }
      data = data.subspan(static_cast<std::size_t>(w));
    }
  }

  ssh_session session_;
  ssh_channel channel_;
};

// Per-connection state handed to the libssh callbacks as userdata.
struct Connection {
  Connection(const IdentityStore &store, Logger &logger, ssh_session s)
      : ids(store), log(logger), session(s) {}
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  ~Connection() {
    if (channel != nullptr)
      ssh_channel_free(channel);
    ssh_disconnect(session);
    ssh_free(session);
  }

  [[nodiscard]] auto ready() const -> bool {
    return authenticated && channel != nullptr && request_received;
  }

  const IdentityStore &ids;
  Logger &log;
  ssh_session session;
  ssh_channel channel = nullptr;

  Identity identity;
  bool authenticated = false;
  bool request_received = false;
  std::string command; // empty for a shell request

  ssh_server_callbacks_struct server_cb{};
  ssh_channel_callbacks_struct channel_cb{};
};

// Removes the session from the event and frees it on scope exit.
class EventScope {
public:
  explicit EventScope(ssh_session session) : session_(session), event_(ssh_event_new()) {
    if (event_ == nullptr || ssh_event_add_session(event_, session_) != SSH_OK) {
      if (event_ != nullptr)
        ssh_event_free(event_);
      throw std::runtime_error("ssh_event setup failed");
    }
  }
  EventScope(const EventScope &) = delete;
  EventScope &operator=(const EventScope &) = delete;
  ~EventScope() {
    ssh_event_remove_session(event_, session_);
    ssh_event_free(event_);
  }

  [[nodiscard]] auto get() const -> ssh_event { return event_; }

private:
  ssh_session session_;
  ssh_event event_;
};

[[nodiscard]] auto resolve_identity(const IdentityStore &ids, ssh_key key) -> Identity {
  char *b64 = nullptr;
  if (ssh_pki_export_pubkey_base64(key, &b64) != SSH_OK || b64 == nullptr) {
    return Identity{};
  }
  const auto blob = base64_decode(b64);
  ssh_string_free_char(b64);
  if (!blob) {
    return Identity{};
  }
  const auto pk = PublicKey::from_blob(*blob);
  if (!pk) {
    return Identity{};
  }
  return ids.authenticate(*pk);
}

int on_auth_pubkey(ssh_session /*session*/, const char * /*user*/, struct ssh_key_struct *pubkey,
                   char signature_state, void *userdata) {
  auto *conn = static_cast<Connection *>(userdata);
  // Every key is acceptable; who it belongs to is decided after the fact.
  if (signature_state == SSH_PUBLICKEY_STATE_NONE)
    return SSH_AUTH_SUCCESS;
  if (signature_state != SSH_PUBLICKEY_STATE_VALID)
    return SSH_AUTH_DENIED;

  conn->identity = resolve_identity(conn->ids, pubkey);
  conn->authenticated = true;
  switch (conn->identity.kind) {
  case IdentityClass::Admin:
    conn->log.info("authenticated admin");
    break;
  case IdentityClass::Normal:
    conn->log.info("authenticated user " + conn->identity.name);
    break;
  case IdentityClass::Unknown:
    conn->log.info("authenticated unknown key");
    break;
  }
  return SSH_AUTH_SUCCESS;
}

int on_pty_request(ssh_session /*session*/, ssh_channel /*channel*/, const char * /*term*/,
                   int /*width*/, int /*height*/, int /*pxwidth*/, int /*pxheight*/,
                   void *userdata) {
  const auto *conn = static_cast<Connection *>(userdata);
  return SessionRouter::allow_pty(conn->identity) ? 0 : -1;
}

int on_shell_request(ssh_session /*session*/, ssh_channel /*channel*/, void *userdata) {
  auto *conn = static_cast<Connection *>(userdata);
  if (conn->request_received)
    return -1;
  conn->command.clear();
  conn->request_received = true;
  return 0;
}

int on_exec_request(ssh_session /*session*/, ssh_channel /*channel*/, const char *command,
                    void *userdata) {
  auto *conn = static_cast<Connection *>(userdata);
  if (conn->request_received)
    return -1;
  conn->command = command != nullptr ? command : "";
  conn->request_received = true;
  return 0;
}

// Environment requests (e.g. GIT_PROTOCOL) are acknowledged and ignored.
int on_env_request(ssh_session /*session*/, ssh_channel /*channel*/, const char * /*name*/,
                   const char * /*value*/, void * /*userdata*/) {
  return 0;
}

ssh_channel on_channel_open(ssh_session session, void *userdata) {
  auto *conn = static_cast<Connection *>(userdata);
  if (conn->channel != nullptr)
    return nullptr; // one session channel per connection

  conn->channel = ssh_channel_new(session);
  if (conn->channel == nullptr)
    return nullptr;

  conn->channel_cb.userdata = conn;
  conn->channel_cb.channel_pty_request_function = on_pty_request;
  conn->channel_cb.channel_shell_request_function = on_shell_request;
  conn->channel_cb.channel_exec_request_function = on_exec_request;
  conn->channel_cb.channel_env_request_function = on_env_request;
  ssh_callbacks_init(&conn->channel_cb);
  ssh_set_channel_callbacks(conn->channel, &conn->channel_cb);
  return conn->channel;
}

} // namespace

bool ensure_host_key(const stdfs::path &path) {
  if (fs::exists(path))
    return false;
  fs::ensure_parent_dir(path);

  ssh_key key = nullptr;
  if (ssh_pki_generate(SSH_KEYTYPE_ED25519, 0, &key) != SSH_OK || key == nullptr) {
    throw std::runtime_error("host key generation failed");
  }
  const int rc = ssh_pki_export_privkey_file(key, nullptr, nullptr, nullptr, path.c_str());
  ssh_key_free(key);
  if (rc != SSH_OK) {
    throw std::runtime_error("writing host key " + path.string() + " failed");
  }
  stdfs::permissions(path, stdfs::perms::owner_read | stdfs::perms::owner_write,
                     stdfs::perm_options::replace);
  return true;
}

SshServer::SshServer(ServerConfig cfg, const IdentityStore &ids, SessionRouter &router, Logger &log)
    : cfg_(std::move(cfg)), ids_(ids), router_(router), log_(log) {}

void SshServer::run(const std::atomic<bool> &stop) {
  std::unique_ptr<ssh_bind_struct, decltype(&ssh_bind_free)> bind{ssh_bind_new(), &ssh_bind_free};
  if (!bind) {
    throw std::runtime_error("ssh_bind_new failed");
  }
  const std::string host_key = cfg_.host_key_file().string();
  unsigned int port = static_cast<unsigned int>(cfg_.port);
  if (ssh_bind_options_set(bind.get(), SSH_BIND_OPTIONS_BINDADDR, cfg_.listen.c_str()) != SSH_OK ||
      ssh_bind_options_set(bind.get(), SSH_BIND_OPTIONS_BINDPORT, &port) != SSH_OK ||
      ssh_bind_options_set(bind.get(), SSH_BIND_OPTIONS_HOSTKEY, host_key.c_str()) != SSH_OK) {
    throw std::runtime_error(std::string("ssh bind options: ") + ssh_get_error(bind.get()));
  }
  if (ssh_bind_listen(bind.get()) != SSH_OK) {
    throw std::runtime_error("listen on " + cfg_.listen + ":" + std::to_string(cfg_.port) + ": " +
                             ssh_get_error(bind.get()));
  }
  log_.info("listening on " + cfg_.listen + ":" + std::to_string(cfg_.port));

  const socket_t listen_fd = ssh_bind_get_fd(bind.get());
  try {
    while (!stop.load()) {
      reap_finished();
      pollfd pfd{.fd = listen_fd, .events = POLLIN, .revents = 0};
      const int rc = ::poll(&pfd, 1, kAcceptPollMs);
      if (rc == -1) {
        if (errno == EINTR)
          continue;
        throw std::system_error(errno, std::generic_category(), "poll");
      }
      if (rc == 0)
        continue;

      ssh_session session = ssh_new();
      if (session == nullptr) {
        log_.error("ssh_new failed");
        continue;
      }
      if (ssh_bind_accept(bind.get(), session) != SSH_OK) {
        log_.warn(std::string("accept failed: ") + ssh_get_error(bind.get()));
        ssh_free(session);
        continue;
      }
      start_worker(session);
    }
  } catch (const std::exception &) {
    stop_workers();
    throw;
  }
  stop_workers();
}

SshServer::~SshServer() { stop_workers(); }

void SshServer::start_worker(ssh_session session) {
  auto worker = std::make_unique<Worker>();
  Worker *w = worker.get();
  w->fd = ssh_get_fd(session);
  try {
    w->thread = std::thread([this, w, session] {
      try {
        serve_connection(session);
      } catch (const std::exception &e) {
        log_.error(std::string("connection: ") + e.what());
      }
      {
        std::lock_guard lock(workers_mu_);
        w->done = true;
      }
      workers_cv_.notify_all();
    });
  } catch (const std::system_error &e) {
    log_.error(std::string("cannot start session thread: ") + e.what());
    ssh_free(session);
    return;
  }
  std::lock_guard lock(workers_mu_);
  workers_.push_back(std::move(worker));
}

void SshServer::reap_finished() {
  std::list<std::unique_ptr<Worker>> finished;
  {
    std::lock_guard lock(workers_mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if ((*it)->done) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &w : finished)
    w->thread.join();
}

void SshServer::stop_workers() {
  std::unique_lock lock(workers_mu_);
  const auto all_done = [this] {
    for (const auto &w : workers_) {
      if (!w->done)
        return false;
    }
    return true;
  };
  if (!workers_cv_.wait_for(lock, kShutdownGrace, all_done)) {
    int running = 0;
    for (const auto &w : workers_) {
      if (!w->done) {
        // wakes the session thread out of any blocking channel read
        ::shutdown(w->fd, SHUT_RDWR);
        ++running;
      }
    }
    log_.warn("disconnecting " + std::to_string(running) + " session(s) still running at shutdown");
  }
  std::list<std::unique_ptr<Worker>> all = std::move(workers_);
  workers_.clear();
  lock.unlock();
  for (auto &w : all)
    w->thread.join();
}

void SshServer::serve_connection(ssh_session session) {
  Connection conn{ids_, log_, session};

  conn.server_cb.userdata = &conn;
  conn.server_cb.auth_pubkey_function = on_auth_pubkey;
  conn.server_cb.channel_open_request_session_function = on_channel_open;
  ssh_callbacks_init(&conn.server_cb);
  if (ssh_set_server_callbacks(session, &conn.server_cb) != SSH_OK) {
    throw std::runtime_error("ssh_set_server_callbacks failed");
  }

  if (ssh_handle_key_exchange(session) != SSH_OK) {
    log_.info(std::string("key exchange failed: ") + ssh_get_error(session));
    return;
  }
  ssh_set_auth_methods(session, SSH_AUTH_METHOD_PUBLICKEY);

  {
    EventScope event{session};
    const auto deadline = std::chrono::steady_clock::now() + kRequestTimeout;
    while (!conn.ready()) {
      if (ssh_event_dopoll(event.get(), kEventPollMs) == SSH_ERROR) {
        log_.debug(std::string("connection closed before request: ") + ssh_get_error(session));
        return;
      }
      if (std::chrono::steady_clock::now() > deadline) {
        log_.info("no session request within timeout, disconnecting");
        return;
      }
    }
  }

  ChannelIo io{session, conn.channel};
  const int status = router_.route(conn.identity, conn.command, io);

  if (ssh_channel_request_send_exit_status(conn.channel, status) != SSH_OK ||
      ssh_channel_send_eof(conn.channel) != SSH_OK) {
    log_.debug(std::string("could not report exit status: ") + ssh_get_error(session));
  }
  if (ssh_channel_close(conn.channel) != SSH_OK) {
    log_.debug(std::string("channel close: ") + ssh_get_error(session));
  }
}

} // namespace gitgate
