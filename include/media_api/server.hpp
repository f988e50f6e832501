#pragma once
#include <crow.h>

#include <atomic>
#include <future>
#include <string>

namespace media_api {

// Crow application bound to one host:port, served from a background thread.
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server();

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Returns once the listener is up. Rethrows if it dies during startup (e.g. port in use).
  void start();

  // Stops accepting requests and joins the server thread.
  void stop();

  bool is_running() const {
    return running_.load();
  }

  std::string endpoint() const {
    return host_ + ":" + std::to_string(port_);
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  std::atomic<bool> running_{false};
};

}  // namespace media_api
