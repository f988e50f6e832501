#include "media_api/server.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace media_api {

namespace {
constexpr auto kStartupGrace = std::chrono::milliseconds(250);
constexpr const char *kServerName = "media-vault";
}  // namespace

Server::Server(const std::string &host, int port) : host_(host), port_(port) {
  // Shutdown is driven by the process's own signal handlers
  app_.signal_clear();
  app_.server_name(kServerName);
  app_.loglevel(crow::LogLevel::Warning);
}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_.exchange(true)) {
    return;
  }
  std::cout << "[API] Listening on " << endpoint() << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<std::uint16_t>(port_)).bindaddr(host_).multithreaded().run();
  });

  if (server_thread_future_.wait_for(kStartupGrace) == std::future_status::ready) {
    running_ = false;
    server_thread_future_.get();
    throw std::runtime_error("API server on " + endpoint() + " exited during startup");
  }
}

void Server::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  app_.stop();
  if (server_thread_future_.valid()) {
    try {
      server_thread_future_.get();
    } catch (const std::exception &e) {
      std::cerr << "[API] Server thread ended with error: " << e.what() << std::endl;
    }
  }
}

}  // namespace media_api
