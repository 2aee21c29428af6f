#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "index_service.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Control-plane TCP front end. Every accepted connection becomes its own
// session on a strand, so sessions run in parallel on the worker pool.
class IndexServer {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = kDefaultServerPort;   // 0 picks an ephemeral port
    std::size_t io_threads = 4;
    std::chrono::milliseconds idle_timeout{30000};
  };

  IndexServer(IndexService& service, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~IndexServer();

  IndexServer(const IndexServer&) = delete;
  IndexServer& operator=(const IndexServer&) = delete;

  // Binds and starts accepting; throws std::system_error if the port is taken.
  void start();
  // Runs the session pool on io_threads worker threads.
  void start_background();
  // Must not be called from a worker thread.
  void stop();

  uint16_t listen_port() const { return listen_port_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  IndexService& service_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::vector<std::thread> workers_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;
};
