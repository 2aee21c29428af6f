#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

#include "local_store.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Serves GET requests from other peers straight out of the local store.
// One request per connection: reply, then close.
class TransferListener {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;                 // 0 picks an ephemeral port
    std::chrono::milliseconds idle_timeout{30000};
  };

  // Status line plus the document bytes (empty on failure).
  struct Reply {
    std::string header;
    std::shared_ptr<const std::string> body;
  };

  TransferListener(asio::io_context& io,
                   LocalStore& store,
                   std::set<std::string> accepted_tokens,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);
  ~TransferListener();

  TransferListener(const TransferListener&) = delete;
  TransferListener& operator=(const TransferListener&) = delete;

  void start();
  void stop();

  uint16_t listen_port() const { return listen_port_; }

  Reply build_reply(const std::string& line, const std::string& origin = "") const;

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  asio::io_context& io_;
  LocalStore& store_;
  const std::set<std::string> accepted_tokens_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;
};
