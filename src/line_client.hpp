#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

// One outbound connection with blocking calls that each give up after
// `timeout`. Failures (refused, reset, timeout, premature close) are
// thrown as std::system_error.
class LineClient {
public:
  explicit LineClient(std::chrono::milliseconds timeout);
  ~LineClient();

  LineClient(const LineClient&) = delete;
  LineClient& operator=(const LineClient&) = delete;

  void connect(const std::string& host, uint16_t port);
  void write(const std::string& data);
  std::string read_line();

  // Delivers exactly `length` bytes to `sink`, including anything already
  // buffered behind the last line. `sink` returning false aborts.
  void read_exact(std::size_t length, const std::function<bool(const char*, std::size_t)>& sink);

  void close();

private:
  using tcp = asio::ip::tcp;

  // Runs the private io_context until the pending operation completes or
  // the timeout passes, then cancels it.
  void run_until_done(tcp::resolver* resolver = nullptr);

  asio::io_context io_;
  tcp::socket socket_;
  std::chrono::milliseconds timeout_;
  std::string input_;
};
