#include "line_client.hpp"

#include <algorithm>
#include <system_error>

#include "protocol.hpp"

LineClient::LineClient(std::chrono::milliseconds timeout)
  : socket_(io_), timeout_(timeout) {}

LineClient::~LineClient() {
  close();
}

void LineClient::run_until_done(tcp::resolver* resolver) {
  io_.restart();
  io_.run_for(timeout_);
  if(!io_.stopped()) {
    // deadline hit: cancel the pending operation and let its handler run
    if(resolver) resolver->cancel();
    std::error_code ignored;
    socket_.close(ignored);
    io_.run();
  }
}

void LineClient::connect(const std::string& host, uint16_t port) {
  tcp::resolver resolver(io_);
  tcp::resolver::results_type endpoints;
  std::error_code error = asio::error::would_block;
  resolver.async_resolve(host, std::to_string(port),
    [&](const std::error_code& ec, tcp::resolver::results_type results){
      error = ec;
      endpoints = std::move(results);
    });
  run_until_done(&resolver);
  if(error == asio::error::operation_aborted) error = asio::error::timed_out;
  if(error) throw std::system_error(error, "resolve " + host);

  error = asio::error::would_block;
  asio::async_connect(socket_, endpoints,
    [&](const std::error_code& ec, const tcp::endpoint&){ error = ec; });
  run_until_done();
  if(error == asio::error::operation_aborted) error = asio::error::timed_out;
  if(error) throw std::system_error(error, "connect to " + host + ":" + std::to_string(port));
}

void LineClient::write(const std::string& data) {
  std::error_code error = asio::error::would_block;
  asio::async_write(socket_, asio::buffer(data),
    [&](const std::error_code& ec, std::size_t){ error = ec; });
  run_until_done();
  if(error == asio::error::operation_aborted) error = asio::error::timed_out;
  if(error) throw std::system_error(error, "write");
}

std::string LineClient::read_line() {
  std::error_code error = asio::error::would_block;
  std::size_t length = 0;
  asio::async_read_until(socket_, asio::dynamic_buffer(input_, kMaxFrameLength), '\n',
    [&](const std::error_code& ec, std::size_t n){ error = ec; length = n; });
  run_until_done();
  if(error == asio::error::operation_aborted) error = asio::error::timed_out;
  if(error) throw std::system_error(error, "read line");

  std::string line = strip_line_ending(input_.substr(0, length));
  input_.erase(0, length);
  return line;
}

void LineClient::read_exact(std::size_t length,
                            const std::function<bool(const char*, std::size_t)>& sink) {
  std::size_t remaining = length;
  if(!input_.empty()) {
    std::size_t take = std::min(remaining, input_.size());
    if(!sink(input_.data(), take)) {
      throw std::system_error(std::make_error_code(std::errc::io_error), "store received data");
    }
    input_.erase(0, take);
    remaining -= take;
  }

  char buf[64 * 1024];
  while(remaining > 0) {
    std::error_code error = asio::error::would_block;
    std::size_t received = 0;
    socket_.async_read_some(asio::buffer(buf, std::min(remaining, sizeof(buf))),
      [&](const std::error_code& ec, std::size_t n){ error = ec; received = n; });
    run_until_done();
    if(error == asio::error::operation_aborted) error = asio::error::timed_out;
    if(error) {
      throw std::system_error(error, "connection closed after " +
                              std::to_string(length - remaining) + " of " +
                              std::to_string(length) + " bytes");
    }
    if(!sink(buf, received)) {
      throw std::system_error(std::make_error_code(std::errc::io_error), "store received data");
    }
    remaining -= received;
  }
}

void LineClient::close() {
  std::error_code ignored;
  if(socket_.is_open()) {
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }
}
