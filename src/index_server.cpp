#include "index_server.hpp"

#include <istream>

namespace {

using tcp = asio::ip::tcp;

class ControlSession : public std::enable_shared_from_this<ControlSession> {
public:
  ControlSession(tcp::socket socket,
                 IndexService& service,
                 std::chrono::milliseconds idle_timeout,
                 std::shared_ptr<Logger> logger)
    : socket_(std::move(socket)),
      idle_timer_(socket_.get_executor()),
      read_buf_(kMaxFrameLength),
      service_(service),
      idle_timeout_(idle_timeout),
      logger_(std::move(logger)) {}

  void start() {
    std::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    origin_ = ec ? std::string("unknown") :
      remote.address().to_string() + ":" + std::to_string(remote.port());
    log_debug(logger_.get(), "Control connection from {}", origin_);
    do_read();
  }

private:
  void arm_idle_timer() {
    auto self = shared_from_this();
    idle_timer_.expires_after(idle_timeout_);
    idle_timer_.async_wait([this, self](const std::error_code& ec){
      if(ec) return;
      log_info(logger_.get(), "Closing idle control connection {}", origin_);
      close();
    });
  }

  void do_read() {
    arm_idle_timer();
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n',
      [this, self](std::error_code ec, std::size_t){
        if(ec == asio::error::not_found) {
          reject_long_line();
          return;
        }
        if(ec) {
          if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
            log_debug(logger_.get(), "[{}] read error: {}", origin_, ec.message());
          }
          close();
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        line = strip_line_ending(std::move(line));
        if(line.size() > kMaxLineLength) {
          reject_long_line();
          return;
        }
        write_reply(service_.handle_line(line, origin_), false);
      });
  }

  void reject_long_line() {
    log_warn(logger_.get(), "[{}] request line exceeds {} bytes", origin_, kMaxLineLength);
    write_reply(format_error(ReplyCode::BadRequest, "line too long"), true);
  }

  void write_reply(std::string reply, bool close_after) {
    reply_ = std::move(reply);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(reply_),
      [this, self, close_after](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(logger_.get(), "[{}] write error: {}", origin_, ec.message());
          close();
          return;
        }
        if(close_after) {
          close();
        } else {
          do_read();
        }
      });
  }

  void close() {
    std::error_code ignored;
    idle_timer_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  tcp::socket socket_;
  asio::steady_timer idle_timer_;
  asio::streambuf read_buf_;
  std::string reply_;
  std::string origin_;
  IndexService& service_;
  std::chrono::milliseconds idle_timeout_;
  std::shared_ptr<Logger> logger_;
};

} // namespace

IndexServer::IndexServer(IndexService& service, Options options, std::shared_ptr<Logger> logger)
  : service_(service),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("index-server")) {
  if(options_.io_threads == 0) options_.io_threads = 1;
}

IndexServer::~IndexServer() {
  stop();
}

void IndexServer::start() {
  if(started_.exchange(true)) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    started_ = false;
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw;
  }

  io_.restart();
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();

  logger_->info("Index server listening on {}:{} (tokens: {})",
                options_.listen_ip, listen_port_, join_tokens(service_.accepted_tokens()));
  start_accept();
}

void IndexServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("Accept error: {}", ec.message());
      } else {
        std::make_shared<ControlSession>(std::move(socket),
                                         service_,
                                         options_.idle_timeout,
                                         logger_)->start();
      }
      if(started_) {
        start_accept();
      }
    });
}

void IndexServer::start_background() {
  if(!started_) start();
  if(!workers_.empty()) return;
  for(std::size_t i = 0; i < options_.io_threads; ++i) {
    workers_.emplace_back([this](){ io_.run(); });
  }
}

void IndexServer::stop() {
  if(!started_.exchange(false)) return;
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  io_.stop();
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
  workers_.clear();
  acceptor_.reset();
  logger_->info("Index server stopped");
}
