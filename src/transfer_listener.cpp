#include "transfer_listener.hpp"

#include <array>
#include <istream>

#include "utils.hpp"

namespace {

using tcp = asio::ip::tcp;

class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
  TransferSession(tcp::socket socket,
                  const TransferListener& listener,
                  std::chrono::milliseconds idle_timeout,
                  std::shared_ptr<Logger> logger)
    : socket_(std::move(socket)),
      deadline_(socket_.get_executor()),
      read_buf_(kMaxFrameLength),
      listener_(listener),
      idle_timeout_(idle_timeout),
      logger_(std::move(logger)) {}

  void start() {
    std::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    origin_ = ec ? std::string("unknown") :
      remote.address().to_string() + ":" + std::to_string(remote.port());

    auto self = shared_from_this();
    deadline_.expires_after(idle_timeout_);
    deadline_.async_wait([this, self](const std::error_code& wait_ec){
      if(wait_ec) return;
      log_info(logger_.get(), "Transfer connection {} timed out", origin_);
      close();
    });

    asio::async_read_until(socket_, read_buf_, '\n',
      [this, self](std::error_code read_ec, std::size_t){
        if(read_ec == asio::error::not_found) {
          reply_.header = format_error(ReplyCode::BadRequest, "line too long");
          send_reply();
          return;
        }
        if(read_ec) {
          if(read_ec != asio::error::eof && read_ec != asio::error::operation_aborted) {
            log_debug(logger_.get(), "[{}] read error: {}", origin_, read_ec.message());
          }
          close();
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        line = strip_line_ending(std::move(line));
        if(line.size() > kMaxLineLength) {
          reply_.header = format_error(ReplyCode::BadRequest, "line too long");
          send_reply();
          return;
        }
        reply_ = listener_.build_reply(line, origin_);
        send_reply();
      });
  }

private:
  void send_reply() {
    // the deadline also bounds a slow receiver
    deadline_.expires_after(idle_timeout_);
    auto self = shared_from_this();
    deadline_.async_wait([this, self](const std::error_code& ec){
      if(ec) return;
      log_info(logger_.get(), "Transfer to {} timed out", origin_);
      close();
    });

    std::array<asio::const_buffer, 2> buffers = {
      asio::buffer(reply_.header),
      reply_.body ? asio::buffer(*reply_.body) : asio::const_buffer()
    };
    asio::async_write(socket_, buffers,
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          log_warn(logger_.get(), "Transfer to {} failed: {}", origin_, ec.message());
        }
        close();
      });
  }

  void close() {
    std::error_code ignored;
    deadline_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  tcp::socket socket_;
  asio::steady_timer deadline_;
  asio::streambuf read_buf_;
  const TransferListener& listener_;
  std::chrono::milliseconds idle_timeout_;
  std::shared_ptr<Logger> logger_;
  std::string origin_;
  TransferListener::Reply reply_;
};

} // namespace

TransferListener::TransferListener(asio::io_context& io,
                                   LocalStore& store,
                                   std::set<std::string> accepted_tokens,
                                   Options options,
                                   std::shared_ptr<Logger> logger)
  : io_(io),
    store_(store),
    accepted_tokens_(std::move(accepted_tokens)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")) {}

TransferListener::~TransferListener() {
  stop();
}

TransferListener::Reply TransferListener::build_reply(const std::string& line,
                                                      const std::string& origin) const {
  Reply reply;
  std::string error;
  auto request = parse_get_request(line, error);
  if(!request) {
    logger_->warn("[{}] rejected transfer request: {}", origin, error);
    reply.header = format_error(ReplyCode::BadRequest, error);
    return reply;
  }
  if(accepted_tokens_.count(request->token) == 0) {
    logger_->warn("[{}] GET {} with unsupported token '{}'", origin, request->id, request->token);
    reply.header = format_error(ReplyCode::UnsupportedToken, request->token);
    return reply;
  }

  auto content = request->id > 0 ? store_.read(request->id) : std::nullopt;
  if(!content) {
    if(request->id > 0 && store_.contains(request->id)) {
      logger_->warn("[{}] GET {}: {} is unreadable", origin, request->id, store_.path_for(request->id).string());
      reply.header = format_error(ReplyCode::Unavailable, "unreadable");
      return reply;
    }
    logger_->info("[{}] GET {}: not held locally", origin, request->id);
    reply.header = format_error(ReplyCode::NotFound);
    return reply;
  }

  logger_->info("[{}] GET {}: sending {} bytes", origin, request->id, content->size());
  logger_->debug("GET {} sha256={}", request->id, sha256_hex(*content));
  reply.header = format_ok(content->size());
  reply.body = std::make_shared<const std::string>(std::move(*content));
  return reply;
}

void TransferListener::start() {
  if(started_.exchange(true)) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    started_ = false;
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();
  logger_->info("Transfer listener on {}:{} serving {}",
                options_.listen_ip, listen_port_, store_.root().string());
  start_accept();
}

void TransferListener::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("Accept error: {}", ec.message());
      } else {
        std::make_shared<TransferSession>(std::move(socket), *this,
                                          options_.idle_timeout, logger_)->start();
      }
      if(started_) {
        start_accept();
      }
    });
}

void TransferListener::stop() {
  if(!started_.exchange(false)) return;
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
}
