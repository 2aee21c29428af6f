#include "peer_node.hpp"

#include <filesystem>
#include <stdexcept>

#include "PeerCLI.hpp"
#include "local_store.hpp"
#include "peer_agent.hpp"
#include "settings_manager.hpp"
#include "transfer_listener.hpp"
#include "utils.hpp"

PeerNode::PeerNode(std::shared_ptr<SettingsManager> settings)
  : settings_(settings ? std::move(settings)
                       : std::make_shared<SettingsManager>(PEER_SETTINGS_SPECIFICATION)),
    logger_(std::make_shared<Logger>("peer")) {}

PeerNode::~PeerNode() {
  stop();
}

int PeerNode::int_setting(const std::string& key, int min, int max) const {
  int value = 0;
  std::string error;
  if(!settings_->get_int_in_range(key, min, max, value, error)) {
    logger_->error("{}", error);
    throw std::runtime_error(error);
  }
  return value;
}

void PeerNode::start() {
  if(started_) return;

  init_logging(settings_->get<bool>("verbose"));

  peer_name_ = settings_->get<std::string>("peer_name");
  if(peer_name_.empty()) {
    peer_name_ = default_peer_name();
  }
  logger_->set_name(peer_name_);

  int server_port = int_setting("server_port", 1, 65535);
  int listen_port = int_setting("listen_port", 0, 65535);
  io_threads_ = static_cast<std::size_t>(int_setting("io_threads", 1, 64));
  int timeout_ms = int_setting("timeout_ms", 1, 24 * 60 * 60 * 1000);

  auto tokens = parse_token_list(settings_->get<std::string>("tokens"));
  if(tokens.empty()) {
    logger_->error("No protocol tokens configured");
    throw std::runtime_error("tokens must name at least one protocol token");
  }
  protocol_token_ = settings_->get<std::string>("protocol_token");
  auto_register_ = settings_->get<bool>("auto_register");

  std::filesystem::path rfc_dir = settings_->get<std::string>("rfc_dir");
  if(rfc_dir.empty()) {
    rfc_dir = peer_name_ + "_rfcs";
  }
  store_ = std::make_unique<LocalStore>(rfc_dir);
  std::string store_error;
  if(!store_->ensure_root(store_error)) {
    logger_->error("{}", store_error);
    throw std::runtime_error(store_error);
  }

  TransferListener::Options listener_options;
  listener_options.listen_ip = settings_->get<std::string>("listen_ip");
  listener_options.listen_port = static_cast<uint16_t>(listen_port);
  listener_options.idle_timeout = std::chrono::milliseconds(timeout_ms);
  listener_ = std::make_unique<TransferListener>(io_, *store_, tokens, listener_options, logger_);
  listener_->start();
  listen_port_ = listener_->listen_port();

  self_address_.host = settings_->get<std::string>("advertise_host");
  self_address_.port = listen_port_;
  if(!self_address_.valid()) {
    logger_->error("Cannot advertise '{}'", self_address_.to_string());
    throw std::runtime_error("invalid advertise_host");
  }

  PeerAgent::Options agent_options;
  agent_options.server_host = settings_->get<std::string>("server_host");
  agent_options.server_port = static_cast<uint16_t>(server_port);
  agent_options.self = self_address_;
  agent_options.timeout = std::chrono::milliseconds(timeout_ms);
  agent_ = std::make_unique<PeerAgent>(agent_options, *store_, logger_);

  PeerCLI::Options cli_options;
  cli_options.auto_register = auto_register_;
  cli_ = std::make_unique<PeerCLI>(*agent_, *store_, logger_, cli_options);

  started_ = true;
  logger_->info("Peer {} advertising {} (index server {}:{})",
                peer_name_, self_address_.to_string(), agent_options.server_host, server_port);
}

void PeerNode::start_background() {
  if(!started_) start();
  if(!workers_.empty()) return;
  for(std::size_t i = 0; i < io_threads_; ++i) {
    workers_.emplace_back([this](){ io_.run(); });
  }
}

std::size_t PeerNode::register_local_documents() {
  if(!started_ || !auto_register_) return 0;
  auto count = agent_->register_local_documents(protocol_token_);
  logger_->info("Registered {} local RFC(s) from {}", count, store_->root().string());
  return count;
}

void PeerNode::run_cli() {
  if(!started_) start();
  cli_->run_loop();
}

bool PeerNode::execute_command(const std::string& line) {
  if(!cli_) return false;
  return cli_->execute_command(line);
}

void PeerNode::stop() {
  if(!started_.exchange(false)) return;
  if(listener_) {
    listener_->stop();
  }
  io_.stop();
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
  workers_.clear();
  io_.restart();
}

LocalStore& PeerNode::store() {
  if(!store_) throw std::logic_error("PeerNode not started");
  return *store_;
}

PeerAgent& PeerNode::agent() {
  if(!agent_) throw std::logic_error("PeerNode not started");
  return *agent_;
}
