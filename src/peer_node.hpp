#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

class LocalStore;
class PeerAgent;
class PeerCLI;
class SettingsManager;
class TransferListener;

// One peer process: transfer listener on a worker pool, plus the agent
// and CLI that talk to the index server and to other peers. The two
// sides share nothing but the local store.
class PeerNode {
public:
  explicit PeerNode(std::shared_ptr<SettingsManager> settings);
  ~PeerNode();

  PeerNode(const PeerNode&) = delete;
  PeerNode& operator=(const PeerNode&) = delete;

  // Reads settings, prepares the store and binds the listener. Throws
  // std::runtime_error / std::system_error on bad configuration.
  void start();
  void start_background();
  // Interactive loop on the calling thread; returns on quit or EOF.
  void run_cli();
  void stop();

  bool execute_command(const std::string& line);
  std::size_t register_local_documents();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  const std::string& peer_name() const { return peer_name_; }
  uint16_t listen_port() const { return listen_port_; }
  PeerAddress self_address() const { return self_address_; }
  LocalStore& store();
  PeerAgent& agent();

private:
  int int_setting(const std::string& key, int min, int max) const;

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::vector<std::thread> workers_;
  std::unique_ptr<LocalStore> store_;
  std::unique_ptr<TransferListener> listener_;
  std::unique_ptr<PeerAgent> agent_;
  std::unique_ptr<PeerCLI> cli_;
  std::atomic<bool> started_{false};
  std::string peer_name_;
  std::string protocol_token_;
  bool auto_register_ = true;
  std::size_t io_threads_ = 2;
  uint16_t listen_port_ = 0;
  PeerAddress self_address_;
};
