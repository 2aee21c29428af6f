#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "local_store.hpp"
#include "log.hpp"
#include "protocol.hpp"

class LineClient;

// Failure of one agent operation. Kinds follow where the failure came from:
// a rejected request, a missing document, the network, or this peer's
// own files.
struct AgentError {
  enum class Kind { None, Protocol, NotFound, Network, Local };
  Kind kind = Kind::None;
  std::string message;
};

const char* agent_error_kind_name(AgentError::Kind kind);

// Interactive half of a peer: talks to the index server and pulls
// documents from other peers' transfer listeners. Every operation opens
// its own connection and closes it when the reply is in; nothing is
// retried.
class PeerAgent {
public:
  struct Options {
    std::string server_host = "127.0.0.1";
    uint16_t server_port = kDefaultServerPort;
    PeerAddress self;                              // what we advertise in ADD
    std::chrono::milliseconds timeout{10000};
  };

  struct GetReport {
    PeerAddress source;
    std::size_t bytes = 0;
    std::string sha256;
  };

  PeerAgent(Options options, LocalStore& store, std::shared_ptr<Logger> logger = nullptr);

  const Options& options() const { return options_; }

  bool add(DocumentId id, const std::string& token, std::string& title, AgentError& error);
  bool lookup(DocumentId id, const std::string& token,
              std::vector<PeerAddress>& holders, AgentError& error);
  bool list(const std::string& token, std::vector<DirectoryEntry>& entries, AgentError& error);
  bool get(DocumentId id, const std::string& token, GetReport& report, AgentError& error);

  // ADDs every document already in the local store; returns how many the
  // server accepted.
  std::size_t register_local_documents(const std::string& token);

private:
  // Sends `request` to the index server and reads the status line plus the
  // `OK <n>` body lines, if any.
  bool control_exchange(const std::string& request,
                        std::vector<std::string>& body,
                        AgentError& error);
  bool fetch_from(const PeerAddress& holder, DocumentId id, const std::string& token,
                  GetReport& report, AgentError& error);

  Options options_;
  LocalStore& store_;
  std::shared_ptr<Logger> logger_;
};
