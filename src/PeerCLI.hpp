#pragma once
#include <atomic>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "local_store.hpp"
#include "log.hpp"
#include "peer_agent.hpp"
#include "protocol.hpp"

// Interactive command surface of a peer. Every command prints either a
// result or an explicit failure; the loop keeps going after failures.
class PeerCLI {
public:
  struct Options {
    bool auto_register = true;
    std::string prompt = "> ";
  };

  PeerCLI(PeerAgent& agent, LocalStore& store, std::shared_ptr<Logger> logger, Options options)
    : agent_(agent), store_(store), logger_(std::move(logger)), options_(std::move(options)) {}

  // Reads commands until `quit` or end of input.
  void run_loop() {
    print_help();
    while(!quit_requested_) {
      auto input = read_command_line(options_.prompt.c_str());
      if(!input) break;
      execute_command(*input);
    }
  }

  // Returns false once the command was `quit`. A command that throws is
  // reported as failed and the loop carries on.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> args;
    for(std::string word; iss >> word;) args.push_back(word);
    if(args.empty()) return true;

    try {
      return dispatch_command(args);
    } catch(const std::exception& e) {
      logger_->print_err("{} failed: {}", args[0], e.what());
      return true;
    }
  }

  bool quit_requested() const { return quit_requested_; }

private:
  bool dispatch_command(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    if(cmd == "add") {
      with_id_and_token(args, "add <id> <token>", [this](DocumentId id, const std::string& token){
        add_command(id, token);
      });
    } else if(cmd == "lookup") {
      with_id_and_token(args, "lookup <id> <token>", [this](DocumentId id, const std::string& token){
        lookup_command(id, token);
      });
    } else if(cmd == "get") {
      with_id_and_token(args, "get <id> <token>", [this](DocumentId id, const std::string& token){
        get_command(id, token);
      });
    } else if(cmd == "list") {
      if(args.size() != 2) {
        logger_->print_err("Usage: list <token>");
      } else {
        list_command(args[1]);
      }
    } else if(cmd == "local") {
      local_command();
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      logger_->print("Quitting...");
      quit_requested_ = true;
      return false;
    } else {
      logger_->print_err("Unknown command: {} (try 'help')", cmd);
    }
    return true;
  }

  template<typename Fn>
  void with_id_and_token(const std::vector<std::string>& args, const char* usage, Fn&& fn) {
    if(args.size() != 3) {
      logger_->print_err("Usage: {}", usage);
      return;
    }
    auto id = parse_document_id(args[1]);
    if(!id || *id <= 0) {
      logger_->print_err("RFC number must be a positive integer (got '{}')", args[1]);
      return;
    }
    fn(*id, args[2]);
  }

  void report_failure(const std::string& what, const AgentError& error) {
    logger_->print_err("{} failed [{}]: {}", what, agent_error_kind_name(error.kind), error.message);
  }

  void add_command(DocumentId id, const std::string& token) {
    std::string title;
    AgentError error;
    if(!agent_.add(id, token, title, error)) {
      report_failure("add " + std::to_string(id), error);
      return;
    }
    logger_->print("OK: RFC {} '{}' registered as {}", id, title, agent_.options().self.to_string());
  }

  void lookup_command(DocumentId id, const std::string& token) {
    std::vector<PeerAddress> holders;
    AgentError error;
    if(!agent_.lookup(id, token, holders, error)) {
      report_failure("lookup " + std::to_string(id), error);
      return;
    }
    logger_->print("RFC {} is held by {} peer(s):", id, holders.size());
    for(const auto& holder : holders) {
      logger_->print("  {} {}", holder.host, holder.port);
    }
  }

  void list_command(const std::string& token) {
    std::vector<DirectoryEntry> entries;
    AgentError error;
    if(!agent_.list(token, entries, error)) {
      report_failure("list", error);
      return;
    }
    logger_->print("{} RFC(s) in the index:", entries.size());
    for(const auto& entry : entries) {
      logger_->print("  {} {}", entry.id, entry.title);
    }
  }

  void get_command(DocumentId id, const std::string& token) {
    PeerAgent::GetReport report;
    AgentError error;
    if(!agent_.get(id, token, report, error)) {
      report_failure("get " + std::to_string(id), error);
      return;
    }
    logger_->print("OK: RFC {} saved to {} ({} bytes from {}, sha256 {})",
                   id, store_.path_for(id).string(), report.bytes,
                   report.source.to_string(), report.sha256);
    if(options_.auto_register) {
      add_command(id, token);
    }
  }

  void local_command() {
    auto ids = store_.list();
    logger_->print("{} RFC(s) in {}:", ids.size(), store_.root().string());
    for(auto id : ids) {
      logger_->print("  {} {}", id, store_.title_of(id).value_or("<unreadable>"));
    }
  }

  void print_help() {
    logger_->print("Commands:");
    logger_->print("  add <id> <token>     register local rfc<id>.txt with the index");
    logger_->print("  lookup <id> <token>  list peers holding RFC <id>");
    logger_->print("  list <token>         list every RFC in the index");
    logger_->print("  get <id> <token>     download RFC <id> from the first holder");
    logger_->print("  local                list RFCs in this peer's directory");
    logger_->print("  quit                 exit");
  }

  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    std::cout << prompt;
    std::cout.flush();
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  PeerAgent& agent_;
  LocalStore& store_;
  std::shared_ptr<Logger> logger_;
  Options options_;
  std::atomic<bool> quit_requested_{false};
};
