#include "peer_agent.hpp"

#include <system_error>

#include "line_client.hpp"
#include "utils.hpp"

namespace {

AgentError make_error(AgentError::Kind kind, std::string message) {
  AgentError error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

AgentError from_reply(const ReplyHeader& header) {
  std::string text = header.code ? reply_code_name(*header.code) : "ERROR";
  if(!header.detail.empty()) text += " (" + header.detail + ")";
  auto kind = (header.code && *header.code == ReplyCode::NotFound)
    ? AgentError::Kind::NotFound
    : AgentError::Kind::Protocol;
  return make_error(kind, text);
}

} // namespace

const char* agent_error_kind_name(AgentError::Kind kind) {
  switch(kind) {
    case AgentError::Kind::None: return "none";
    case AgentError::Kind::Protocol: return "protocol error";
    case AgentError::Kind::NotFound: return "not found";
    case AgentError::Kind::Network: return "network error";
    case AgentError::Kind::Local: return "local error";
  }
  return "error";
}

PeerAgent::PeerAgent(Options options, LocalStore& store, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    store_(store),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("peer-agent")) {}

bool PeerAgent::control_exchange(const std::string& request,
                                 std::vector<std::string>& body,
                                 AgentError& error) {
  body.clear();
  try {
    LineClient client(options_.timeout);
    client.connect(options_.server_host, options_.server_port);
    client.write(request);

    auto status_line = client.read_line();
    auto header = parse_reply_header(status_line);
    if(!header) {
      error = make_error(AgentError::Kind::Protocol, "unexpected reply '" + status_line + "'");
      return false;
    }
    if(!header->ok) {
      error = from_reply(*header);
      return false;
    }
    std::size_t count = header->count.value_or(0);
    if(count > kMaxReplyLines) {
      error = make_error(AgentError::Kind::Protocol,
                         "reply announces " + std::to_string(count) + " lines");
      return false;
    }
    for(std::size_t i = 0; i < count; ++i) {
      body.push_back(client.read_line());
    }
    return true;
  } catch(const std::system_error& e) {
    error = make_error(AgentError::Kind::Network,
                       "index server " + options_.server_host + ":" +
                       std::to_string(options_.server_port) + ": " + e.what());
    return false;
  }
}

bool PeerAgent::add(DocumentId id, const std::string& token, std::string& title, AgentError& error) {
  auto local_title = store_.title_of(id);
  if(!local_title) {
    error = make_error(AgentError::Kind::Local,
                       "no local document " + store_.path_for(id).string());
    return false;
  }
  title = *local_title;

  AddRequest request;
  request.id = id;
  request.title = title;
  request.address = options_.self;
  request.token = token;

  std::vector<std::string> body;
  if(!control_exchange(format_request(request), body, error)) {
    logger_->debug("ADD {} failed: {}", id, error.message);
    return false;
  }
  logger_->debug("ADD {} '{}' as {}", id, title, options_.self.to_string());
  return true;
}

bool PeerAgent::lookup(DocumentId id, const std::string& token,
                       std::vector<PeerAddress>& holders, AgentError& error) {
  holders.clear();
  std::vector<std::string> body;
  if(!control_exchange(format_request(LookupRequest{id, token}), body, error)) {
    return false;
  }
  for(const auto& line : body) {
    auto holder = parse_holder_line(line);
    if(!holder) {
      error = make_error(AgentError::Kind::Protocol, "bad holder line '" + line + "'");
      holders.clear();
      return false;
    }
    holders.push_back(*holder);
  }
  return true;
}

bool PeerAgent::list(const std::string& token, std::vector<DirectoryEntry>& entries, AgentError& error) {
  entries.clear();
  std::vector<std::string> body;
  if(!control_exchange(format_request(ListRequest{token}), body, error)) {
    return false;
  }
  for(const auto& line : body) {
    auto entry = parse_entry_line(line);
    if(!entry) {
      error = make_error(AgentError::Kind::Protocol, "bad listing line '" + line + "'");
      entries.clear();
      return false;
    }
    entries.push_back(*entry);
  }
  return true;
}

bool PeerAgent::get(DocumentId id, const std::string& token, GetReport& report, AgentError& error) {
  std::vector<PeerAddress> holders;
  if(!lookup(id, token, holders, error)) {
    return false;
  }
  if(holders.empty()) {
    error = make_error(AgentError::Kind::NotFound, "no holders listed for " + std::to_string(id));
    return false;
  }
  return fetch_from(holders.front(), id, token, report, error);
}

bool PeerAgent::fetch_from(const PeerAddress& holder, DocumentId id, const std::string& token,
                           GetReport& report, AgentError& error) {
  std::string store_error;
  auto staging = store_.begin_staging(id, store_error);
  if(!staging) {
    error = make_error(AgentError::Kind::Local, store_error);
    return false;
  }

  Sha256Stream digest;
  try {
    LineClient client(options_.timeout);
    client.connect(holder.host, static_cast<uint16_t>(holder.port));
    client.write(format_request(GetRequest{id, token}));

    auto status_line = client.read_line();
    auto header = parse_reply_header(status_line);
    if(!header || (header->ok && !header->count)) {
      error = make_error(AgentError::Kind::Protocol,
                         "unexpected reply '" + status_line + "' from " + holder.to_string());
      return false;
    }
    if(!header->ok) {
      error = from_reply(*header);
      error.message += " from " + holder.to_string();
      return false;
    }

    client.read_exact(*header->count, [&](const char* data, std::size_t size){
      return digest.update(data, size) && staging->write(data, size);
    });
  } catch(const std::system_error& e) {
    error = make_error(AgentError::Kind::Network, holder.to_string() + ": " + e.what());
    return false;
  }

  if(!staging->commit(store_error)) {
    error = make_error(AgentError::Kind::Local, store_error);
    return false;
  }

  report.source = holder;
  report.bytes = staging->bytes_written();
  report.sha256 = digest.hex_digest().value_or(std::string());
  logger_->debug("GET {} from {}: {} bytes sha256={}", id, holder.to_string(), report.bytes, report.sha256);
  return true;
}

std::size_t PeerAgent::register_local_documents(const std::string& token) {
  std::size_t registered = 0;
  for(auto id : store_.list()) {
    std::string title;
    AgentError error;
    if(add(id, token, title, error)) {
      logger_->info("Registered RFC {} '{}'", id, title);
      ++registered;
    } else {
      logger_->warn("Could not register RFC {}: {}", id, error.message);
    }
  }
  return registered;
}
