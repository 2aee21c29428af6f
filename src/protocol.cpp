#include "protocol.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace {

struct ReplyCodeName {
  ReplyCode code;
  const char* name;
};

constexpr ReplyCodeName kReplyCodeNames[] = {
  {ReplyCode::BadRequest, "BAD_REQUEST"},
  {ReplyCode::UnsupportedToken, "UNSUPPORTED_TOKEN"},
  {ReplyCode::InvalidId, "INVALID_ID"},
  {ReplyCode::InvalidAddress, "INVALID_ADDRESS"},
  {ReplyCode::InvalidTitle, "INVALID_TITLE"},
  {ReplyCode::NotFound, "NOT_FOUND"},
  {ReplyCode::Unavailable, "UNAVAILABLE"},
};

bool is_space(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string trim(const std::string& value) {
  auto begin = std::find_if(value.begin(), value.end(), [](char ch){ return !is_space(ch); });
  auto end = std::find_if(value.rbegin(), value.rend(), [](char ch){ return !is_space(ch); }).base();
  if(begin >= end) return std::string();
  return std::string(begin, end);
}

// Splits off up to `max_fields` whitespace separated fields; whatever follows
// the last one (leading whitespace removed) goes to `rest`.
std::vector<std::string> split_fields(const std::string& line,
                                      std::size_t max_fields,
                                      std::string* rest = nullptr) {
  std::vector<std::string> fields;
  std::size_t pos = 0;
  while(fields.size() < max_fields) {
    while(pos < line.size() && is_space(line[pos])) ++pos;
    if(pos >= line.size()) break;
    std::size_t end = pos;
    while(end < line.size() && !is_space(line[end])) ++end;
    fields.push_back(line.substr(pos, end - pos));
    pos = end;
  }
  if(rest) {
    *rest = trim(line.substr(std::min(pos, line.size())));
  }
  return fields;
}

std::vector<std::string> split_all(const std::string& line) {
  return split_fields(line, std::numeric_limits<std::size_t>::max());
}

bool parse_int(const std::string& text, std::int64_t& out) {
  if(text.empty()) return false;
  std::size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
  if(start == text.size()) return false;
  for(std::size_t i = start; i < text.size(); ++i) {
    if(!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  try {
    out = std::stoll(text);
  } catch(const std::exception&) {
    return false;
  }
  return true;
}

} // namespace

bool PeerAddress::valid() const {
  if(host.empty() || port < 1 || port > 65535) return false;
  return std::none_of(host.begin(), host.end(), [](char ch){
    return is_space(ch) || std::iscntrl(static_cast<unsigned char>(ch));
  });
}

const char* reply_code_name(ReplyCode code) {
  for(const auto& entry : kReplyCodeNames) {
    if(entry.code == code) return entry.name;
  }
  return "BAD_REQUEST";
}

std::optional<ReplyCode> reply_code_from_name(const std::string& name) {
  for(const auto& entry : kReplyCodeNames) {
    if(name == entry.name) return entry.code;
  }
  return std::nullopt;
}

std::string strip_line_ending(std::string line) {
  while(!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  return line;
}

std::optional<DocumentId> parse_document_id(const std::string& text) {
  std::int64_t value = 0;
  if(!parse_int(text, value)) return std::nullopt;
  return value;
}

std::optional<std::size_t> parse_count(const std::string& text) {
  std::int64_t value = 0;
  if(!parse_int(text, value) || value < 0 || text[0] == '+') return std::nullopt;
  return static_cast<std::size_t>(value);
}

std::optional<ControlRequest> parse_control_request(const std::string& raw, std::string& error) {
  std::string line = strip_line_ending(raw);
  std::string rest;
  auto head = split_fields(line, 1, &rest);
  if(head.empty()) {
    error = "empty request";
    return std::nullopt;
  }
  const std::string& verb = head[0];

  if(verb == "ADD") {
    std::string title;
    auto fields = split_fields(line, 5, &title);
    if(fields.size() < 5 || title.empty()) {
      error = "expected ADD <id> <host> <port> <token> <title>";
      return std::nullopt;
    }
    auto id = parse_document_id(fields[1]);
    if(!id) {
      error = "document id '" + fields[1] + "' is not an integer";
      return std::nullopt;
    }
    std::int64_t port = 0;
    if(!parse_int(fields[3], port)) {
      error = "port '" + fields[3] + "' is not an integer";
      return std::nullopt;
    }
    AddRequest request;
    request.id = *id;
    request.address.host = fields[2];
    request.address.port = (port < 0 || port > 65535) ? 0 : static_cast<int>(port);
    request.token = fields[4];
    request.title = title;
    return ControlRequest{std::move(request)};
  }

  if(verb == "LOOKUP") {
    auto fields = split_all(line);
    if(fields.size() != 3) {
      error = "expected LOOKUP <id> <token>";
      return std::nullopt;
    }
    auto id = parse_document_id(fields[1]);
    if(!id) {
      error = "document id '" + fields[1] + "' is not an integer";
      return std::nullopt;
    }
    return ControlRequest{LookupRequest{*id, fields[2]}};
  }

  if(verb == "LIST") {
    auto fields = split_all(line);
    if(fields.size() != 2) {
      error = "expected LIST <token>";
      return std::nullopt;
    }
    return ControlRequest{ListRequest{fields[1]}};
  }

  error = "unknown command '" + verb + "'";
  return std::nullopt;
}

std::optional<GetRequest> parse_get_request(const std::string& raw, std::string& error) {
  auto fields = split_all(strip_line_ending(raw));
  if(fields.empty()) {
    error = "empty request";
    return std::nullopt;
  }
  if(fields[0] != "GET") {
    error = "unknown command '" + fields[0] + "'";
    return std::nullopt;
  }
  if(fields.size() != 3) {
    error = "expected GET <id> <token>";
    return std::nullopt;
  }
  auto id = parse_document_id(fields[1]);
  if(!id) {
    error = "document id '" + fields[1] + "' is not an integer";
    return std::nullopt;
  }
  return GetRequest{*id, fields[2]};
}

const std::string& request_token(const ControlRequest& request) {
  return std::visit([](const auto& r) -> const std::string& { return r.token; }, request);
}

const char* request_verb(const ControlRequest& request) {
  switch(request.index()) {
    case 0: return "ADD";
    case 1: return "LOOKUP";
    default: return "LIST";
  }
}

std::string format_request(const AddRequest& request) {
  return "ADD " + std::to_string(request.id) + " " + request.address.host + " " +
         std::to_string(request.address.port) + " " + request.token + " " +
         request.title + "\n";
}

std::string format_request(const LookupRequest& request) {
  return "LOOKUP " + std::to_string(request.id) + " " + request.token + "\n";
}

std::string format_request(const ListRequest& request) {
  return "LIST " + request.token + "\n";
}

std::string format_request(const GetRequest& request) {
  return "GET " + std::to_string(request.id) + " " + request.token + "\n";
}

std::string format_ok() {
  return "OK\n";
}

std::string format_ok(std::size_t count) {
  return "OK " + std::to_string(count) + "\n";
}

std::string format_error(ReplyCode code, const std::string& detail) {
  std::string line = std::string("ERROR ") + reply_code_name(code);
  if(!detail.empty()) {
    // a detail must never break the line framing
    std::string clean = detail;
    std::replace_if(clean.begin(), clean.end(),
                    [](char ch){ return ch == '\n' || ch == '\r'; }, ' ');
    line += " " + clean;
  }
  return line + "\n";
}

std::string format_holder_line(const PeerAddress& address) {
  return address.host + " " + std::to_string(address.port) + "\n";
}

std::string format_entry_line(const DirectoryEntry& entry) {
  return std::to_string(entry.id) + " " + entry.title + "\n";
}

std::optional<ReplyHeader> parse_reply_header(const std::string& raw) {
  std::string line = strip_line_ending(raw);
  std::string rest;
  auto fields = split_fields(line, 2, &rest);
  if(fields.empty()) return std::nullopt;

  ReplyHeader header;
  if(fields[0] == "OK") {
    header.ok = true;
    if(fields.size() == 2) {
      if(!rest.empty()) return std::nullopt;
      header.count = parse_count(fields[1]);
      if(!header.count) return std::nullopt;
    }
    return header;
  }
  if(fields[0] == "ERROR") {
    if(fields.size() < 2) return std::nullopt;
    header.ok = false;
    header.code = reply_code_from_name(fields[1]);
    header.detail = header.code ? rest : trim(fields[1] + " " + rest);
    return header;
  }
  return std::nullopt;
}

std::optional<PeerAddress> parse_holder_line(const std::string& raw) {
  auto fields = split_all(strip_line_ending(raw));
  if(fields.size() != 2) return std::nullopt;
  std::int64_t port = 0;
  if(!parse_int(fields[1], port) || port < 1 || port > 65535) return std::nullopt;
  return PeerAddress{fields[0], static_cast<int>(port)};
}

std::optional<DirectoryEntry> parse_entry_line(const std::string& raw) {
  std::string title;
  auto fields = split_fields(strip_line_ending(raw), 1, &title);
  if(fields.size() != 1 || title.empty()) return std::nullopt;
  auto id = parse_document_id(fields[0]);
  if(!id) return std::nullopt;
  return DirectoryEntry{*id, title};
}

std::set<std::string> parse_token_list(const std::string& text) {
  std::set<std::string> tokens;
  std::size_t start = 0;
  while(start <= text.size()) {
    auto comma = text.find(',', start);
    if(comma == std::string::npos) comma = text.size();
    auto item = trim(text.substr(start, comma - start));
    if(!item.empty()) tokens.insert(item);
    start = comma + 1;
  }
  return tokens;
}

std::string join_tokens(const std::set<std::string>& tokens) {
  std::string out;
  for(const auto& token : tokens) {
    if(!out.empty()) out += ",";
    out += token;
  }
  return out;
}
