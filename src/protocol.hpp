#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

// protocol.hpp
//
// Line-oriented wire format shared by the index server (ADD/LOOKUP/LIST)
// and the peer transfer listener (GET). Every line ends with '\n'; a '\r'
// right before it is tolerated.

using DocumentId = std::int64_t;

inline constexpr const char* kDefaultProtocolToken = "P2P-CI/1.0";
inline constexpr int kDefaultServerPort = 7734;
inline constexpr std::size_t kMaxLineLength = 4096;
// Read limit for one line: kMaxLineLength plus its "\r\n".
inline constexpr std::size_t kMaxFrameLength = kMaxLineLength + 2;
// Upper bound on the body lines announced by an `OK <n>` reply.
inline constexpr std::size_t kMaxReplyLines = 1000000;

struct PeerAddress {
  std::string host;
  int port = 0;

  bool valid() const;
  std::string to_string() const { return host + ":" + std::to_string(port); }

  bool operator==(const PeerAddress& other) const {
    return port == other.port && host == other.host;
  }
  bool operator!=(const PeerAddress& other) const { return !(*this == other); }
};

struct DirectoryEntry {
  DocumentId id = 0;
  std::string title;
};

enum class ReplyCode {
  BadRequest,
  UnsupportedToken,
  InvalidId,
  InvalidAddress,
  InvalidTitle,
  NotFound,
  Unavailable
};

const char* reply_code_name(ReplyCode code);
std::optional<ReplyCode> reply_code_from_name(const std::string& name);

struct AddRequest {
  DocumentId id = 0;
  std::string title;
  PeerAddress address;
  std::string token;
};

struct LookupRequest {
  DocumentId id = 0;
  std::string token;
};

struct ListRequest {
  std::string token;
};

using ControlRequest = std::variant<AddRequest, LookupRequest, ListRequest>;

struct GetRequest {
  DocumentId id = 0;
  std::string token;
};

// Strict decoding: anything that does not match one of the request shapes
// exactly yields nullopt and a description in `error`. Values are not
// range-checked here (a negative id parses); that is the receiver's job.
std::optional<ControlRequest> parse_control_request(const std::string& line, std::string& error);
std::optional<GetRequest> parse_get_request(const std::string& line, std::string& error);

const std::string& request_token(const ControlRequest& request);
const char* request_verb(const ControlRequest& request);

std::string format_request(const AddRequest& request);
std::string format_request(const LookupRequest& request);
std::string format_request(const ListRequest& request);
std::string format_request(const GetRequest& request);

std::string format_ok();
std::string format_ok(std::size_t count);
std::string format_error(ReplyCode code, const std::string& detail = std::string());
std::string format_holder_line(const PeerAddress& address);
std::string format_entry_line(const DirectoryEntry& entry);

// First line of any reply: "OK", "OK <n>" or "ERROR <CODE> [detail]".
struct ReplyHeader {
  bool ok = false;
  std::optional<std::size_t> count;
  std::optional<ReplyCode> code;
  std::string detail;
};

std::optional<ReplyHeader> parse_reply_header(const std::string& line);
std::optional<PeerAddress> parse_holder_line(const std::string& line);
std::optional<DirectoryEntry> parse_entry_line(const std::string& line);

std::string strip_line_ending(std::string line);
std::optional<DocumentId> parse_document_id(const std::string& text);
std::optional<std::size_t> parse_count(const std::string& text);

// "a, b,c" -> {"a","b","c"}; empty items are dropped.
std::set<std::string> parse_token_list(const std::string& text);
std::string join_tokens(const std::set<std::string>& tokens);
