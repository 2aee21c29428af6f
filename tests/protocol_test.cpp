#include "directory_store.hpp"
#include "index_service.hpp"
#include "local_store.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "transfer_listener.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <set>
#include <string>
#include <vector>

using p2pci::test::TempWorkspace;
using p2pci::test::TestCase;
using p2pci::test::TestContext;

namespace {

const std::set<std::string> kTokens{kDefaultProtocolToken};

bool test_parse_add(TestContext&) {
  std::string error;
  auto request = parse_control_request("ADD 100 10.0.0.1 5000 P2P-CI/1.0 Test RFC title\r\n", error);
  if(!request.has_value()) return false;
  if(!(std::holds_alternative<AddRequest>(*request))) return false;
  const auto& add = std::get<AddRequest>(*request);
  if(add.id != 100) return false;
  if(add.address != (PeerAddress{"10.0.0.1", 5000})) return false;
  if(add.token != "P2P-CI/1.0") return false;
  if(add.title != "Test RFC title") return false;
  if(std::string(request_verb(*request)) != "ADD") return false;
  if(request_token(*request) != "P2P-CI/1.0") return false;
  return true;
}

bool test_parse_lookup_and_list(TestContext&) {
  std::string error;
  auto lookup = parse_control_request("LOOKUP 42 P2P-CI/1.0\n", error);
  if(!(lookup && std::holds_alternative<LookupRequest>(*lookup))) return false;
  if(std::get<LookupRequest>(*lookup).id != 42) return false;

  auto list = parse_control_request("LIST P2P-CI/1.0", error);
  if(!(list && std::holds_alternative<ListRequest>(*list))) return false;
  if(std::get<ListRequest>(*list).token != "P2P-CI/1.0") return false;

  auto negative = parse_control_request("LOOKUP -4 P2P-CI/1.0", error);
  if(!(negative && std::get<LookupRequest>(*negative).id == -4)) return false;
  return true;
}

bool test_parse_rejects_malformed(TestContext&) {
  const std::vector<std::string> bad = {
    "",
    "   ",
    "HELLO",
    "add 1 h 1 P2P-CI/1.0 lowercase verb",
    "ADD 1 h 1 P2P-CI/1.0",
    "ADD x h 1 P2P-CI/1.0 Title",
    "ADD 1 h port P2P-CI/1.0 Title",
    "LOOKUP 1",
    "LOOKUP 1 P2P-CI/1.0 extra",
    "LOOKUP one P2P-CI/1.0",
    "LIST",
    "LIST a b",
    "GET 1 P2P-CI/1.0",
  };
  for(const auto& line : bad) {
    std::string error;
    if(parse_control_request(line, error).has_value()) return false;
    if(error.empty()) return false;
  }
  return true;
}

bool test_parse_get(TestContext&) {
  std::string error;
  auto get = parse_get_request("GET 100 P2P-CI/1.0\r\n", error);
  if(!(get && get->id == 100 && get->token == "P2P-CI/1.0")) return false;
  if(parse_get_request("GET 100", error)) return false;
  if(parse_get_request("GET abc P2P-CI/1.0", error)) return false;
  if(parse_get_request("LIST P2P-CI/1.0", error)) return false;
  return true;
}

bool test_reply_header(TestContext&) {
  auto ok = parse_reply_header("OK\n");
  if(!(ok && ok->ok && !ok->count)) return false;
  auto counted = parse_reply_header("OK 3\r\n");
  if(!(counted && counted->ok && counted->count && *counted->count == 3)) return false;
  auto error = parse_reply_header(format_error(ReplyCode::NotFound, "no such\nthing"));
  if(!(error && !error->ok)) return false;
  if(!(error->code && *error->code == ReplyCode::NotFound)) return false;
  if(error->detail != "no such thing") return false;
  if(parse_reply_header("OK -1")) return false;
  if(parse_reply_header("OK 1 2")) return false;
  if(parse_reply_header("MAYBE")) return false;
  if(parse_reply_header("ERROR")) return false;

  auto holder = parse_holder_line("peer.example 6001\n");
  if(!(holder && *holder == (PeerAddress{"peer.example", 6001}))) return false;
  if(parse_holder_line("peer.example 0")) return false;
  auto entry = parse_entry_line("100 Test RFC\n");
  if(!(entry && entry->id == 100 && entry->title == "Test RFC")) return false;
  return true;
}

bool test_token_list(TestContext&) {
  auto tokens = parse_token_list(" P2P-CI/1.0, P2P-CI/1.1 ,,");
  if(tokens.size() != 2) return false;
  if(!(tokens.count("P2P-CI/1.0") == 1 && tokens.count("P2P-CI/1.1") == 1)) return false;
  if(join_tokens(tokens) != "P2P-CI/1.0,P2P-CI/1.1") return false;
  if(!parse_token_list("").empty()) return false;
  return true;
}

bool test_index_service_flow(TestContext& ctx) {
  DirectoryStore store;
  auto logger = std::make_shared<Logger>("index-test");
  ctx.logs.attach(logger);
  IndexService service(store, kTokens, logger);

  if(service.handle_line("LIST P2P-CI/1.0\n") != "OK 0\n") return false;
  if(service.handle_line("ADD 100 10.0.0.1 5000 P2P-CI/1.0 Test RFC\n", "a") != "OK\n") return false;
  if(service.handle_line("ADD 100 10.0.0.1 5000 P2P-CI/1.0 Test RFC\n", "a") != "OK\n") return false;
  if(service.handle_line("ADD 100 10.0.0.2 5001 P2P-CI/1.0 Renamed\n", "b") != "OK\n") return false;
  if(service.handle_line("LOOKUP 100 P2P-CI/1.0\n") !=
     "OK 2\n10.0.0.1 5000\n10.0.0.2 5001\n") return false;
  if(service.handle_line("ADD 7 10.0.0.2 5001 P2P-CI/1.0 Seven\n") != "OK\n") return false;
  if(service.handle_line("LIST P2P-CI/1.0\n") != "OK 2\n7 Seven\n100 Test RFC\n") return false;
  if(service.handle_line("LOOKUP 8 P2P-CI/1.0\n") != "ERROR NOT_FOUND\n") return false;
  if(!ctx.logs.contains("ADD 100 'Test RFC' from 10.0.0.1:5000: created")) return false;
  return true;
}

bool test_index_service_errors(TestContext&) {
  DirectoryStore store;
  IndexService service(store, kTokens);

  auto reply_code = [&](const std::string& line) -> std::string {
    auto header = parse_reply_header(service.handle_line(line));
    if(!header || header->ok || !header->code) return "?";
    return reply_code_name(*header->code);
  };

  if(reply_code("FETCH 1 P2P-CI/1.0") != "BAD_REQUEST") return false;
  if(reply_code("LOOKUP 1") != "BAD_REQUEST") return false;
  if(reply_code("LOOKUP 1 HTTP/1.1") != "UNSUPPORTED_TOKEN") return false;
  if(reply_code("LIST P2P-CI/2.0") != "UNSUPPORTED_TOKEN") return false;
  if(reply_code("ADD 0 10.0.0.1 5000 P2P-CI/1.0 Zero") != "INVALID_ID") return false;
  if(reply_code("ADD 1 10.0.0.1 0 P2P-CI/1.0 Port zero") != "INVALID_ADDRESS") return false;
  if(reply_code("ADD 1 10.0.0.1 99999 P2P-CI/1.0 Port high") != "INVALID_ADDRESS") return false;
  if(reply_code("LOOKUP -1 P2P-CI/1.0") != "NOT_FOUND") return false;
  // token is checked before the request is applied
  if(reply_code("ADD 1 10.0.0.1 5000 BOGUS Title") != "UNSUPPORTED_TOKEN") return false;
  if(store.size() != 0) return false;

  IndexService multi(store, parse_token_list("P2P-CI/1.0,P2P-CI/1.1"));
  if(multi.handle_line("LIST P2P-CI/1.1") != "OK 0\n") return false;
  return true;
}

bool test_extract_title(TestContext&) {
  if(extract_title("RFC 100 - Test RFC\nbody\n") != "Test RFC") return false;
  if(extract_title("RFC 791 Internet Protocol\n") != "Internet Protocol") return false;
  if(extract_title("  Just a heading  \nmore") != "Just a heading") return false;
  if(extract_title("Network Working Group - Echo Protocol") != "Echo Protocol") return false;
  if(extract_title("RFC 5") != "RFC 5") return false;
  if(!extract_title("\nsecond line only").empty()) return false;
  if(!extract_title("").empty()) return false;
  return true;
}

bool test_local_store_listing(TestContext&) {
  TempWorkspace workspace("p2pci_local_store");
  LocalStore store(workspace / "rfcs");
  std::string error;
  if(!store.ensure_root(error)) return false;

  p2pci::test::write_file(store.path_for(100), "RFC 100 - Test RFC\nhello\n");
  p2pci::test::write_file(store.path_for(7), "\n");
  p2pci::test::write_file(workspace / "rfcs" / "notes.txt", "ignored");
  p2pci::test::write_file(workspace / "rfcs" / "rfc0.txt", "ignored");
  p2pci::test::write_file(workspace / "rfcs" / "rfcX.txt", "ignored");
  p2pci::test::write_file(workspace / "rfcs" / "rfc007.txt", "ignored");

  auto ids = store.list();
  if(ids != std::vector<DocumentId>{7, 100}) return false;
  if(!store.contains(100)) return false;
  if(store.contains(8)) return false;
  if(store.title_of(100) != std::optional<std::string>("Test RFC")) return false;
  if(store.title_of(7) != std::optional<std::string>("RFC 7")) return false;
  if(store.title_of(8)) return false;
  if(LocalStore::id_from_filename("rfc123.txt") != std::optional<DocumentId>(123)) return false;
  if(LocalStore::id_from_filename("rfc123.txt.part")) return false;
  if(LocalStore::id_from_filename("rfc007.txt")) return false;
  return true;
}

bool test_local_store_publish(TestContext&) {
  TempWorkspace workspace("p2pci_publish");
  LocalStore store(workspace / "rfcs");
  std::string error;

  std::string content("binary\0body\r\n", 13);
  if(!store.publish(42, content, error)) return false;
  if(store.read(42) != std::optional<std::string>(content)) return false;

  if(!store.publish(42, "replacement", error)) return false;
  if(store.read(42) != std::optional<std::string>("replacement")) return false;

  {
    auto staging = store.begin_staging(43, error);
    if(staging == nullptr) return false;
    if(!staging->write("partial", 7)) return false;
    if(staging->bytes_written() != 7) return false;
    if(store.contains(43)) return false;
  }
  // dropped without commit: nothing published, nothing left behind
  if(store.contains(43)) return false;
  if(!std::filesystem::is_empty(workspace / "rfcs" / ".rfc_tmp")) return false;
  if(store.list() != std::vector<DocumentId>{42}) return false;
  return true;
}

bool test_transfer_reply(TestContext& ctx) {
  TempWorkspace workspace("p2pci_transfer_reply");
  LocalStore store(workspace / "rfcs");
  std::string error;
  if(!store.publish(100, "RFC 100 - Test RFC\nbody\n", error)) return false;

  asio::io_context io;
  auto logger = std::make_shared<Logger>("transfer-test");
  ctx.logs.attach(logger);
  TransferListener listener(io, store, parse_token_list("P2P-CI/1.0"), TransferListener::Options{}, logger);

  auto ok = listener.build_reply("GET 100 P2P-CI/1.0\n", "test");
  if(ok.header != "OK 24\n") return false;
  if(!(ok.body && *ok.body == "RFC 100 - Test RFC\nbody\n")) return false;

  auto missing = listener.build_reply("GET 101 P2P-CI/1.0\n");
  if(missing.header != "ERROR NOT_FOUND\n") return false;
  if(missing.body) return false;

  if(listener.build_reply("GET 0 P2P-CI/1.0").header != "ERROR NOT_FOUND\n") return false;
  if(listener.build_reply("GET 100 P2P-CI/9.9").header.rfind("ERROR UNSUPPORTED_TOKEN", 0) != 0) return false;
  if(listener.build_reply("GET 100").header.rfind("ERROR BAD_REQUEST", 0) != 0) return false;
  if(listener.build_reply("LIST P2P-CI/1.0").header.rfind("ERROR BAD_REQUEST", 0) != 0) return false;

  std::filesystem::remove(store.path_for(100));
  if(listener.build_reply("GET 100 P2P-CI/1.0").header != "ERROR NOT_FOUND\n") return false;
  return true;
}

bool test_sha256_hex(TestContext&) {
  if(sha256_hex("") !=
     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") return false;
  if(sha256_hex("abc") !=
     "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"parse_add", test_parse_add},
    {"parse_lookup_and_list", test_parse_lookup_and_list},
    {"parse_rejects_malformed", test_parse_rejects_malformed},
    {"parse_get", test_parse_get},
    {"reply_header", test_reply_header},
    {"token_list", test_token_list},
    {"index_service_flow", test_index_service_flow},
    {"index_service_errors", test_index_service_errors},
    {"extract_title", test_extract_title},
    {"local_store_listing", test_local_store_listing},
    {"local_store_publish", test_local_store_publish},
    {"transfer_reply", test_transfer_reply},
    {"sha256_hex", test_sha256_hex},
  };
  return p2pci::test::run_test_cases("protocol", tests, argc, argv);
}
