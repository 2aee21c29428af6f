#pragma once
#include <memory>
#include <set>
#include <string>

#include "directory_store.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Turns one control-plane request line into its complete reply text.
// No sockets involved; the index server feeds it lines per connection.
class IndexService {
public:
  IndexService(DirectoryStore& store,
               std::set<std::string> accepted_tokens,
               std::shared_ptr<Logger> logger = nullptr);

  // `origin` only labels log output (usually the remote endpoint).
  std::string handle_line(const std::string& line, const std::string& origin = "");

  bool accepts(const std::string& token) const;
  const std::set<std::string>& accepted_tokens() const { return accepted_tokens_; }

private:
  std::string handle(const AddRequest& request, const std::string& origin);
  std::string handle(const LookupRequest& request, const std::string& origin);
  std::string handle(const ListRequest& request, const std::string& origin);

  DirectoryStore& store_;
  const std::set<std::string> accepted_tokens_;
  std::shared_ptr<Logger> logger_;
};
