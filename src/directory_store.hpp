#pragma once
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "protocol.hpp"

// Server-side directory: document id -> title + holders.
//
// Holder updates take the record's own lock, so traffic for unrelated ids
// never serializes on one mutex. The id map lock is taken exclusively only
// while a new id is inserted.
class DirectoryStore {
public:
  enum class RegisterStatus {
    Created,        // new record, holders = {address}
    HolderAdded,    // known id, address appended
    AlreadyHolder,  // known id, address already present
    InvalidId,
    InvalidAddress,
    InvalidTitle
  };

  DirectoryStore() = default;
  DirectoryStore(const DirectoryStore&) = delete;
  DirectoryStore& operator=(const DirectoryStore&) = delete;

  // The title only matters when the id is new; later titles are ignored.
  RegisterStatus register_document(DocumentId id,
                                   const std::string& title,
                                   const PeerAddress& address);

  // Holders in registration order, or nullopt for an unknown id.
  std::optional<std::vector<PeerAddress>> find(DocumentId id) const;

  // All records sorted by id.
  std::vector<DirectoryEntry> snapshot() const;

  std::size_t size() const;

  static bool succeeded(RegisterStatus status) {
    return status == RegisterStatus::Created ||
           status == RegisterStatus::HolderAdded ||
           status == RegisterStatus::AlreadyHolder;
  }

private:
  struct Record {
    explicit Record(std::string t) : title(std::move(t)) {}
    const std::string title;
    mutable std::shared_mutex mutex;
    std::vector<PeerAddress> holders;
  };

  static RegisterStatus add_holder(Record& record, const PeerAddress& address);

  mutable std::shared_mutex index_mutex_;
  std::map<DocumentId, std::unique_ptr<Record>> records_;
};

const char* register_status_name(DirectoryStore::RegisterStatus status);
