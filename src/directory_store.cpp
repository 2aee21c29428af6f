#include "directory_store.hpp"

#include <algorithm>
#include <mutex>

DirectoryStore::RegisterStatus DirectoryStore::add_holder(Record& record,
                                                          const PeerAddress& address) {
  std::unique_lock<std::shared_mutex> lock(record.mutex);
  if(std::find(record.holders.begin(), record.holders.end(), address) != record.holders.end()) {
    return RegisterStatus::AlreadyHolder;
  }
  record.holders.push_back(address);
  return RegisterStatus::HolderAdded;
}

DirectoryStore::RegisterStatus DirectoryStore::register_document(DocumentId id,
                                                                 const std::string& title,
                                                                 const PeerAddress& address) {
  if(id <= 0) return RegisterStatus::InvalidId;
  if(!address.valid()) return RegisterStatus::InvalidAddress;
  if(title.empty() || title.find_first_of("\r\n") != std::string::npos) {
    return RegisterStatus::InvalidTitle;
  }

  {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = records_.find(id);
    if(it != records_.end()) {
      return add_holder(*it->second, address);
    }
  }

  std::unique_lock<std::shared_mutex> lock(index_mutex_);
  auto it = records_.find(id);
  if(it != records_.end()) {
    // another registration created it between the two locks
    return add_holder(*it->second, address);
  }
  auto record = std::make_unique<Record>(title);
  record->holders.push_back(address);
  records_.emplace(id, std::move(record));
  return RegisterStatus::Created;
}

std::optional<std::vector<PeerAddress>> DirectoryStore::find(DocumentId id) const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  auto it = records_.find(id);
  if(it == records_.end()) return std::nullopt;
  std::shared_lock<std::shared_mutex> record_lock(it->second->mutex);
  return it->second->holders;
}

std::vector<DirectoryEntry> DirectoryStore::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  std::vector<DirectoryEntry> out;
  out.reserve(records_.size());
  for(const auto& entry : records_) {
    out.push_back(DirectoryEntry{entry.first, entry.second->title});
  }
  return out;
}

std::size_t DirectoryStore::size() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return records_.size();
}

const char* register_status_name(DirectoryStore::RegisterStatus status) {
  switch(status) {
    case DirectoryStore::RegisterStatus::Created: return "created";
    case DirectoryStore::RegisterStatus::HolderAdded: return "holder added";
    case DirectoryStore::RegisterStatus::AlreadyHolder: return "already holder";
    case DirectoryStore::RegisterStatus::InvalidId: return "invalid id";
    case DirectoryStore::RegisterStatus::InvalidAddress: return "invalid address";
    case DirectoryStore::RegisterStatus::InvalidTitle: return "invalid title";
  }
  return "unknown";
}
