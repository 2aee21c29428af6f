#include "directory_store.hpp"
#include "test_runner_utils.hpp"

#include <set>
#include <thread>
#include <vector>

using p2pci::test::TestCase;
using p2pci::test::TestContext;
using Status = DirectoryStore::RegisterStatus;

namespace {

const PeerAddress kPeerA{"10.0.0.1", 5000};
const PeerAddress kPeerB{"10.0.0.2", 5001};

bool test_register_creates_record(TestContext&) {
  DirectoryStore store;
  if(store.register_document(100, "Test RFC", kPeerA) != Status::Created) return false;
  auto holders = store.find(100);
  if(!holders.has_value()) return false;
  if(holders->size() != 1) return false;
  if(holders->front() != kPeerA) return false;
  if(store.size() != 1) return false;
  return true;
}

bool test_register_is_idempotent(TestContext&) {
  DirectoryStore store;
  if(store.register_document(7, "Seven", kPeerA) != Status::Created) return false;
  if(store.register_document(7, "Seven", kPeerA) != Status::AlreadyHolder) return false;
  if(store.register_document(7, "Seven", kPeerA) != Status::AlreadyHolder) return false;
  if(store.find(7)->size() != 1) return false;
  return true;
}

bool test_holders_keep_registration_order(TestContext&) {
  DirectoryStore store;
  if(store.register_document(9, "Nine", kPeerB) != Status::Created) return false;
  if(store.register_document(9, "Nine", kPeerA) != Status::HolderAdded) return false;
  auto holders = store.find(9);
  if(!(holders && holders->size() == 2)) return false;
  if((*holders)[0] != kPeerB) return false;
  if((*holders)[1] != kPeerA) return false;

  // same host, other port is another holder
  if(store.register_document(9, "Nine", PeerAddress{"10.0.0.2", 6000}) != Status::HolderAdded) return false;
  if(store.find(9)->size() != 3) return false;
  return true;
}

bool test_first_title_wins(TestContext&) {
  DirectoryStore store;
  store.register_document(5, "Original title", kPeerA);
  if(store.register_document(5, "Other title", kPeerB) != Status::HolderAdded) return false;
  auto entries = store.snapshot();
  if(entries.size() != 1) return false;
  if(entries[0].title != "Original title") return false;
  return true;
}

bool test_rejects_invalid_input(TestContext&) {
  DirectoryStore store;
  if(store.register_document(0, "Zero", kPeerA) != Status::InvalidId) return false;
  if(store.register_document(-3, "Negative", kPeerA) != Status::InvalidId) return false;
  if(store.register_document(1, "One", PeerAddress{"", 5000}) != Status::InvalidAddress) return false;
  if(store.register_document(1, "One", PeerAddress{"10.0.0.1", 0}) != Status::InvalidAddress) return false;
  if(store.register_document(1, "One", PeerAddress{"10.0.0.1", 70000}) != Status::InvalidAddress) return false;
  if(store.register_document(1, "", kPeerA) != Status::InvalidTitle) return false;
  if(store.register_document(1, "two\nlines", kPeerA) != Status::InvalidTitle) return false;
  if(DirectoryStore::succeeded(Status::InvalidTitle)) return false;
  if(store.size() != 0) return false;
  return true;
}

bool test_find_unknown_id(TestContext&) {
  DirectoryStore store;
  if(store.find(42).has_value()) return false;
  store.register_document(41, "Forty-one", kPeerA);
  if(store.find(42).has_value()) return false;
  if(store.find(0).has_value()) return false;
  return true;
}

bool test_snapshot_sorted_by_id(TestContext&) {
  DirectoryStore store;
  if(!store.snapshot().empty()) return false;
  store.register_document(300, "Three hundred", kPeerA);
  store.register_document(2, "Two", kPeerB);
  store.register_document(45, "Forty-five", kPeerA);
  auto entries = store.snapshot();
  if(entries.size() != 3) return false;
  if(!(entries[0].id == 2 && entries[1].id == 45 && entries[2].id == 300)) return false;
  if(entries[1].title != "Forty-five") return false;
  return true;
}

bool test_concurrent_distinct_ids(TestContext&) {
  DirectoryStore store;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;
  std::vector<std::thread> threads;
  for(int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, t]{
      for(int i = 0; i < kPerThread; ++i) {
        DocumentId id = t * kPerThread + i + 1;
        store.register_document(id, "Doc " + std::to_string(id), PeerAddress{"10.1.0.1", 4000 + t});
      }
    });
  }
  for(auto& thread : threads) thread.join();

  if(store.size() != static_cast<std::size_t>(kThreads * kPerThread)) return false;
  auto entries = store.snapshot();
  for(std::size_t i = 0; i < entries.size(); ++i) {
    if(entries[i].id != static_cast<DocumentId>(i + 1)) return false;
  }
  return true;
}

bool test_concurrent_same_id(TestContext&) {
  DirectoryStore store;
  constexpr int kThreads = 16;
  std::vector<std::thread> threads;
  std::vector<Status> results(kThreads);
  for(int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]{
      // every holder registers twice; only one of all calls may create
      results[t] = store.register_document(1, "Title " + std::to_string(t), PeerAddress{"10.2.0.1", 7000 + t});
      store.register_document(1, "ignored", PeerAddress{"10.2.0.1", 7000 + t});
    });
  }
  for(auto& thread : threads) thread.join();

  int created = 0;
  for(auto status : results) {
    if(!DirectoryStore::succeeded(status)) return false;
    if(status == Status::Created) ++created;
  }
  if(created != 1) return false;

  auto holders = store.find(1);
  if(!(holders && holders->size() == static_cast<std::size_t>(kThreads))) return false;
  std::set<int> ports;
  for(const auto& holder : *holders) ports.insert(holder.port);
  if(ports.size() != static_cast<std::size_t>(kThreads)) return false;
  if(store.snapshot()[0].title.rfind("Title ", 0) != 0) return false;
  return true;
}

bool test_lookup_during_registration(TestContext&) {
  DirectoryStore store;
  store.register_document(11, "Eleven", kPeerA);
  std::atomic<bool> done{false};
  std::atomic<bool> shrank{false};
  std::thread reader([&]{
    std::size_t last = 0;
    while(!done) {
      auto holders = store.find(11);
      if(!holders || holders->size() < last) shrank = true;
      if(holders) last = holders->size();
    }
  });
  for(int port = 1; port <= 500; ++port) {
    store.register_document(11, "Eleven", PeerAddress{"10.3.0.1", port});
  }
  done = true;
  reader.join();
  if(shrank) return false;
  if(store.find(11)->size() != 501) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"register_creates_record", test_register_creates_record},
    {"register_is_idempotent", test_register_is_idempotent},
    {"holders_keep_registration_order", test_holders_keep_registration_order},
    {"first_title_wins", test_first_title_wins},
    {"rejects_invalid_input", test_rejects_invalid_input},
    {"find_unknown_id", test_find_unknown_id},
    {"snapshot_sorted_by_id", test_snapshot_sorted_by_id},
    {"concurrent_distinct_ids", test_concurrent_distinct_ids},
    {"concurrent_same_id", test_concurrent_same_id},
    {"lookup_during_registration", test_lookup_during_registration},
  };
  return p2pci::test::run_test_cases("directory", tests, argc, argv);
}
