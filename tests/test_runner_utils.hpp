#pragma once

#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace p2pci::test {

// Scratch directory under the system temp dir, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    static std::atomic<unsigned> sequence{0};
    root_ = std::filesystem::temp_directory_path() /
            (name + "_" + std::to_string(getpid()) + "_" + std::to_string(sequence++));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& child) const { return root_ / child; }

private:
  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream(path, std::ios::binary | std::ios::trunc) << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Collects everything the attached loggers emit, whether or not console
// passthrough is on. Listeners never claim a message.
class LogCapture {
public:
  ~LogCapture() { detach_all(); }

  void attach(const std::shared_ptr<Logger>& logger, const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](const std::string& channel, spdlog::level::level_enum, const std::string& message) {
        record((label.empty() ? channel : label + " " + channel) + ": " + message);
        return false;
      });
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.emplace_back(logger, handle);
  }

  void detach_all() {
    decltype(hooks_) hooks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hooks.swap(hooks_);
    }
    for(auto& hook : hooks) {
      hook.first->remove_listener(hook.second);
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_line_with(needle);
  }

  bool wait_for_substring(const std::string& needle, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return arrived_.wait_for(lock, timeout, [&]{ return has_line_with(needle); });
  }

private:
  void record(std::string line) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.push_back(std::move(line));
    }
    arrived_.notify_all();
  }

  bool has_line_with(const std::string& needle) const {
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  mutable std::mutex mutex_;
  std::condition_variable arrived_;
  std::vector<std::string> lines_;
  std::vector<std::pair<std::shared_ptr<Logger>, LogListenerHandle>> hooks_;
};

// Polls `predicate` until it holds or `timeout` passes.
inline bool wait_for_condition(const std::function<bool()>& predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto give_up = std::chrono::steady_clock::now() + timeout;
  while(!predicate()) {
    if(std::chrono::steady_clock::now() >= give_up) return false;
    std::this_thread::sleep_for(interval);
  }
  return true;
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs `tests` in order, printing '.' per pass and the captured log for
// each failure. Console logging stays off unless -v or P2PCI_TEST_LOGS.
inline int run_test_cases(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = std::getenv("P2PCI_TEST_VERBOSE") != nullptr;
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    verbose = verbose || arg == "-v" || arg == "--verbose";
  }
  const bool quiet = !verbose && std::getenv("P2PCI_TEST_LOGS") == nullptr;

  init_logging(verbose);
  set_log_passthrough(!quiet);

  LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<const char*> failed;

  std::cout << suite << ": " << tests.size() << " tests " << std::flush;
  for(const auto& test : tests) {
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      std::cerr << "\n    " << test.name << " threw: " << e.what() << "\n";
    }
    logs.detach_all();

    if(passed) {
      std::cout << '.' << std::flush;
      continue;
    }
    std::cout << "F\n  FAILED " << test.name << "\n";
    for(const auto& line : logs.snapshot()) {
      std::cout << "    | " << line << "\n";
    }
    failed.push_back(test.name);
  }
  std::cout << "\n";
  set_log_passthrough(true);

  if(failed.empty()) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failed.size() << "/" << tests.size() << " failed:";
  for(const auto* name : failed) std::cout << " " << name;
  std::cout << ")\n";
  return 1;
}

} // namespace p2pci::test
