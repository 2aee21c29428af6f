#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "protocol.hpp"

// A peer's documents, one file per id: <root>/rfc<id>.txt.
//
// Published files are never rewritten in place. New content is written
// to a staging file under <root>/.rfc_tmp and renamed over the target, so
// a concurrent reader sees either the old or the new document.
class LocalStore {
public:
  // Incoming document being written; removed on destruction unless
  // commit() succeeded.
  class Staging {
  public:
    ~Staging();
    Staging(const Staging&) = delete;
    Staging& operator=(const Staging&) = delete;

    bool write(const char* data, std::size_t size);
    std::size_t bytes_written() const { return bytes_written_; }
    bool commit(std::string& error);

  private:
    friend class LocalStore;
    Staging(std::filesystem::path staging_path, std::filesystem::path final_path);

    std::filesystem::path staging_path_;
    std::filesystem::path final_path_;
    std::ofstream out_;
    std::size_t bytes_written_ = 0;
    bool committed_ = false;
  };

  explicit LocalStore(std::filesystem::path root);

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path path_for(DocumentId id) const;

  bool ensure_root(std::string& error) const;

  bool contains(DocumentId id) const;
  std::optional<std::string> read(DocumentId id) const;
  std::vector<DocumentId> list() const;

  // Title per the first-line convention, or "RFC <id>".
  std::optional<std::string> title_of(DocumentId id) const;

  std::unique_ptr<Staging> begin_staging(DocumentId id, std::string& error);
  bool publish(DocumentId id, const std::string& content, std::string& error);

  static std::optional<DocumentId> id_from_filename(const std::string& filename);

private:
  std::filesystem::path staging_dir() const { return root_ / ".rfc_tmp"; }

  std::filesystem::path root_;
  std::atomic<unsigned long> staging_counter_{0};
};

// "RFC 123 - Some Title" -> "Some Title"; "RFC 123 Some Title" -> "Some Title";
// anything else -> the trimmed first line. Empty when there is no usable line.
std::string extract_title(const std::string& content);
