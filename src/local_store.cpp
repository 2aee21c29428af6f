#include "local_store.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string trim_copy(const std::string& value) {
  auto begin = std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); });
  auto end = std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return value;
}

} // namespace

std::string extract_title(const std::string& content) {
  auto newline = content.find('\n');
  std::string first_line = trim_copy(content.substr(0, newline));
  if(first_line.empty()) return "";

  auto dash = first_line.find('-');
  if(dash != std::string::npos) {
    return trim_copy(first_line.substr(dash + 1));
  }

  std::istringstream iss(first_line);
  std::vector<std::string> parts{std::istream_iterator<std::string>(iss),
                                 std::istream_iterator<std::string>()};
  if(parts.size() >= 3 && to_upper(parts[0]) == "RFC") {
    std::string title;
    for(std::size_t i = 2; i < parts.size(); ++i) {
      if(!title.empty()) title += " ";
      title += parts[i];
    }
    return title;
  }
  return first_line;
}

LocalStore::Staging::Staging(fs::path staging_path, fs::path final_path)
  : staging_path_(std::move(staging_path)),
    final_path_(std::move(final_path)),
    out_(staging_path_, std::ios::binary | std::ios::trunc) {}

LocalStore::Staging::~Staging() {
  if(out_.is_open()) out_.close();
  if(!committed_) {
    std::error_code ec;
    fs::remove(staging_path_, ec);
  }
}

bool LocalStore::Staging::write(const char* data, std::size_t size) {
  if(!out_ || committed_) return false;
  out_.write(data, static_cast<std::streamsize>(size));
  if(!out_) return false;
  bytes_written_ += size;
  return true;
}

bool LocalStore::Staging::commit(std::string& error) {
  if(committed_) return true;
  out_.flush();
  if(!out_) {
    error = "failed writing " + staging_path_.string();
    return false;
  }
  out_.close();
  std::error_code ec;
  fs::rename(staging_path_, final_path_, ec);
  if(ec) {
    error = "failed to publish " + final_path_.string() + ": " + ec.message();
    return false;
  }
  committed_ = true;
  return true;
}

LocalStore::LocalStore(fs::path root) : root_(std::move(root)) {}

fs::path LocalStore::path_for(DocumentId id) const {
  return root_ / ("rfc" + std::to_string(id) + ".txt");
}

bool LocalStore::ensure_root(std::string& error) const {
  std::error_code ec;
  fs::create_directories(staging_dir(), ec);
  if(ec) {
    error = "cannot create " + staging_dir().string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool LocalStore::contains(DocumentId id) const {
  std::error_code ec;
  return fs::is_regular_file(path_for(id), ec);
}

std::optional<std::string> LocalStore::read(DocumentId id) const {
  std::ifstream in(path_for(id), std::ios::binary);
  if(!in) return std::nullopt;
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) return std::nullopt;
  return content;
}

std::optional<DocumentId> LocalStore::id_from_filename(const std::string& filename) {
  const std::string prefix = "rfc";
  const std::string suffix = ".txt";
  if(filename.size() <= prefix.size() + suffix.size()) return std::nullopt;
  if(filename.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  if(filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;
  auto digits = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
  if(!std::all_of(digits.begin(), digits.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
    return std::nullopt;
  }
  // rfc007.txt would not round-trip through path_for
  if(digits[0] == '0') return std::nullopt;
  auto id = parse_document_id(digits);
  if(!id || *id <= 0) return std::nullopt;
  return id;
}

std::vector<DocumentId> LocalStore::list() const {
  std::vector<DocumentId> ids;
  std::error_code ec;
  for(fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if(!it->is_regular_file(ec)) continue;
    if(auto id = id_from_filename(it->path().filename().string())) {
      ids.push_back(*id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::optional<std::string> LocalStore::title_of(DocumentId id) const {
  auto content = read(id);
  if(!content) return std::nullopt;
  auto title = extract_title(*content);
  if(title.empty()) title = "RFC " + std::to_string(id);
  return title;
}

std::unique_ptr<LocalStore::Staging> LocalStore::begin_staging(DocumentId id, std::string& error) {
  if(!ensure_root(error)) return nullptr;
  auto name = "rfc" + std::to_string(id) + ".txt." + std::to_string(getpid()) + "." +
              std::to_string(staging_counter_.fetch_add(1)) + ".part";
  std::unique_ptr<Staging> staging(new Staging(staging_dir() / name, path_for(id)));
  if(!staging->out_) {
    error = "cannot open staging file " + (staging_dir() / name).string();
    return nullptr;
  }
  return staging;
}

bool LocalStore::publish(DocumentId id, const std::string& content, std::string& error) {
  auto staging = begin_staging(id, error);
  if(!staging) return false;
  if(!staging->write(content.data(), content.size())) {
    error = "failed writing staging file for rfc" + std::to_string(id);
    return false;
  }
  return staging->commit(error);
}
