#pragma once
#include <openssl/sha.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string& data);

// Incremental SHA-256 for data that arrives in pieces.
class Sha256Stream {
public:
  // Throws std::runtime_error when libcrypto cannot set up the context.
  Sha256Stream();

  bool update(const char* data, std::size_t size);
  // Hex digest of everything passed to update().
  std::optional<std::string> hex_digest();

private:
  SHA256_CTX ctx_;
};

// "<hostname>-<pid>", unique enough to tell peers on one machine apart.
std::string default_peer_name();
