#include "utils.hpp"
#include <openssl/sha.h>
#include <unistd.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(const std::string& data){
    std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return hex_from_bytes(digest);
}

Sha256Stream::Sha256Stream(){
    if(SHA256_Init(&ctx_) != 1) throw std::runtime_error("SHA256_Init failed");
}

bool Sha256Stream::update(const char* data, std::size_t size){
    return SHA256_Update(&ctx_, reinterpret_cast<const unsigned char*>(data), size) == 1;
}

std::optional<std::string> Sha256Stream::hex_digest(){
    std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
    if(SHA256_Final(digest.data(), &ctx_) != 1) return std::nullopt;
    return hex_from_bytes(digest);
}

std::string default_peer_name(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "peer-" + std::to_string(getpid());
    }
    std::ostringstream oss;
    oss << hostname << "-" << getpid();
    return oss.str();
}
