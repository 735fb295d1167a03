#pragma once

#include <openssl/sha.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string& data);

// Streaming SHA-256 over OpenSSL's context API.
class Sha256 {
public:
  Sha256();
  void update(const char* data, std::size_t size);
  std::string final_hex();

private:
  SHA256_CTX ctx_;
  bool finished_ = false;
};

// Hash of a file's content, nullopt if it cannot be read.
std::optional<std::string> sha256_file(const std::filesystem::path& file);
