#include "hashing.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::string sha256_hex(const std::string& data){
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.final_hex();
}

Sha256::Sha256(){
    if(SHA256_Init(&ctx_) != 1) throw std::runtime_error("SHA256_Init failed");
}

void Sha256::update(const char* data, std::size_t size){
    if(finished_) throw std::logic_error("Sha256::update after final_hex");
    if(size == 0) return;
    if(SHA256_Update(&ctx_, reinterpret_cast<const unsigned char*>(data), size) != 1){
        throw std::runtime_error("SHA256_Update failed");
    }
}

std::string Sha256::final_hex(){
    if(finished_) throw std::logic_error("Sha256::final_hex called twice");
    unsigned char digest[SHA256_DIGEST_LENGTH];
    if(SHA256_Final(digest, &ctx_) != 1) throw std::runtime_error("SHA256_Final failed");
    finished_ = true;
    return hex_from_bytes(digest, SHA256_DIGEST_LENGTH);
}

std::optional<std::string> sha256_file(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    Sha256 hasher;
    std::array<char, 64 * 1024> buffer{};
    while(in){
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read > 0) hasher.update(buffer.data(), static_cast<std::size_t>(read));
    }
    if(in.bad()) return std::nullopt;
    return hasher.final_hex();
}
