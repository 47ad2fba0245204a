#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::vector<unsigned char> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) throw std::invalid_argument("hex string has odd length");
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("invalid hex character");
    };
    std::vector<unsigned char> out(hex.size() / 2);
    for(std::size_t i = 0; i < out.size(); ++i){
        out[i] = static_cast<unsigned char>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return out;
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_hex(const unsigned char* data, std::size_t size){
    std::array<unsigned char, SHA256_DIGEST_LENGTH> out{};
    SHA256(data, size, out.data());
    return hex_from_bytes(out.data(), out.size());
}

std::string sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("unable to open " + path.string());
    Sha256Stream hasher;
    std::vector<char> buf(64 * 1024);
    while(in){
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if(n > 0) hasher.update(buf.data(), static_cast<std::size_t>(n));
    }
    if(in.bad()) throw std::runtime_error("read failed for " + path.string());
    return hasher.finish_hex();
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP sha256 init failed");
    }
}

Sha256Stream::~Sha256Stream(){
    EVP_MD_CTX_free(ctx_);
}

void Sha256Stream::update(const void* data, std::size_t size){
    if(finished_) throw std::logic_error("sha256 stream already finished");
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_, data, size) != 1) throw std::runtime_error("EVP sha256 update failed");
}

std::string Sha256Stream::finish_hex(){
    if(finished_) throw std::logic_error("sha256 stream already finished");
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx_, md.data(), &len) != 1) throw std::runtime_error("EVP sha256 final failed");
    finished_ = true;
    return hex_from_bytes(md.data(), len);
}

std::string random_hex(std::size_t byte_count){
    std::vector<unsigned char> buf(byte_count);
    if(byte_count > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return hex_from_bytes(buf);
}

std::string base64_encode(const unsigned char* data, std::size_t size){
    std::string out(4 * ((size + 2) / 3), '\0');
    int encoded = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(size));
    out.resize(static_cast<std::size_t>(encoded));
    return out;
}

std::string base64_encode(const std::string& data){
    return base64_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::vector<unsigned char> base64_decode(const std::string& text){
    if(text.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    std::vector<unsigned char> out(3 * text.size() / 4);
    if(text.empty()) return out;
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if(decoded < 0) throw std::invalid_argument("malformed base64");
    std::size_t padding = 0;
    if(text[text.size() - 1] == '=') ++padding;
    if(text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

uint64_t ms_between(int64_t a, int64_t b){
    auto ua = static_cast<uint64_t>(a);
    auto ub = static_cast<uint64_t>(b);
    return a < b ? ub - ua : ua - ub;
}

std::string iso8601_from_ms(int64_t ms){
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return oss.str();
}

void put_u32_be(std::string& out, uint32_t value){
    for(int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<char>((value >> shift) & 0xff));
}

void put_u64_be(std::string& out, uint64_t value){
    for(int shift = 56; shift >= 0; shift -= 8) out.push_back(static_cast<char>((value >> shift) & 0xff));
}

uint32_t get_u32_be(const unsigned char* p){
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

uint64_t get_u64_be(const unsigned char* p){
    uint64_t v = 0;
    for(int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::vector<std::string> split_words(const std::string& line){
    std::istringstream iss(line);
    std::vector<std::string> out;
    std::string word;
    while(iss >> word) out.push_back(word);
    return out;
}
