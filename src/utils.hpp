#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string hex_from_bytes(const unsigned char* data, std::size_t size);
// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<unsigned char> bytes_from_hex(const std::string& hex);

std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::string sha256_hex(const unsigned char* data, std::size_t size);
std::string sha256_file_hex(const std::filesystem::path& path);

// Incremental SHA-256 over EVP.
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();
  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const void* data, std::size_t size);
  std::string finish_hex();

private:
  struct evp_md_ctx_st* ctx_;
  bool finished_ = false;
};

std::string random_hex(std::size_t byte_count);

std::string base64_encode(const unsigned char* data, std::size_t size);
std::string base64_encode(const std::string& data);
// Throws std::invalid_argument on malformed input.
std::vector<unsigned char> base64_decode(const std::string& text);

int64_t now_ms();
// |a - b| without signed overflow for any pair of values.
uint64_t ms_between(int64_t a, int64_t b);
std::string iso8601_from_ms(int64_t ms);

void put_u32_be(std::string& out, uint32_t value);
void put_u64_be(std::string& out, uint64_t value);
uint32_t get_u32_be(const unsigned char* p);
uint64_t get_u64_be(const unsigned char* p);

std::string trim_copy(std::string value);
std::vector<std::string> split_words(const std::string& line);
