#pragma once

#include <zlib.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "utils.hpp"

// Streams bytes through one gzip compressor into a file. The SHA-256 of the
// compressed output is computed on the fly.
class GzipWriter {
public:
  explicit GzipWriter(const std::filesystem::path& path, int level = Z_DEFAULT_COMPRESSION);
  ~GzipWriter();
  GzipWriter(const GzipWriter&) = delete;
  GzipWriter& operator=(const GzipWriter&) = delete;

  void write(const void* data, std::size_t size);
  void write(const std::string& data) { write(data.data(), data.size()); }

  // Flushes the trailer and closes the file.
  void finish();

  const std::string& checksum() const { return checksum_; }
  uint64_t compressed_size() const { return compressed_size_; }

private:
  void pump(int flush);

  std::filesystem::path path_;
  std::ofstream out_;
  z_stream strm_{};
  bool initialized_ = false;
  bool finished_ = false;
  Sha256Stream hasher_;
  std::vector<unsigned char> out_buf_;
  uint64_t compressed_size_ = 0;
  std::string checksum_;
};

// Pull-based gzip decoder. Corrupt or truncated input raises
// ParcelError(CorruptBundle).
class GzipReader {
public:
  explicit GzipReader(const std::filesystem::path& path);
  ~GzipReader();
  GzipReader(const GzipReader&) = delete;
  GzipReader& operator=(const GzipReader&) = delete;

  // Returns the number of bytes produced; 0 only at end of stream.
  std::size_t read(void* data, std::size_t size);

  // False when the stream ends before `size` bytes were produced.
  bool read_exact(void* data, std::size_t size);

private:
  std::filesystem::path path_;
  std::ifstream in_;
  z_stream strm_{};
  bool initialized_ = false;
  bool stream_end_ = false;
  std::vector<unsigned char> in_buf_;
};
