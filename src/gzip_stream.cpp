#include "gzip_stream.hpp"

#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

constexpr std::size_t kBufferSize = 64 * 1024;
// 15 bits of window plus 16 selects the gzip wrapper; plus 32 auto-detects on inflate.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kAutoWindowBits = 15 + 32;

} // namespace

GzipWriter::GzipWriter(const std::filesystem::path& path, int level)
  : path_(path),
    out_(path, std::ios::binary | std::ios::trunc),
    out_buf_(kBufferSize) {
  if(!out_) throw std::runtime_error("unable to create " + path.string());
  if(deflateInit2(&strm_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  initialized_ = true;
}

GzipWriter::~GzipWriter() {
  if(initialized_) deflateEnd(&strm_);
}

void GzipWriter::pump(int flush) {
  int ret = Z_OK;
  do {
    strm_.next_out = out_buf_.data();
    strm_.avail_out = static_cast<uInt>(out_buf_.size());
    ret = deflate(&strm_, flush);
    if(ret == Z_STREAM_ERROR) throw std::runtime_error("deflate failed");
    std::size_t produced = out_buf_.size() - strm_.avail_out;
    if(produced > 0) {
      out_.write(reinterpret_cast<const char*>(out_buf_.data()), static_cast<std::streamsize>(produced));
      if(!out_) throw std::runtime_error("write failed for " + path_.string());
      hasher_.update(out_buf_.data(), produced);
      compressed_size_ += produced;
    }
  } while(strm_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
}

void GzipWriter::write(const void* data, std::size_t size) {
  if(finished_) throw std::logic_error("gzip writer already finished");
  auto* p = static_cast<const unsigned char*>(data);
  while(size > 0) {
    uInt step = static_cast<uInt>(std::min<std::size_t>(size, kBufferSize));
    strm_.next_in = const_cast<unsigned char*>(p);
    strm_.avail_in = step;
    pump(Z_NO_FLUSH);
    p += step;
    size -= step;
  }
}

void GzipWriter::finish() {
  if(finished_) return;
  strm_.next_in = nullptr;
  strm_.avail_in = 0;
  pump(Z_FINISH);
  out_.flush();
  if(!out_) throw std::runtime_error("flush failed for " + path_.string());
  out_.close();
  checksum_ = hasher_.finish_hex();
  finished_ = true;
}

GzipReader::GzipReader(const std::filesystem::path& path)
  : path_(path),
    in_(path, std::ios::binary),
    in_buf_(kBufferSize) {
  if(!in_) throw ParcelError(ErrorCode::CorruptBundle, "unable to open bundle " + path.string());
  if(inflateInit2(&strm_, kAutoWindowBits) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  initialized_ = true;
}

GzipReader::~GzipReader() {
  if(initialized_) inflateEnd(&strm_);
}

std::size_t GzipReader::read(void* data, std::size_t size) {
  if(stream_end_ || size == 0) return 0;
  auto* out = static_cast<unsigned char*>(data);
  strm_.next_out = out;
  strm_.avail_out = static_cast<uInt>(std::min<std::size_t>(size, 1u << 30));
  while(strm_.avail_out > 0) {
    if(strm_.avail_in == 0) {
      in_.read(reinterpret_cast<char*>(in_buf_.data()), static_cast<std::streamsize>(in_buf_.size()));
      auto n = in_.gcount();
      if(in_.bad()) throw ParcelError(ErrorCode::CorruptBundle, "read failed for " + path_.string());
      if(n <= 0) {
        throw ParcelError(ErrorCode::CorruptBundle, "bundle stream truncated: " + path_.string());
      }
      strm_.next_in = in_buf_.data();
      strm_.avail_in = static_cast<uInt>(n);
    }
    int ret = inflate(&strm_, Z_NO_FLUSH);
    if(ret == Z_STREAM_END) {
      stream_end_ = true;
      break;
    }
    if(ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
      throw ParcelError(ErrorCode::CorruptBundle,
                        std::string("bundle stream is not valid gzip: ") + (strm_.msg ? strm_.msg : "inflate error"));
    }
  }
  return static_cast<std::size_t>(strm_.next_out - out);
}

bool GzipReader::read_exact(void* data, std::size_t size) {
  auto* p = static_cast<unsigned char*>(data);
  std::size_t total = 0;
  while(total < size) {
    std::size_t n = read(p + total, size - total);
    if(n == 0) return false;
    total += n;
  }
  return true;
}
