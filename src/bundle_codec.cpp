#include "bundle_codec.hpp"

#include "errors.hpp"
#include "gzip_stream.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

std::string glob_to_regex(const std::string& glob) {
  static const std::string specials = "\\^$.|?+()[]{}";
  std::string body;
  for(char c : glob) {
    if(c == '*') {
      body += "[^/]*";
    } else {
      if(specials.find(c) != std::string::npos) body += '\\';
      body += c;
    }
  }
  return "(^|/)" + body + "(/|$)";
}

bool is_safe_record_path(const std::string& path) {
  if(path.empty() || path.front() == '/') return false;
  if(path.find('\0') != std::string::npos) return false;
  std::size_t start = 0;
  while(start <= path.size()) {
    auto end = path.find('/', start);
    if(end == std::string::npos) end = path.size();
    if(path.compare(start, end - start, "..") == 0 && end - start == 2) return false;
    start = end + 1;
  }
  return true;
}

bool directory_has_entries(const fs::path& dir) {
  std::error_code ec;
  if(!fs::exists(dir, ec)) return false;
  if(!fs::is_directory(dir, ec)) return true;
  return fs::directory_iterator(dir, ec) != fs::directory_iterator();
}

// Removes a directory tree on scope exit.
struct ScopedDirectory {
  fs::path path;
  ~ScopedDirectory() {
    if(path.empty()) return;
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

void copy_exact(GzipReader& reader, std::ofstream& out, uint64_t size, const std::string& record) {
  std::vector<char> buf(kCopyBufferSize);
  uint64_t remaining = size;
  while(remaining > 0) {
    std::size_t step = static_cast<std::size_t>(std::min<uint64_t>(remaining, buf.size()));
    if(!reader.read_exact(buf.data(), step)) {
      throw ParcelError(ErrorCode::CorruptBundle,
                        "declared length of '" + record + "' exceeds the remaining stream");
    }
    out.write(buf.data(), static_cast<std::streamsize>(step));
    if(!out) throw std::runtime_error("write failed for " + record);
    remaining -= step;
  }
}

uint32_t read_u32(GzipReader& reader, const char* what) {
  std::array<unsigned char, 4> raw{};
  if(!reader.read_exact(raw.data(), raw.size())) {
    throw ParcelError(ErrorCode::CorruptBundle, std::string("bundle ended while reading ") + what);
  }
  return get_u32_be(raw.data());
}

uint64_t read_u64(GzipReader& reader, const char* what) {
  std::array<unsigned char, 8> raw{};
  if(!reader.read_exact(raw.data(), raw.size())) {
    throw ParcelError(ErrorCode::CorruptBundle, std::string("bundle ended while reading ") + what);
  }
  return get_u64_be(raw.data());
}

struct BundleHeader {
  Manifest manifest;
  uint32_t file_count = 0;
};

BundleHeader read_header(GzipReader& reader) {
  BundleHeader header;
  uint32_t manifest_len = read_u32(reader, "manifest length");
  if(manifest_len > kMaxManifestBytes) {
    throw ParcelError(ErrorCode::CorruptBundle,
                      "manifest length " + std::to_string(manifest_len) + " exceeds the 1 MiB cap");
  }
  std::string raw(manifest_len, '\0');
  if(!reader.read_exact(raw.data(), raw.size())) {
    throw ParcelError(ErrorCode::CorruptBundle, "bundle ended inside the manifest");
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(raw);
  } catch(const nlohmann::json::exception& e) {
    throw ParcelError(ErrorCode::CorruptBundle, std::string("manifest is not valid JSON: ") + e.what());
  }
  if(!doc.is_object()) {
    throw ParcelError(ErrorCode::InvalidManifest, "manifest must be a JSON object");
  }
  header.manifest = doc.get<Manifest>();
  validate_manifest(header.manifest);
  header.file_count = read_u32(reader, "file count");
  return header;
}

} // namespace

ExclusionRules::ExclusionRules(const std::vector<std::string>& extra) {
  patterns_ = defaults();
  patterns_.insert(patterns_.end(), extra.begin(), extra.end());
  for(const auto& pattern : patterns_) {
    if(pattern.empty()) continue;
    if(pattern.find('*') != std::string::npos) {
      globs_.push_back(Glob{pattern, std::regex(glob_to_regex(pattern))});
    } else {
      std::string literal = pattern;
      while(literal.size() > 1 && literal.back() == '/') literal.pop_back();
      literals_.push_back(std::move(literal));
    }
  }
}

const std::vector<std::string>& ExclusionRules::defaults() {
  static const std::vector<std::string> kDefaults = {
    "node_modules", ".git", ".DS_Store", "dist", "build", "target", "*.log",
    ".env", ".env.local", "coverage", ".nyc_output", ".cache", "tmp", "temp"
  };
  return kDefaults;
}

bool ExclusionRules::excluded(const std::string& relative_path) const {
  for(const auto& literal : literals_) {
    if(relative_path == literal) return true;
  }
  for(const auto& literal : literals_) {
    if(relative_path.size() > literal.size() &&
       relative_path.compare(0, literal.size(), literal) == 0 &&
       relative_path[literal.size()] == '/') {
      return true;
    }
  }
  for(const auto& glob : globs_) {
    if(std::regex_search(relative_path, glob.regex)) return true;
  }
  return false;
}

BundleCodec::BundleCodec(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

std::size_t BundleCodec::chunk_count(uint64_t size, std::size_t chunk_size) {
  if(chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
  return static_cast<std::size_t>((size + chunk_size - 1) / chunk_size);
}

std::vector<std::string> BundleCodec::list_project_files(const fs::path& project_root,
                                                         const ExclusionRules& rules) {
  std::error_code ec;
  if(!fs::is_directory(project_root, ec)) {
    throw std::runtime_error("project root is not a directory: " + project_root.string());
  }
  std::vector<std::string> files;
  fs::recursive_directory_iterator it(project_root, fs::directory_options::none, ec);
  if(ec) throw std::runtime_error("unable to scan " + project_root.string() + ": " + ec.message());
  for(; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if(ec) throw std::runtime_error("scan failed under " + project_root.string() + ": " + ec.message());
    const auto& entry = *it;
    auto relative = entry.path().lexically_relative(project_root).generic_string();
    auto status = entry.symlink_status(ec);
    if(ec) continue;
    if(rules.excluded(relative)) {
      if(fs::is_directory(status)) it.disable_recursion_pending();
      log_debug(logger_.get(), "excluded {}", relative);
      continue;
    }
    if(fs::is_symlink(status)) {
      log_debug(logger_.get(), "skipping symlink {}", relative);
      continue;
    }
    if(fs::is_regular_file(status)) files.push_back(std::move(relative));
  }
  std::sort(files.begin(), files.end());
  return files;
}

BundleResult BundleCodec::create_bundle(const BundleOptions& options) {
  validate_manifest(options.manifest);
  if(options.output_path.empty()) throw std::invalid_argument("bundle output path is empty");

  nlohmann::json manifest_json = options.manifest;
  std::string manifest_text = manifest_json.dump();
  if(manifest_text.size() > kMaxManifestBytes) {
    throw ParcelError(ErrorCode::InvalidManifest, "manifest exceeds the 1 MiB cap");
  }

  ExclusionRules rules(options.exclude);
  auto files = list_project_files(options.project_root, rules);

  std::error_code ec;
  if(options.output_path.has_parent_path()) {
    fs::create_directories(options.output_path.parent_path(), ec);
  }
  fs::path partial = options.output_path;
  partial += ".partial";

  BundleResult result;
  try {
    GzipWriter writer(partial, options.compression_level);
    std::string header;
    put_u32_be(header, static_cast<uint32_t>(manifest_text.size()));
    header += manifest_text;
    put_u32_be(header, static_cast<uint32_t>(files.size()));
    writer.write(header);

    std::vector<char> buf(kCopyBufferSize);
    for(const auto& relative : files) {
      auto full = options.project_root / fs::path(relative);
      uint64_t size = fs::file_size(full);
      std::string record;
      put_u32_be(record, static_cast<uint32_t>(relative.size()));
      record += relative;
      put_u64_be(record, size);
      writer.write(record);

      std::ifstream in(full, std::ios::binary);
      if(!in) throw std::runtime_error("unable to open " + full.string());
      uint64_t remaining = size;
      while(remaining > 0) {
        std::size_t step = static_cast<std::size_t>(std::min<uint64_t>(remaining, buf.size()));
        in.read(buf.data(), static_cast<std::streamsize>(step));
        if(static_cast<std::size_t>(in.gcount()) != step) {
          throw std::runtime_error(full.string() + " changed size while bundling");
        }
        writer.write(buf.data(), step);
        remaining -= step;
      }
    }
    writer.finish();
    result.checksum = writer.checksum();
    result.size = writer.compressed_size();
    fs::rename(partial, options.output_path);
  } catch(const std::exception&) {
    fs::remove(partial, ec);
    throw;
  }

  result.path = options.output_path;
  result.file_count = files.size();
  result.files = std::move(files);
  log_info(logger_.get(), "bundled {} files from {} into {} ({} bytes, sha256 {})",
           result.file_count, options.project_root.string(), result.path.string(),
           result.size, result.checksum);
  return result;
}

ExtractResult BundleCodec::extract_bundle(const ExtractOptions& options) {
  if(options.destination.empty()) throw std::invalid_argument("extraction destination is empty");
  if(!options.overwrite && directory_has_entries(options.destination)) {
    throw ParcelError(ErrorCode::DestinationConflict,
                      "destination " + options.destination.string() + " is not empty");
  }

  GzipReader reader(options.bundle_path);
  auto header = read_header(reader);

  fs::path destination = fs::absolute(options.destination).lexically_normal();
  if(destination.filename().empty()) destination = destination.parent_path();
  ScopedDirectory staging;
  staging.path = destination.parent_path() /
                 ("." + destination.filename().string() + ".staging-" + random_hex(4));
  fs::create_directories(staging.path);

  ExtractResult result;
  result.manifest = header.manifest;
  for(uint32_t i = 0; i < header.file_count; ++i) {
    uint32_t path_len = read_u32(reader, "path length");
    if(path_len == 0 || path_len > kMaxRecordPathBytes) {
      throw ParcelError(ErrorCode::CorruptBundle,
                        "record path length " + std::to_string(path_len) + " is out of range");
    }
    std::string relative(path_len, '\0');
    if(!reader.read_exact(relative.data(), relative.size())) {
      throw ParcelError(ErrorCode::CorruptBundle, "bundle ended inside a record path");
    }
    if(!is_safe_record_path(relative)) {
      throw ParcelError(ErrorCode::CorruptBundle, "record path escapes the destination: " + relative);
    }
    uint64_t size = read_u64(reader, "file size");

    auto target = staging.path / fs::path(relative);
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if(!out) throw std::runtime_error("unable to create " + target.string());
    copy_exact(reader, out, size, relative);
    out.close();

    result.total_bytes += size;
    result.files.push_back(std::move(relative));
  }
  char extra = 0;
  if(reader.read(&extra, 1) != 0) {
    throw ParcelError(ErrorCode::CorruptBundle,
                      "bundle holds data past its " + std::to_string(header.file_count) + " declared records");
  }

  fs::create_directories(destination);
  for(const auto& relative : result.files) {
    auto from = staging.path / fs::path(relative);
    auto to = destination / fs::path(relative);
    std::error_code ec;
    if(!fs::exists(from, ec)) continue;  // duplicate record already moved
    fs::create_directories(to.parent_path());
    if(fs::exists(to, ec)) fs::remove_all(to);
    fs::rename(from, to);
  }
  if(options.write_manifest_file) {
    std::ofstream out(destination / "parcel.json", std::ios::trunc);
    if(!out) throw std::runtime_error("unable to write parcel.json");
    nlohmann::json j = result.manifest;
    out << j.dump(2);
  }

  result.file_count = result.files.size();
  log_info(logger_.get(), "extracted {} files ({} bytes) into {}",
           result.file_count, result.total_bytes, destination.string());
  return result;
}

ValidationResult BundleCodec::validate_bundle(const fs::path& bundle_path) {
  ValidationResult result;
  try {
    GzipReader reader(bundle_path);
    auto header = read_header(reader);
    result.valid = true;
    result.manifest = std::move(header.manifest);
    result.file_count = header.file_count;
  } catch(const ParcelError& e) {
    result.error = std::string(error_code_name(e.code())) + ": " + e.what();
  } catch(const std::exception& e) {
    result.error = e.what();
  }
  if(!result.valid) {
    log_debug(logger_.get(), "bundle {} failed validation: {}", bundle_path.string(), result.error);
  }
  return result;
}

std::vector<BundleChunk> BundleCodec::split_chunks(const fs::path& bundle_path, std::size_t chunk_size) {
  uint64_t size = fs::file_size(bundle_path);
  std::size_t count = chunk_count(size, chunk_size);
  std::ifstream in(bundle_path, std::ios::binary);
  if(!in) throw std::runtime_error("unable to open " + bundle_path.string());

  std::vector<BundleChunk> chunks;
  chunks.reserve(count);
  std::vector<char> buf(kCopyBufferSize);
  for(std::size_t index = 0; index < count; ++index) {
    BundleChunk chunk;
    chunk.index = index;
    chunk.offset = static_cast<uint64_t>(index) * chunk_size;
    chunk.size = std::min<uint64_t>(chunk_size, size - chunk.offset);
    Sha256Stream hasher;
    uint64_t remaining = chunk.size;
    while(remaining > 0) {
      std::size_t step = static_cast<std::size_t>(std::min<uint64_t>(remaining, buf.size()));
      in.read(buf.data(), static_cast<std::streamsize>(step));
      if(static_cast<std::size_t>(in.gcount()) != step) {
        throw std::runtime_error("short read while chunking " + bundle_path.string());
      }
      hasher.update(buf.data(), step);
      remaining -= step;
    }
    chunk.checksum = hasher.finish_hex();
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::string BundleCodec::read_chunk(const fs::path& bundle_path, std::size_t index, std::size_t chunk_size) {
  uint64_t size = fs::file_size(bundle_path);
  if(index >= chunk_count(size, chunk_size)) {
    throw std::out_of_range("chunk " + std::to_string(index) + " is past the end of " + bundle_path.string());
  }
  uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
  std::size_t length = static_cast<std::size_t>(std::min<uint64_t>(chunk_size, size - offset));
  std::ifstream in(bundle_path, std::ios::binary);
  if(!in) throw std::runtime_error("unable to open " + bundle_path.string());
  in.seekg(static_cast<std::streamoff>(offset));
  std::string data(length, '\0');
  in.read(data.data(), static_cast<std::streamsize>(length));
  if(static_cast<std::size_t>(in.gcount()) != length) {
    throw std::runtime_error("short read of chunk " + std::to_string(index));
  }
  return data;
}

uint64_t BundleCodec::estimate_bundle_size(const fs::path& project_root,
                                           const std::vector<std::string>& extra_excludes) {
  ExclusionRules rules(extra_excludes);
  uint64_t total = 0;
  for(const auto& relative : list_project_files(project_root, rules)) {
    std::error_code ec;
    auto size = fs::file_size(project_root / fs::path(relative), ec);
    if(!ec) total += size;
  }
  return static_cast<uint64_t>(std::floor(static_cast<double>(total) * kEstimatedCompressionRatio));
}
