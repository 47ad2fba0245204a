#pragma once

#include <zlib.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "log.hpp"
#include "manifest.hpp"

inline constexpr std::size_t kDefaultChunkSize = 4 * 1024 * 1024;
inline constexpr uint32_t kMaxManifestBytes = 1024 * 1024;
inline constexpr uint32_t kMaxRecordPathBytes = 4096;
inline constexpr double kEstimatedCompressionRatio = 0.65;

// Ordered exclusion rules: exact path, directory prefix, then `*` glob.
class ExclusionRules {
public:
  explicit ExclusionRules(const std::vector<std::string>& extra = {});

  static const std::vector<std::string>& defaults();

  // `relative_path` uses '/' separators and no leading slash.
  bool excluded(const std::string& relative_path) const;

  const std::vector<std::string>& patterns() const { return patterns_; }

private:
  struct Glob {
    std::string pattern;
    std::regex regex;
  };

  std::vector<std::string> patterns_;
  std::vector<std::string> literals_;
  std::vector<Glob> globs_;
};

struct BundleOptions {
  std::filesystem::path project_root;
  Manifest manifest;
  std::filesystem::path output_path;
  std::vector<std::string> exclude;       // added to the baseline list
  int compression_level = Z_DEFAULT_COMPRESSION;
};

struct BundleResult {
  std::filesystem::path path;
  uint64_t size = 0;
  std::string checksum;                   // sha256 hex of the compressed file
  std::size_t file_count = 0;
  std::vector<std::string> files;         // relative paths in stream order
};

struct ExtractOptions {
  std::filesystem::path bundle_path;
  std::filesystem::path destination;
  bool overwrite = false;
  bool write_manifest_file = false;       // drops parcel.json beside the files
};

struct ExtractResult {
  Manifest manifest;
  std::size_t file_count = 0;
  uint64_t total_bytes = 0;
  std::vector<std::string> files;
};

struct ValidationResult {
  bool valid = false;
  std::optional<Manifest> manifest;
  std::size_t file_count = 0;
  std::string error;
};

struct BundleChunk {
  std::size_t index = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  std::string checksum;
};

class BundleCodec {
public:
  explicit BundleCodec(std::shared_ptr<Logger> logger = nullptr);

  // Throws ParcelError(InvalidManifest) before touching the output.
  BundleResult create_bundle(const BundleOptions& options);

  // Throws ParcelError(DestinationConflict | CorruptBundle | InvalidManifest).
  ExtractResult extract_bundle(const ExtractOptions& options);

  // Reads only the header; never throws.
  ValidationResult validate_bundle(const std::filesystem::path& bundle_path);

  std::vector<BundleChunk> split_chunks(const std::filesystem::path& bundle_path,
                                        std::size_t chunk_size = kDefaultChunkSize);

  // Throws std::out_of_range when `index` is past the last chunk.
  std::string read_chunk(const std::filesystem::path& bundle_path,
                         std::size_t index,
                         std::size_t chunk_size = kDefaultChunkSize);

  uint64_t estimate_bundle_size(const std::filesystem::path& project_root,
                                const std::vector<std::string>& extra_excludes = {});

  // Sorted relative paths of the files an encode would include.
  std::vector<std::string> list_project_files(const std::filesystem::path& project_root,
                                              const ExclusionRules& rules);

  static std::size_t chunk_count(uint64_t size, std::size_t chunk_size = kDefaultChunkSize);

private:
  std::shared_ptr<Logger> logger_;
};
