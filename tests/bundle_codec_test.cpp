#include "bundle_codec.hpp"
#include "errors.hpp"
#include "gzip_stream.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using parcel::test::TestContext;
using parcel::test::TempWorkspace;
using parcel::test::read_file;
using parcel::test::write_file;

std::string random_bytes(std::size_t count, unsigned seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string out(count, '\0');
  for(auto& c : out) c = static_cast<char>(dist(rng));
  return out;
}

// Hand-assembles a bundle stream so tests can produce hostile records.
void write_raw_bundle(const fs::path& path,
                      const std::string& manifest_json,
                      const std::vector<std::pair<std::string, std::string>>& records,
                      std::size_t declared_count,
                      const std::string& trailing = {}) {
  GzipWriter writer(path);
  std::string header;
  put_u32_be(header, static_cast<uint32_t>(manifest_json.size()));
  header += manifest_json;
  put_u32_be(header, static_cast<uint32_t>(declared_count));
  writer.write(header);
  for(const auto& record : records) {
    std::string r;
    put_u32_be(r, static_cast<uint32_t>(record.first.size()));
    r += record.first;
    put_u64_be(r, record.second.size());
    r += record.second;
    writer.write(r);
  }
  if(!trailing.empty()) writer.write(trailing);
  writer.finish();
}

std::string manifest_text() {
  nlohmann::json j = parcel::test::sample_manifest();
  return j.dump();
}

bool test_create_and_extract(TestContext& ctx) {
  TempWorkspace ws("codec_roundtrip");
  auto project = ws / "project";
  parcel::test::make_sample_project(project);
  BundleCodec codec;

  BundleOptions options;
  options.project_root = project;
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "out" / "sample.bundle";
  auto result = codec.create_bundle(options);

  PARCEL_CHECK(fs::exists(result.path));
  PARCEL_CHECK(!fs::exists(ws / "out" / "sample.bundle.partial"));
  PARCEL_CHECK(result.size == fs::file_size(result.path));
  PARCEL_CHECK(result.checksum == sha256_file_hex(result.path));
  PARCEL_CHECK(result.file_count == 4);
  std::vector<std::string> expected = {"README.md", "package.json", "src/index.js", "src/lib/util.js"};
  PARCEL_CHECK(result.files == expected);

  ExtractOptions extract;
  extract.bundle_path = result.path;
  extract.destination = ws / "extracted";
  auto extracted = codec.extract_bundle(extract);
  PARCEL_CHECK(extracted.file_count == 4);
  PARCEL_CHECK(extracted.manifest.name == "sample-app");
  PARCEL_CHECK(extracted.manifest.version == "1.2.3");
  PARCEL_CHECK(extracted.manifest.ports == std::vector<uint16_t>{3000});
  for(const auto& relative : expected) {
    PARCEL_CHECK(read_file(ws / "extracted" / relative) == read_file(project / relative));
  }
  PARCEL_CHECK(!fs::exists(ws / "extracted" / "node_modules"));
  PARCEL_CHECK(!fs::exists(ws / "extracted" / ".git"));
  PARCEL_CHECK(!fs::exists(ws / "extracted" / "debug.log"));
  PARCEL_CHECK(!fs::exists(ws / "extracted" / "parcel.json"));
  if(ctx.verbose) std::cout << "bundle " << result.size << " bytes ";
  return true;
}

bool test_empty_project_and_manifest_file(TestContext&) {
  TempWorkspace ws("codec_empty");
  fs::create_directories(ws / "empty");
  BundleCodec codec;

  BundleOptions options;
  options.project_root = ws / "empty";
  options.manifest = parcel::test::sample_manifest();
  options.manifest.extra["x-team"] = "platform";
  options.output_path = ws / "empty.bundle";
  auto result = codec.create_bundle(options);
  PARCEL_CHECK(result.file_count == 0);

  ExtractOptions extract;
  extract.bundle_path = result.path;
  extract.destination = ws / "dest";
  extract.write_manifest_file = true;
  auto extracted = codec.extract_bundle(extract);
  PARCEL_CHECK(extracted.file_count == 0);
  PARCEL_CHECK(extracted.manifest.extra.value("x-team", "") == "platform");
  PARCEL_CHECK(fs::exists(ws / "dest" / "parcel.json"));
  auto written = load_manifest_file((ws / "dest" / "parcel.json").string());
  PARCEL_CHECK(written.name == "sample-app");
  return true;
}

bool test_exclusion_rules(TestContext&) {
  ExclusionRules rules({"secrets", "docs/*.md"});
  PARCEL_CHECK(rules.excluded("node_modules"));
  PARCEL_CHECK(rules.excluded("node_modules/left-pad/index.js"));
  PARCEL_CHECK(rules.excluded(".git/HEAD"));
  PARCEL_CHECK(rules.excluded("server.log"));
  PARCEL_CHECK(rules.excluded("logs/app.log"));
  PARCEL_CHECK(rules.excluded(".env"));
  PARCEL_CHECK(rules.excluded("secrets"));
  PARCEL_CHECK(rules.excluded("secrets/key.pem"));
  PARCEL_CHECK(rules.excluded("docs/intro.md"));
  PARCEL_CHECK(!rules.excluded("distribution/readme.txt"));
  PARCEL_CHECK(!rules.excluded("src/index.js"));
  PARCEL_CHECK(!rules.excluded("catalog.txt"));
  PARCEL_CHECK(!rules.excluded(".envrc"));
  PARCEL_CHECK(rules.excluded("app.log"));
  PARCEL_CHECK(!rules.excluded("app.logger"));
  PARCEL_CHECK(rules.patterns().size() == ExclusionRules::defaults().size() + 2);
  return true;
}

bool test_extra_excludes_apply(TestContext&) {
  TempWorkspace ws("codec_exclude");
  auto project = ws / "project";
  parcel::test::make_sample_project(project);
  BundleCodec codec;
  BundleOptions options;
  options.project_root = project;
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "b.bundle";
  options.exclude = {"src/lib"};
  auto result = codec.create_bundle(options);
  std::vector<std::string> expected = {"README.md", "package.json", "src/index.js"};
  PARCEL_CHECK(result.files == expected);
  return true;
}

bool test_deterministic_output(TestContext&) {
  TempWorkspace ws("codec_determinism");
  auto project = ws / "project";
  parcel::test::make_sample_project(project);
  BundleCodec codec;
  BundleOptions options;
  options.project_root = project;
  options.manifest = parcel::test::sample_manifest();

  options.output_path = ws / "first.bundle";
  auto first = codec.create_bundle(options);
  options.output_path = ws / "second.bundle";
  auto second = codec.create_bundle(options);
  PARCEL_CHECK(first.checksum == second.checksum);
  PARCEL_CHECK(read_file(first.path) == read_file(second.path));
  return true;
}

bool test_excluded_cache_directory(TestContext&) {
  TempWorkspace ws("codec_cache");
  auto project = ws / "project";
  write_file(project / "cache" / "a.txt", std::string(10, 'a'));
  write_file(project / "cache" / "b.bin", "");
  auto keep = random_bytes(1024 * 1024, 7);
  write_file(project / "keep.txt", keep);

  BundleCodec codec;
  BundleOptions options;
  options.project_root = project;
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "cache.bundle";
  options.exclude = {"cache"};
  auto result = codec.create_bundle(options);
  PARCEL_CHECK(result.file_count == 1);
  auto validation = codec.validate_bundle(result.path);
  PARCEL_CHECK(validation.valid);
  PARCEL_CHECK(validation.file_count == 1);

  ExtractOptions extract;
  extract.bundle_path = result.path;
  extract.destination = ws / "dest";
  auto extracted = codec.extract_bundle(extract);
  PARCEL_CHECK(extracted.files == std::vector<std::string>{"keep.txt"});
  PARCEL_CHECK(read_file(ws / "dest" / "keep.txt") == keep);
  PARCEL_CHECK(!fs::exists(ws / "dest" / "cache"));
  return true;
}

bool test_invalid_manifest_rejected(TestContext&) {
  TempWorkspace ws("codec_manifest");
  parcel::test::make_sample_project(ws / "project");
  BundleCodec codec;
  BundleOptions options;
  options.project_root = ws / "project";
  options.manifest = parcel::test::sample_manifest();
  options.manifest.run.clear();
  options.output_path = ws / "bad.bundle";
  try {
    codec.create_bundle(options);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::InvalidManifest);
    PARCEL_CHECK(std::string(e.what()).find("run") != std::string::npos);
  }
  PARCEL_CHECK(!fs::exists(ws / "bad.bundle"));
  PARCEL_CHECK(!fs::exists(ws / "bad.bundle.partial"));
  return true;
}

bool test_destination_conflict(TestContext&) {
  TempWorkspace ws("codec_conflict");
  parcel::test::make_sample_project(ws / "project");
  BundleCodec codec;
  BundleOptions options;
  options.project_root = ws / "project";
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "b.bundle";
  auto result = codec.create_bundle(options);

  write_file(ws / "dest" / "keep.txt", "existing");
  ExtractOptions extract;
  extract.bundle_path = result.path;
  extract.destination = ws / "dest";
  try {
    codec.extract_bundle(extract);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::DestinationConflict);
  }
  PARCEL_CHECK(!fs::exists(ws / "dest" / "README.md"));

  extract.overwrite = true;
  auto extracted = codec.extract_bundle(extract);
  PARCEL_CHECK(extracted.file_count == 4);
  PARCEL_CHECK(fs::exists(ws / "dest" / "README.md"));
  PARCEL_CHECK(read_file(ws / "dest" / "keep.txt") == "existing");
  return true;
}

bool test_corrupt_input(TestContext&) {
  TempWorkspace ws("codec_corrupt");
  BundleCodec codec;
  write_file(ws / "garbage.bundle", "this is not a gzip stream at all");
  ExtractOptions extract;
  extract.bundle_path = ws / "garbage.bundle";
  extract.destination = ws / "dest";
  try {
    codec.extract_bundle(extract);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::CorruptBundle);
  }
  auto validation = codec.validate_bundle(ws / "garbage.bundle");
  PARCEL_CHECK(!validation.valid);
  PARCEL_CHECK(!validation.error.empty());

  // A valid bundle cut in half.
  parcel::test::make_sample_project(ws / "project");
  write_file(ws / "project" / "blob.bin", random_bytes(64 * 1024, 7));
  BundleOptions options;
  options.project_root = ws / "project";
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "full.bundle";
  auto result = codec.create_bundle(options);
  auto bytes = read_file(result.path);
  write_file(ws / "half.bundle", bytes.substr(0, bytes.size() / 2));
  extract.bundle_path = ws / "half.bundle";
  try {
    codec.extract_bundle(extract);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::CorruptBundle);
  }
  PARCEL_CHECK(!fs::exists(ws / "dest"));
  return true;
}

bool test_declared_length_overrun(TestContext&) {
  TempWorkspace ws("codec_overrun");
  BundleCodec codec;
  write_raw_bundle(ws / "short.bundle", manifest_text(), {{"a.txt", "abc"}}, 2);
  ExtractOptions extract;
  extract.bundle_path = ws / "short.bundle";
  extract.destination = ws / "dest";
  try {
    codec.extract_bundle(extract);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::CorruptBundle);
  }
  PARCEL_CHECK(!fs::exists(ws / "dest" / "a.txt"));
  return true;
}

bool test_data_past_last_record(TestContext&) {
  TempWorkspace ws("codec_trailing");
  BundleCodec codec;
  write_raw_bundle(ws / "undercount.bundle", manifest_text(), {{"a.txt", "abc"}, {"b.txt", "def"}}, 1);
  write_raw_bundle(ws / "junk.bundle", manifest_text(), {{"a.txt", "abc"}}, 1, "JUNK");
  write_raw_bundle(ws / "exact.bundle", manifest_text(), {{"a.txt", "abc"}}, 1);

  for(const auto* name : {"undercount.bundle", "junk.bundle"}) {
    ExtractOptions extract;
    extract.bundle_path = ws / name;
    extract.destination = ws / (std::string("dest_") + name);
    try {
      codec.extract_bundle(extract);
      std::cerr << "\n    " << name << " extracted without error\n";
      return false;
    } catch(const ParcelError& e) {
      PARCEL_CHECK(e.code() == ErrorCode::CorruptBundle);
    }
    PARCEL_CHECK(!fs::exists(extract.destination / "a.txt"));
  }

  ExtractOptions extract;
  extract.bundle_path = ws / "exact.bundle";
  extract.destination = ws / "dest_exact";
  auto result = codec.extract_bundle(extract);
  PARCEL_CHECK(result.file_count == 1);
  PARCEL_CHECK(read_file(ws / "dest_exact" / "a.txt") == "abc");
  return true;
}

bool test_path_traversal_rejected(TestContext&) {
  TempWorkspace ws("codec_traversal");
  BundleCodec codec;
  write_raw_bundle(ws / "evil.bundle", manifest_text(),
                   {{"ok.txt", "fine"}, {"../escaped.txt", "gotcha"}}, 2);
  ExtractOptions extract;
  extract.bundle_path = ws / "evil.bundle";
  extract.destination = ws / "dest";
  try {
    codec.extract_bundle(extract);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::CorruptBundle);
  }
  PARCEL_CHECK(!fs::exists(ws / "escaped.txt"));
  PARCEL_CHECK(!fs::exists(ws / "dest" / "ok.txt"));

  write_raw_bundle(ws / "abs.bundle", manifest_text(), {{"/etc/passwd-copy", "x"}}, 1);
  extract.bundle_path = ws / "abs.bundle";
  PARCEL_CHECK_THROWS(codec.extract_bundle(extract), ParcelError);
  return true;
}

bool test_bad_manifest_in_stream(TestContext&) {
  TempWorkspace ws("codec_stream_manifest");
  BundleCodec codec;
  write_raw_bundle(ws / "nojson.bundle", "{not json", {}, 0);
  auto validation = codec.validate_bundle(ws / "nojson.bundle");
  PARCEL_CHECK(!validation.valid);

  write_raw_bundle(ws / "norun.bundle", "{\"name\":\"a\",\"version\":\"1\",\"language\":\"go\"}", {}, 0);
  ExtractOptions extract;
  extract.bundle_path = ws / "norun.bundle";
  extract.destination = ws / "dest";
  try {
    codec.extract_bundle(extract);
    return false;
  } catch(const ParcelError& e) {
    PARCEL_CHECK(e.code() == ErrorCode::InvalidManifest);
  }
  return true;
}

bool test_validate_bundle(TestContext&) {
  TempWorkspace ws("codec_validate");
  parcel::test::make_sample_project(ws / "project");
  BundleCodec codec;
  BundleOptions options;
  options.project_root = ws / "project";
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "v.bundle";
  codec.create_bundle(options);
  auto validation = codec.validate_bundle(ws / "v.bundle");
  PARCEL_CHECK(validation.valid);
  PARCEL_CHECK(validation.manifest && validation.manifest->name == "sample-app");
  PARCEL_CHECK(validation.file_count == 4);
  PARCEL_CHECK(!codec.validate_bundle(ws / "missing.bundle").valid);
  return true;
}

bool test_chunking(TestContext&) {
  PARCEL_CHECK(BundleCodec::chunk_count(0) == 0);
  PARCEL_CHECK(BundleCodec::chunk_count(1) == 1);
  PARCEL_CHECK(BundleCodec::chunk_count(kDefaultChunkSize) == 1);
  PARCEL_CHECK(BundleCodec::chunk_count(kDefaultChunkSize + 1) == 2);
  PARCEL_CHECK(BundleCodec::chunk_count(500ULL * 1024 * 1024) == 125);
  PARCEL_CHECK_THROWS(BundleCodec::chunk_count(10, 0), std::invalid_argument);

  TempWorkspace ws("codec_chunks");
  write_file(ws / "project" / "blob.bin", random_bytes(10000, 11));
  BundleCodec codec;
  BundleOptions options;
  options.project_root = ws / "project";
  options.manifest = parcel::test::sample_manifest();
  options.output_path = ws / "c.bundle";
  auto result = codec.create_bundle(options);

  const std::size_t chunk_size = 1024;
  auto chunks = codec.split_chunks(result.path, chunk_size);
  PARCEL_CHECK(chunks.size() == BundleCodec::chunk_count(result.size, chunk_size));
  PARCEL_CHECK(chunks.size() > 1);
  std::string joined;
  for(const auto& chunk : chunks) {
    auto data = codec.read_chunk(result.path, chunk.index, chunk_size);
    PARCEL_CHECK(data.size() == chunk.size);
    PARCEL_CHECK(sha256_hex(data) == chunk.checksum);
    PARCEL_CHECK(chunk.offset == joined.size());
    joined += data;
  }
  PARCEL_CHECK(joined == read_file(result.path));
  PARCEL_CHECK(chunks.back().size == result.size - (chunks.size() - 1) * chunk_size);
  PARCEL_CHECK_THROWS(codec.read_chunk(result.path, chunks.size(), chunk_size), std::out_of_range);
  return true;
}

bool test_estimate_size(TestContext&) {
  TempWorkspace ws("codec_estimate");
  write_file(ws / "project" / "a.txt", std::string(1000, 'a'));
  write_file(ws / "project" / "b.txt", std::string(1000, 'b'));
  write_file(ws / "project" / "skip.log", std::string(5000, 'c'));
  BundleCodec codec;
  PARCEL_CHECK(codec.estimate_bundle_size(ws / "project") == 1300);
  PARCEL_CHECK(codec.estimate_bundle_size(ws / "project", {"b.txt"}) == 650);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<parcel::test::TestCase> tests = {
    {"create_and_extract", test_create_and_extract},
    {"empty_project_and_manifest_file", test_empty_project_and_manifest_file},
    {"exclusion_rules", test_exclusion_rules},
    {"extra_excludes_apply", test_extra_excludes_apply},
    {"deterministic_output", test_deterministic_output},
    {"excluded_cache_directory", test_excluded_cache_directory},
    {"invalid_manifest_rejected", test_invalid_manifest_rejected},
    {"destination_conflict", test_destination_conflict},
    {"corrupt_input", test_corrupt_input},
    {"declared_length_overrun", test_declared_length_overrun},
    {"data_past_last_record", test_data_past_last_record},
    {"path_traversal_rejected", test_path_traversal_rejected},
    {"bad_manifest_in_stream", test_bad_manifest_in_stream},
    {"validate_bundle", test_validate_bundle},
    {"chunking", test_chunking},
    {"estimate_size", test_estimate_size},
  };
  return parcel::test::run_test_cases("bundle codec", tests, argc, argv);
}
