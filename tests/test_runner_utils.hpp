#pragma once

#include "log.hpp"
#include "manifest.hpp"
#include "node_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

// Fails the enclosing bool test function, naming the expression.
#define PARCEL_CHECK(cond)                                                      \
  do {                                                                          \
    if(!(cond)) {                                                               \
      std::cerr << "\n    check failed: " #cond " (" << __FILE__ << ":"       \
                << __LINE__ << ")\n";                                           \
      return false;                                                             \
    }                                                                           \
  } while(0)

// Passes when `expr` throws `type`.
#define PARCEL_CHECK_THROWS(expr, type)                                         \
  do {                                                                          \
    bool parcel_thrown_ = false;                                                \
    try { expr; } catch(const type&) { parcel_thrown_ = true; }                 \
    if(!parcel_thrown_) {                                                       \
      std::cerr << "\n    expected " #type " from " #expr " (" << __FILE__      \
                << ":" << __LINE__ << ")\n";                                    \
      return false;                                                             \
    }                                                                           \
  } while(0)

namespace parcel::test {

namespace fs = std::filesystem;

inline void write_file(const fs::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline Manifest sample_manifest(const std::string& name = "sample-app") {
  Manifest m;
  m.name = name;
  m.version = "1.2.3";
  m.language = "node";
  m.run = "npm start";
  m.engines["node"] = ">=18";
  m.ports = {3000};
  m.env = {"NODE_ENV"};
  return m;
}

// A scratch directory removed when the workspace goes out of scope.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& label) {
    static std::atomic<int> counter{0};
    root_ = fs::temp_directory_path() /
            ("parcel_" + label + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::error_code ec;
    fs::remove_all(root_, ec);
    fs::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const fs::path& root() const { return root_; }
  fs::path operator/(const std::string& child) const { return root_ / child; }

private:
  fs::path root_;
};

// A small project tree with a few nested files and some content the
// default exclusion rules drop.
inline void make_sample_project(const fs::path& root) {
  write_file(root / "package.json", "{\"name\":\"sample-app\"}\n");
  write_file(root / "src" / "index.js", "console.log('hello');\n");
  write_file(root / "src" / "lib" / "util.js", "module.exports = 42;\n");
  write_file(root / "README.md", "# sample\n");
  write_file(root / "node_modules" / "left-pad" / "index.js", "module.exports = 0;\n");
  write_file(root / ".git" / "HEAD", "ref: refs/heads/main\n");
  write_file(root / "debug.log", "noise\n");
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Holds the engine's logger, so the capture may outlive the engine.
  void attach(NodeEngine& engine, const std::string& label = std::string()) {
    attach(engine.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Adjustable clock for services that take a Clock functor.
class ManualClock {
public:
  explicit ManualClock(int64_t start_ms = 1700000000000LL) : now_(std::make_shared<std::atomic<int64_t>>(start_ms)) {}

  int64_t now() const { return now_->load(); }
  void advance(int64_t ms) { now_->fetch_add(ms); }
  void set(int64_t ms) { now_->store(ms); }

  std::function<int64_t()> fn() const {
    auto now = now_;
    return [now]{ return now->load(); };
  }

private:
  std::shared_ptr<std::atomic<int64_t>> now_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs every case, printing '.' per pass and the captured log per failure.
// PARCEL_TEST_VERBOSE / -v prints progress; PARCEL_TEST_LOGS shows logs live.
inline int run_test_cases(const std::string& suite,
                          const std::vector<TestCase>& tests,
                          int argc, char** argv) {
  bool verbose = (std::getenv("PARCEL_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("PARCEL_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    if(verbose) std::cout << "\n  " << test.name << " " << std::flush;
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace parcel::test
