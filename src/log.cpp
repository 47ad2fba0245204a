#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct SinkSet {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

SinkSet g_sinks;
std::mutex g_sinks_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console,
                                            spdlog::sink_ptr file) {
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(file) sinks.push_back(std::move(file));
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

// Caller holds g_sinks_mutex.
void build_sinks_locked(const LogOptions& options) {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kTimestampPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kTimestampPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  spdlog::sink_ptr file_sink;
  if(!options.log_file.empty()) {
    std::error_code ec;
    if(options.log_file.has_parent_path()) {
      std::filesystem::create_directories(options.log_file.parent_path(), ec);
    }
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file.string());
    file_sink->set_pattern(kTimestampPattern);
  }

  g_sinks.info = make_logger("parcel.info", info_sink, file_sink);
  g_sinks.error = make_logger("parcel.error", error_sink, file_sink);
  g_sinks.print = make_logger("parcel.print", plain_out_sink, nullptr);
  g_sinks.print_err = make_logger("parcel.print_err", plain_err_sink, nullptr);

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.print->flush_on(spdlog::level::info);
  g_sinks.print_err->flush_on(spdlog::level::err);
}

SinkSet current_sinks() {
  std::lock_guard lg(g_sinks_mutex);
  if(!g_sinks.info) build_sinks_locked(LogOptions{});
  return g_sinks;
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(LogChannel channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(channel, channel_name, level, message);
}

void init(const LogOptions& options) {
  {
    std::lock_guard lg(g_sinks_mutex);
    build_sinks_locked(options);
  }
  auto sinks = current_sinks();
  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  sinks.info->set_level(level);
  sinks.error->set_level(spdlog::level::info);
  sinks.print->set_level(spdlog::level::info);
  sinks.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(sinks.info);
  spdlog::set_level(level);
}

void init(bool verbose) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto sinks = current_sinks();

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print: sink = sinks.print.get(); break;
    case LogChannel::PrintErr: sink = sinks.print_err.get(); break;
    case LogChannel::Error: sink = sinks.error.get(); break;
    default: sink = sinks.info.get(); break;
  }

  if(!sink) return;
  const char* base = log_channel_name(channel);
  if(!channel_name.empty() && channel_name != base) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
