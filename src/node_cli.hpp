#pragma once
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "node_engine.hpp"
#include "peer_manager.hpp"
#include "settings_manager.hpp"
#include "transfer_service.hpp"
#include "utils.hpp"

// Interactive shell over a running node. Every command prints to stdout;
// execute_command reports whether the command succeeded.
class NodeCLI {
public:
  NodeCLI(NodeEngine& engine, std::shared_ptr<SettingsManager> settings)
    : engine_(engine), settings_(std::move(settings)), running_(false) {
    if(auto* transfer = engine_.transfer()) {
      progress_sub_ = transfer->transfer_progress.subscribe([this](const TransferProgress& p){
        on_progress(p);
      });
    }
  }

  ~NodeCLI() {
    if(progress_sub_ != 0) {
      if(auto* transfer = engine_.transfer()) {
        transfer->transfer_progress.unsubscribe(progress_sub_);
      }
    }
    stop();
  }

  void set_quit_handler(std::function<void()> handler) {
    quit_handler_ = std::move(handler);
  }

  void start() {
    if(running_) return;
    running_ = true;
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  bool execute_command(const std::string& line) {
    auto words = split_words(line);
    if(words.empty()) return true;
    const std::string cmd = words.front();
    std::vector<std::string> args(words.begin() + 1, words.end());

    try {
      if(cmd == "peers") {
        list_peers();
      } else if(cmd == "add-peer") {
        return add_peer(args);
      } else if(cmd == "bundles") {
        list_bundles();
      } else if(cmd == "share") {
        return share(args);
      } else if(cmd == "remote") {
        return remote(args);
      } else if(cmd == "pull") {
        return pull(args);
      } else if(cmd == "progress") {
        return progress(args);
      } else if(cmd == "cancel") {
        return cancel(args);
      } else if(cmd == "whoami") {
        whoami();
      } else if(cmd == "settings" || cmd == "s") {
        return handle_settings_command(args.empty() ? std::vector<std::string>{"list"} : args);
      } else if(cmd == "set") {
        if(args.empty()) return handle_settings_command({"list"});
        args.insert(args.begin(), "set");
        return handle_settings_command(args);
      } else if(cmd == "get") {
        args.insert(args.begin(), "get");
        return handle_settings_command(args);
      } else if(cmd == "save" || cmd == "load") {
        return handle_settings_command({cmd});
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit") {
        std::cout << "Quitting...\n";
        running_ = false;
        if(quit_handler_) quit_handler_();
      } else {
        print_help();
        std::cout << "Unknown command: " << cmd << "\n";
        return false;
      }
    } catch(const ParcelError& e) {
      std::cout << "Error [" << error_code_name(e.code()) << "]: " << e.what() << "\n";
      return false;
    } catch(const std::exception& e) {
      std::cout << "Error: " << e.what() << "\n";
      return false;
    }
    return true;
  }

private:
  void run_loop() {
    while(running_) {
      auto input = read_command_line("parcel> ");
      if(!input) {
        running_ = false;
        if(quit_handler_) quit_handler_();
        break;
      }
      if(input->empty()) continue;
      execute_command(*input);
    }
  }

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  void on_progress(const TransferProgress& p) {
    if(!running_ || !is_terminal(p.status)) return;
    std::cout << "\n[" << transfer_status_name(p.status) << "] " << p.transfer_id
              << " (" << p.bundle_id << ")";
    if(p.error) std::cout << ": " << *p.error;
    std::cout << "\n";
    std::cout.flush();
  }

  void list_peers() {
    auto peers = engine_.peers()->list();
    if(peers.empty()) {
      std::cout << "No peers known.\n";
      return;
    }
    for(const auto& p : peers) {
      std::cout << p.id << " (" << p.name << ") " << p.address << ":" << p.port;
      if(p.manual) std::cout << " [manual]";
      if(!engine_.peers()->is_live(p.id)) std::cout << " [stale]";
      std::cout << "\n";
    }
  }

  bool add_peer(const std::vector<std::string>& args) {
    if(args.empty()) {
      std::cout << "Usage: add-peer <host:port> [name]\n";
      return false;
    }
    auto colon = args[0].rfind(':');
    if(colon == std::string::npos || colon == 0) {
      std::cout << "Peer must be given as host:port\n";
      return false;
    }
    int port = 0;
    try {
      port = std::stoi(args[0].substr(colon + 1));
    } catch(const std::exception&) {
      port = 0;
    }
    if(port <= 0 || port > 65535) {
      std::cout << "Invalid port in '" << args[0] << "'\n";
      return false;
    }
    auto peer = engine_.transfer()->add_manual_peer(args[0].substr(0, colon),
                                                    static_cast<uint16_t>(port),
                                                    args.size() > 1 ? args[1] : std::string());
    std::cout << "Added " << peer.id << " (" << peer.name << ") at " << peer.base_url() << "\n";
    return true;
  }

  void list_bundles() {
    auto bundles = engine_.transfer()->list_bundles();
    if(bundles.empty()) {
      std::cout << "Not hosting any bundles.\n";
      return;
    }
    for(const auto& b : bundles) {
      std::cout << b.id << "  " << b.manifest.name << " " << b.manifest.version
                << "  " << b.size << " bytes, " << b.chunks << " chunk(s)\n";
    }
  }

  bool share(const std::vector<std::string>& args) {
    if(args.empty()) {
      std::cout << "Usage: share <dir> [manifest.json]\n";
      return false;
    }
    std::optional<Manifest> manifest;
    if(args.size() > 1) manifest = load_manifest_file(args[1]);
    auto result = engine_.share_project(args[0], manifest);
    std::cout << "Sharing " << result.bundle.id << ": " << result.bundle.manifest.name
              << " " << result.bundle.manifest.version << " (" << result.encoded.file_count
              << " files, " << result.encoded.size << " bytes)\n";
    return true;
  }

  bool remote(const std::vector<std::string>& args) {
    if(args.empty()) {
      std::cout << "Usage: remote <peer>\n";
      return false;
    }
    auto bundles = engine_.transfer()->remote_bundles(args[0]);
    if(bundles.empty()) {
      std::cout << args[0] << " is not hosting any bundles.\n";
      return true;
    }
    for(const auto& b : bundles) {
      std::cout << b.bundle_id << "  " << b.manifest.name << " " << b.manifest.version
                << "  " << b.size << " bytes, " << b.chunks << " chunk(s)\n";
    }
    return true;
  }

  bool pull(std::vector<std::string> args) {
    bool overwrite = false;
    auto flag = std::find(args.begin(), args.end(), "--overwrite");
    if(flag != args.end()) {
      overwrite = true;
      args.erase(flag);
    }
    if(args.size() != 3) {
      std::cout << "Usage: pull <peer> <bundle> <dest> [--overwrite]\n";
      return false;
    }
    auto result = engine_.import_bundle(args[0], args[1], args[2], overwrite);
    std::cout << "Imported " << result.extracted.manifest.name << " "
              << result.extracted.manifest.version << " into " << args[2]
              << " (" << result.extracted.file_count << " files)\n";
    return true;
  }

  bool progress(const std::vector<std::string>& args) {
    auto* transfer = engine_.transfer();
    if(!args.empty()) {
      auto p = transfer->get_transfer_progress(args[0]);
      if(!p) {
        std::cout << "Unknown transfer '" << args[0] << "'\n";
        return false;
      }
      print_progress(*p);
      return true;
    }
    auto all = transfer->list_transfers();
    if(all.empty()) std::cout << "No transfers.\n";
    for(const auto& p : all) print_progress(p);
    return true;
  }

  void print_progress(const TransferProgress& p) {
    double pct = p.total_bytes == 0 ? 0.0 : 100.0 * p.transferred_bytes / p.total_bytes;
    std::cout << p.transfer_id << "  " << p.bundle_id << "  " << transfer_status_name(p.status)
              << "  " << std::fixed << std::setprecision(1) << pct << "%  "
              << p.transferred_bytes << "/" << p.total_bytes << " bytes  "
              << std::setprecision(0) << p.speed << " B/s  eta " << p.eta << "s";
    if(p.error) std::cout << "  (" << *p.error << ")";
    std::cout << "\n";
    std::cout.unsetf(std::ios::floatfield);
  }

  bool cancel(const std::vector<std::string>& args) {
    if(args.empty()) {
      std::cout << "Usage: cancel <transfer>\n";
      return false;
    }
    if(!engine_.transfer()->cancel_transfer(args[0])) {
      std::cout << "No active transfer '" << args[0] << "'\n";
      return false;
    }
    std::cout << "Cancelled " << args[0] << "\n";
    return true;
  }

  void whoami() {
    auto crypto = engine_.crypto();
    std::cout << engine_.display_name() << "  " << crypto->peer_id() << "\n"
              << "  public key: " << crypto->public_key() << "\n"
              << "  backend:    " << crypto->backend_name() << "\n"
              << "  transfers:  port " << engine_.transfer_port() << "\n"
              << "  data dir:   " << engine_.data_dir().string() << "\n";
  }

  bool handle_settings_command(const std::vector<std::string>& args) {
    if(!settings_) {
      std::cout << "Settings manager unavailable.\n";
      return false;
    }
    const std::string& action = args.front();

    if(action == "list") {
      list_settings();
      return true;
    }

    if(action == "get") {
      if(args.size() < 2) {
        std::cout << "Usage: settings get <key>\n";
        return false;
      }
      auto resolved = settings_->resolve_key(args[1]);
      if(!resolved) {
        std::cout << "Unknown setting '" << args[1] << "'.\n";
        return false;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return true;
    }

    if(action == "set") {
      if(args.size() < 3) {
        std::cout << "Usage: settings set <key> <value>\n";
        return false;
      }
      auto resolved = settings_->resolve_key(args[1]);
      if(!resolved) {
        std::cout << "Unknown setting '" << args[1] << "'.\n";
        return false;
      }
      std::string value = args[2];
      for(std::size_t i = 3; i < args.size(); ++i) value += " " + args[i];
      std::string error;
      if(!settings_->set_from_string(*resolved, value, error)) {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
        return false;
      }
      apply_setting_side_effects(*resolved);
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return true;
    }

    if(action == "save") {
      if(!settings_->save()) {
        std::cout << "Failed to save settings.\n";
        return false;
      }
      std::cout << "Saved settings to " << settings_->settings_path() << "\n";
      return true;
    }

    if(action == "load") {
      if(settings_->load()) {
        std::cout << "Loaded settings from " << settings_->settings_path() << "\n";
      } else {
        std::cout << "No settings file at " << settings_->settings_path() << "\n";
      }
      apply_setting_side_effects("verbose");
      return true;
    }

    std::cout << "Unknown settings command.\n";
    return false;
  }

  void list_settings() {
    auto keys = settings_->keys();
    std::sort(keys.begin(), keys.end());
    for(const auto& key : keys) {
      std::cout << key << " = " << settings_->value_as_string(key) << "\n";
    }
  }

  // Settings that take effect without a restart.
  void apply_setting_side_effects(const std::string& key) {
    if(key == "verbose") {
      engine_.logger()->set_level(settings_->get<bool>("verbose") ? spdlog::level::debug
                                                                  : spdlog::level::info);
    }
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                          Show this help message\n";
    std::cout << "  quit|exit                         Exit the application\n";
    std::cout << "  whoami                            Show this node's identity\n";
    std::cout << "  peers                             List known peers\n";
    std::cout << "  add-peer <host:port> [name]       Add a peer by address\n";
    std::cout << "  bundles                           List bundles this node hosts\n";
    std::cout << "  share <dir> [manifest.json]       Bundle a project and announce it\n";
    std::cout << "  remote <peer>                     List a peer's bundles\n";
    std::cout << "  pull <peer> <bundle> <dest> [--overwrite]  Download and extract a bundle\n";
    std::cout << "  progress [transfer]               Show transfer progress\n";
    std::cout << "  cancel <transfer>                 Cancel an active transfer\n";
    std::cout << "  settings [list|get|set|save|load] Manage runtime settings\n";
    std::cout << "  set [key value]                   Shortcut for settings set (lists when empty)\n";
    std::cout << "  get <key>                         Shortcut for settings get\n";
    std::cout << "  save                              Shortcut for settings save\n";
    std::cout << "  load                              Shortcut for settings load\n";
  }

  NodeEngine& engine_;
  std::shared_ptr<SettingsManager> settings_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
  std::function<void()> quit_handler_;
  SubscriptionHandle progress_sub_ = 0;
};
