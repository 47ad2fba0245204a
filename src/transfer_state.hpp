#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

enum class TransferStatus { Pending, Transferring, Completed, Failed, Cancelled };
enum class TransferDirection { Upload, Download };

const char* transfer_status_name(TransferStatus status);
bool is_terminal(TransferStatus status);
// pending -> transferring -> {completed|failed|cancelled}; pending may also
// jump straight to failed or cancelled.
bool can_transition(TransferStatus from, TransferStatus to);

struct TransferState {
  std::string transfer_id;
  std::string bundle_id;
  std::string peer_id;
  TransferDirection direction = TransferDirection::Download;
  TransferStatus status = TransferStatus::Pending;
  std::size_t total_chunks = 0;
  std::set<std::size_t> completed_chunks;
  uint64_t total_bytes = 0;
  uint64_t transferred_bytes = 0;
  int64_t start_time = 0;
  int64_t finished_at = 0;   // 0 while not terminal
  std::filesystem::path temp_path;
  std::optional<std::string> error;
};

struct TransferProgress {
  std::string transfer_id;
  std::string bundle_id;
  std::size_t total_chunks = 0;
  std::size_t completed_chunks = 0;
  uint64_t total_bytes = 0;
  uint64_t transferred_bytes = 0;
  double speed = 0;          // bytes per second
  double eta = 0;            // seconds
  TransferStatus status = TransferStatus::Pending;
  std::optional<std::string> error;

  static TransferProgress from(const TransferState& state, int64_t now);
};

void to_json(nlohmann::json& j, const TransferProgress& p);

// Mutex-guarded transfer table. Every mutation re-checks the status under
// the lock, so a concurrent cancel stops the writer at its next update.
class TransferTable {
public:
  void insert(TransferState state);
  std::optional<TransferState> find(const std::string& transfer_id) const;
  std::optional<TransferProgress> progress(const std::string& transfer_id, int64_t now) const;
  std::vector<TransferState> list() const;

  // False when the move is not allowed or the transfer is unknown.
  bool transition(const std::string& transfer_id, TransferStatus to, int64_t now,
                  std::optional<std::string> error = std::nullopt);

  // Adds `bytes` while the transfer is still transferring; clamps to
  // total_bytes. False once the transfer left the transferring state.
  bool add_bytes(const std::string& transfer_id, uint64_t bytes);
  bool complete_chunk(const std::string& transfer_id, std::size_t index);
  bool set_totals(const std::string& transfer_id, uint64_t total_bytes, std::size_t total_chunks);

  std::optional<TransferStatus> status(const std::string& transfer_id) const;
  std::optional<TransferState> remove(const std::string& transfer_id);

  // Drops terminal states finished more than `grace_ms` ago.
  std::vector<TransferState> reap_terminal(int64_t now, int64_t grace_ms);
  std::size_t size() const;

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, TransferState> transfers_;
};
