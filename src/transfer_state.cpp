#include "transfer_state.hpp"
#include <algorithm>

const char* transfer_status_name(TransferStatus status) {
  switch(status) {
    case TransferStatus::Pending: return "pending";
    case TransferStatus::Transferring: return "transferring";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
    case TransferStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

bool is_terminal(TransferStatus status) {
  return status == TransferStatus::Completed ||
         status == TransferStatus::Failed ||
         status == TransferStatus::Cancelled;
}

bool can_transition(TransferStatus from, TransferStatus to) {
  switch(from) {
    case TransferStatus::Pending:
      return to == TransferStatus::Transferring ||
             to == TransferStatus::Failed ||
             to == TransferStatus::Cancelled;
    case TransferStatus::Transferring:
      return is_terminal(to);
    default:
      return false;
  }
}

TransferProgress TransferProgress::from(const TransferState& state, int64_t now) {
  TransferProgress p;
  p.transfer_id = state.transfer_id;
  p.bundle_id = state.bundle_id;
  p.total_chunks = state.total_chunks;
  p.completed_chunks = state.completed_chunks.size();
  p.total_bytes = state.total_bytes;
  p.transferred_bytes = state.transferred_bytes;
  p.status = state.status;
  p.error = state.error;
  int64_t end = state.finished_at > 0 ? state.finished_at : now;
  int64_t elapsed = end - state.start_time;
  p.speed = elapsed > 0 ? static_cast<double>(state.transferred_bytes) * 1000.0 / elapsed : 0.0;
  uint64_t remaining = state.total_bytes > state.transferred_bytes
    ? state.total_bytes - state.transferred_bytes : 0;
  p.eta = p.speed > 0 ? remaining / p.speed : 0.0;
  return p;
}

void to_json(nlohmann::json& j, const TransferProgress& p) {
  j = nlohmann::json{
    {"transferId", p.transfer_id},
    {"bundleId", p.bundle_id},
    {"totalChunks", p.total_chunks},
    {"completedChunks", p.completed_chunks},
    {"totalBytes", p.total_bytes},
    {"transferredBytes", p.transferred_bytes},
    {"speed", p.speed},
    {"eta", p.eta},
    {"status", transfer_status_name(p.status)}
  };
  if(p.error) j["error"] = *p.error;
}

void TransferTable::insert(TransferState state) {
  std::lock_guard lg(m_);
  transfers_[state.transfer_id] = std::move(state);
}

std::optional<TransferState> TransferTable::find(const std::string& transfer_id) const {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return std::nullopt;
  return it->second;
}

std::optional<TransferProgress> TransferTable::progress(const std::string& transfer_id, int64_t now) const {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return std::nullopt;
  return TransferProgress::from(it->second, now);
}

std::vector<TransferState> TransferTable::list() const {
  std::vector<TransferState> out;
  {
    std::lock_guard lg(m_);
    for(const auto& entry : transfers_) out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(), [](const TransferState& a, const TransferState& b){
    if(a.start_time != b.start_time) return a.start_time < b.start_time;
    return a.transfer_id < b.transfer_id;
  });
  return out;
}

bool TransferTable::transition(const std::string& transfer_id, TransferStatus to, int64_t now,
                               std::optional<std::string> error) {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return false;
  auto& state = it->second;
  if(!can_transition(state.status, to)) return false;
  state.status = to;
  if(is_terminal(to)) state.finished_at = now;
  if(error) state.error = std::move(error);
  return true;
}

bool TransferTable::add_bytes(const std::string& transfer_id, uint64_t bytes) {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return false;
  auto& state = it->second;
  if(state.status != TransferStatus::Transferring) return false;
  state.transferred_bytes = std::min(state.total_bytes, state.transferred_bytes + bytes);
  return true;
}

bool TransferTable::complete_chunk(const std::string& transfer_id, std::size_t index) {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return false;
  if(it->second.status != TransferStatus::Transferring) return false;
  it->second.completed_chunks.insert(index);
  return true;
}

bool TransferTable::set_totals(const std::string& transfer_id, uint64_t total_bytes, std::size_t total_chunks) {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end() || is_terminal(it->second.status)) return false;
  it->second.total_bytes = std::max(total_bytes, it->second.transferred_bytes);
  it->second.total_chunks = total_chunks;
  return true;
}

std::optional<TransferStatus> TransferTable::status(const std::string& transfer_id) const {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return std::nullopt;
  return it->second.status;
}

std::optional<TransferState> TransferTable::remove(const std::string& transfer_id) {
  std::lock_guard lg(m_);
  auto it = transfers_.find(transfer_id);
  if(it == transfers_.end()) return std::nullopt;
  TransferState state = std::move(it->second);
  transfers_.erase(it);
  return state;
}

std::vector<TransferState> TransferTable::reap_terminal(int64_t now, int64_t grace_ms) {
  std::lock_guard lg(m_);
  std::vector<TransferState> reaped;
  for(auto it = transfers_.begin(); it != transfers_.end();) {
    const auto& state = it->second;
    if(is_terminal(state.status) && now - state.finished_at > grace_ms) {
      reaped.push_back(std::move(it->second));
      it = transfers_.erase(it);
    } else {
      ++it;
    }
  }
  return reaped;
}

std::size_t TransferTable::size() const {
  std::lock_guard lg(m_);
  return transfers_.size();
}
