#include "net/connection_registry.hpp"

namespace piacp::net {

ConnectionPolicy ConnectionPolicy::from_settings(const ServerSettings& settings) {
  ConnectionPolicy policy;
  policy.max_connections = settings.max_connections;
  policy.rate_limit_messages = settings.rate_limit_messages;
  policy.rate_limit_window = std::chrono::milliseconds(settings.rate_limit_window_ms);
  policy.idle_timeout = std::chrono::milliseconds(settings.idle_timeout_ms);
  return policy;
}

ConnectionRegistry::ConnectionRegistry(ConnectionPolicy policy) : policy_(policy) {}

bool ConnectionRegistry::admit(const ConnectionId& id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.size() >= policy_.max_connections) {
    return false;
  }
  Entry entry;
  entry.connected_at = now;
  entry.last_activity = now;
  entry.window_start = now;
  entries_[id] = entry;
  return true;
}

MessageVerdict ConnectionRegistry::on_message(const ConnectionId& id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return MessageVerdict::Unknown;
  }
  auto& entry = it->second;
  entry.last_activity = now;

  if (now - entry.window_start > policy_.rate_limit_window) {
    entry.window_start = now;
    entry.message_count = 1;
    return MessageVerdict::Accept;
  }

  entry.message_count++;
  return entry.message_count > policy_.rate_limit_messages ? MessageVerdict::RateLimited : MessageVerdict::Accept;
}

void ConnectionRegistry::touch(const ConnectionId& id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it != entries_.end()) {
    it->second.last_activity = now;
  }
}

void ConnectionRegistry::on_pong(const ConnectionId& id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it != entries_.end()) {
    it->second.alive = true;
    it->second.last_activity = now;
    it->second.awaiting_round = 0;
  }
}

ProbeRound ConnectionRegistry::begin_probe_round() {
  std::lock_guard<std::mutex> lock(mutex_);
  ProbeRound result;
  result.round = next_round_++;

  for (auto it = entries_.begin(); it != entries_.end();) {
    if (!it->second.alive) {
      result.expired.push_back(it->first);
      it = entries_.erase(it);
      continue;
    }
    it->second.alive = false;
    it->second.awaiting_round = result.round;
    result.probed.push_back(it->first);
    ++it;
  }
  return result;
}

bool ConnectionRegistry::on_pong_timeout(const ConnectionId& id, uint64_t round) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.alive || it->second.awaiting_round != round) {
    return false;
  }
  entries_.erase(it);
  return true;
}

std::vector<ConnectionId> ConnectionRegistry::sweep_idle(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionId> idle;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.last_activity > policy_.idle_timeout) {
      idle.push_back(it->first);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return idle;
}

bool ConnectionRegistry::remove(const ConnectionId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(id) > 0;
}

bool ConnectionRegistry::contains(const ConnectionId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) > 0;
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<ConnectionId> ConnectionRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionId> out;
  out.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    out.push_back(id);
  }
  return out;
}

}  // namespace piacp::net
