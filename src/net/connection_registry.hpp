#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"

namespace piacp::net {

struct ConnectionPolicy {
  size_t max_connections = 10;
  size_t rate_limit_messages = 100;
  std::chrono::milliseconds rate_limit_window{60000};
  std::chrono::milliseconds idle_timeout{300000};

  static ConnectionPolicy from_settings(const ServerSettings& settings);
};

enum class MessageVerdict { Accept, RateLimited, Unknown };

// Result of starting a liveness round
struct ProbeRound {
  uint64_t round = 0;
  std::vector<ConnectionId> expired;  // never answered the previous probe; already removed
  std::vector<ConnectionId> probed;   // now awaiting a pong for this round
};

// Admission, rate limiting, liveness and idle bookkeeping for open connections.
// Holds no sockets: the server asks it what to do and carries out the closes.
// Thread-safe.
class ConnectionRegistry {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit ConnectionRegistry(ConnectionPolicy policy);

  // Registers a connection; false once max_connections are open
  bool admit(const ConnectionId& id, TimePoint now);

  // Counts an inbound message against the fixed window and records activity.
  // The message that crosses the limit is the one reported as RateLimited.
  MessageVerdict on_message(const ConnectionId& id, TimePoint now);

  // Outbound traffic also counts as activity
  void touch(const ConnectionId& id, TimePoint now);

  // Marks the connection alive for the current round; a pong is activity too
  void on_pong(const ConnectionId& id, TimePoint now);

  // Removes connections still waiting on the previous probe and marks the
  // rest not-alive for a new round.
  ProbeRound begin_probe_round();

  // The per-probe timer fired. Returns true (and removes the connection) if
  // it is still waiting on that round.
  bool on_pong_timeout(const ConnectionId& id, uint64_t round);

  // Removes and returns connections idle longer than the policy allows
  std::vector<ConnectionId> sweep_idle(TimePoint now);

  bool remove(const ConnectionId& id);

  bool contains(const ConnectionId& id) const;

  size_t size() const;

  std::vector<ConnectionId> ids() const;

  const ConnectionPolicy& policy() const {
    return policy_;
  }

 private:
  struct Entry {
    TimePoint connected_at;
    TimePoint last_activity;
    TimePoint window_start;
    size_t message_count = 0;
    bool alive = true;
    uint64_t awaiting_round = 0;  // 0 when no probe is outstanding
  };

  ConnectionPolicy policy_;
  mutable std::mutex mutex_;
  std::map<ConnectionId, Entry> entries_;
  uint64_t next_round_ = 1;
};

}  // namespace piacp::net
