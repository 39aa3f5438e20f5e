#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace piacp {

// Listing entry derived from one session log file. Recomputed on every call.
struct SessionListing {
  SessionId session_id;
  std::string cwd;
  std::optional<std::string> title;
  std::optional<std::string> updated_at;  // YYYY-MM-DDTHH:MM:SS.mmmZ
  std::filesystem::path session_file;

  // {sessionId, cwd, title?, updatedAt?}
  json to_json() const;
};

// Stateless view over pi's session logs (<agent_dir>/sessions/**/*.jsonl).
//
// Metadata extraction reads a bounded head and tail of each file. Only a
// session renamed long ago (outside the tail window) pays for a full scan.
class SessionDirectory {
 public:
  static constexpr size_t kHeadBytes = 64 * 1024;
  static constexpr size_t kTailBytes = 256 * 1024;
  static constexpr size_t kTitleMaxChars = 80;
  static constexpr size_t kTitleScanMaxLines = 2000;

  explicit SessionDirectory(std::filesystem::path root);

  const std::filesystem::path& root() const {
    return root_;
  }

  // Every session under root, most recently updated first (unknown last)
  std::vector<SessionListing> list() const;

  // Same, restricted to sessions whose header cwd equals `cwd`
  std::vector<SessionListing> list(const std::optional<std::string>& cwd) const;

  std::optional<SessionListing> find(const SessionId& session_id) const;

  std::optional<std::filesystem::path> find_file(const SessionId& session_id) const;

  // Build the listing entry for one file; nullopt if it has no valid header
  static std::optional<SessionListing> describe(const std::filesystem::path& file);

 private:
  std::filesystem::path root_;
};

}  // namespace piacp
