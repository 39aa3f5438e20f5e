#include "session/session_directory.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>

#include "core/time.hpp"
#include "session/session_record.hpp"

namespace piacp {

namespace fs = std::filesystem;

namespace {

void walk_jsonl_files(const fs::path& dir, std::vector<fs::path>& out) {
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      spdlog::debug("[sessions] stopped walking {}: {}", dir.string(), ec.message());
      return;
    }
    const auto& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      walk_jsonl_files(entry.path(), out);
    } else if (entry.is_regular_file(type_ec) && entry.path().extension() == ".jsonl") {
      out.push_back(entry.path());
    }
  }
}

// Read up to `length` bytes at `offset`
std::optional<std::string> read_range(const fs::path& file, uint64_t offset, size_t length) {
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  in.seekg(static_cast<std::streamoff>(offset));
  if (!in) {
    return std::nullopt;
  }
  std::string buf(length, '\0');
  in.read(buf.data(), static_cast<std::streamsize>(length));
  buf.resize(static_cast<size_t>(in.gcount()));
  return buf;
}

// Split on '\n', trimming each line (drops a trailing '\r')
std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

std::optional<SessionHeader> read_header(const fs::path& file) {
  auto head = read_range(file, 0, SessionDirectory::kHeadBytes);
  if (!head || head->empty()) {
    return std::nullopt;
  }
  std::string_view view(*head);
  auto newline = view.find('\n');
  auto first_line = trim(newline == std::string_view::npos ? view : view.substr(0, newline));

  auto record = parse_session_record(first_line);
  if (auto header = std::get_if<SessionHeader>(&record)) {
    return *header;
  }
  return std::nullopt;
}

struct TailInfo {
  std::optional<std::string> name;
  std::optional<std::string> updated_at;
};

// Scan the tail backwards for the latest name and the latest message timestamp
TailInfo scan_tail(std::string_view tail) {
  TailInfo info;
  std::optional<std::string> any_timestamp;

  auto lines = split_lines(tail);
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    auto line = trim(*it);
    if (line.empty()) continue;

    auto record = parse_session_record(line);

    if (!info.name) {
      if (auto rename = std::get_if<SessionInfoRecord>(&record); rename && !rename->name.empty()) {
        info.name = rename->name;
      }
    }

    if (!info.updated_at) {
      auto ts = record_timestamp(record);
      auto normalized = ts ? normalize_iso8601(*ts) : std::nullopt;
      if (normalized) {
        if (std::holds_alternative<MessageRecord>(record)) {
          info.updated_at = normalized;
        } else if (!any_timestamp) {
          any_timestamp = normalized;
        }
      }
    }

    if (info.name && info.updated_at) break;
  }

  if (!info.updated_at) {
    info.updated_at = any_timestamp;
  }
  return info;
}

// Unbounded path: last session_info.name anywhere in the file
std::optional<std::string> scan_name_full(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::optional<std::string> last_name;
  std::string line;
  while (std::getline(in, line)) {
    auto trimmed = trim(line);
    if (trimmed.empty()) continue;
    // Cheap pre-filter before parsing large message lines
    if (trimmed.find("session_info") == std::string::npos) continue;
    auto record = parse_session_record(trimmed);
    if (auto rename = std::get_if<SessionInfoRecord>(&record); rename && !rename->name.empty()) {
      last_name = rename->name;
    }
  }
  return last_name;
}

std::optional<std::string> first_user_message_title(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::string line;
  size_t count = 0;
  while (count < SessionDirectory::kTitleScanMaxLines && std::getline(in, line)) {
    ++count;
    auto trimmed = trim(line);
    if (trimmed.empty()) continue;
    auto record = parse_session_record(trimmed);
    auto message = std::get_if<MessageRecord>(&record);
    if (!message || message->role != "user") continue;
    auto text = first_text(message->content);
    if (text && !text->empty()) {
      return truncate_utf8(*text, SessionDirectory::kTitleMaxChars);
    }
  }
  return std::nullopt;
}

std::optional<std::string> modification_time(const fs::path& file) {
  std::error_code ec;
  auto ftime = fs::last_write_time(file, ec);
  if (ec) {
    return std::nullopt;
  }
  auto sys = std::chrono::file_clock::to_sys(ftime);
  return format_iso8601(std::chrono::time_point_cast<Timestamp::duration>(sys));
}

}  // namespace

json SessionListing::to_json() const {
  json j = {{"sessionId", session_id}, {"cwd", cwd}};
  if (title) {
    j["title"] = *title;
  }
  if (updated_at) {
    j["updatedAt"] = *updated_at;
  }
  return j;
}

SessionDirectory::SessionDirectory(fs::path root) : root_(std::move(root)) {}

std::optional<SessionListing> SessionDirectory::describe(const fs::path& file) {
  auto header = read_header(file);
  if (!header) {
    return std::nullopt;
  }

  SessionListing listing;
  listing.session_id = header->id;
  listing.cwd = header->cwd;
  listing.session_file = file;

  std::error_code ec;
  auto size = fs::file_size(file, ec);
  if (!ec) {
    uint64_t start = size > kTailBytes ? size - kTailBytes : 0;
    if (auto tail = read_range(file, start, static_cast<size_t>(size - start))) {
      auto info = scan_tail(*tail);
      listing.title = info.name;
      listing.updated_at = info.updated_at;
    }
  }

  // Named early, then grew past the tail window
  if (!listing.title) {
    listing.title = scan_name_full(file);
  }

  if (!listing.updated_at) {
    listing.updated_at = modification_time(file);
  }

  if (!listing.title) {
    listing.title = first_user_message_title(file);
  }

  return listing;
}

std::vector<SessionListing> SessionDirectory::list() const {
  std::vector<fs::path> files;
  walk_jsonl_files(root_, files);
  std::sort(files.begin(), files.end());

  std::vector<SessionListing> items;
  items.reserve(files.size());
  for (const auto& file : files) {
    try {
      if (auto listing = describe(file)) {
        items.push_back(std::move(*listing));
      }
    } catch (const std::exception& e) {
      spdlog::warn("[sessions] skipping {}: {}", file.string(), e.what());
    }
  }

  // Most recent first; the canonical timestamp form orders lexicographically
  std::stable_sort(items.begin(), items.end(), [](const SessionListing& a, const SessionListing& b) {
    return a.updated_at.value_or("") > b.updated_at.value_or("");
  });

  spdlog::debug("[sessions] listed {} sessions under {}", items.size(), root_.string());
  return items;
}

std::vector<SessionListing> SessionDirectory::list(const std::optional<std::string>& cwd) const {
  auto items = list();
  if (!cwd) {
    return items;
  }
  items.erase(std::remove_if(items.begin(), items.end(), [&](const SessionListing& item) { return item.cwd != *cwd; }), items.end());
  return items;
}

std::optional<SessionListing> SessionDirectory::find(const SessionId& session_id) const {
  for (auto& item : list()) {
    if (item.session_id == session_id) {
      return item;
    }
  }
  return std::nullopt;
}

std::optional<fs::path> SessionDirectory::find_file(const SessionId& session_id) const {
  if (auto item = find(session_id)) {
    return item->session_file;
  }
  return std::nullopt;
}

}  // namespace piacp
