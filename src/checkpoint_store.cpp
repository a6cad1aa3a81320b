/**
 * @file checkpoint_store.cpp
 * @brief Checkpoint persistence implementation
 */

#include "hevc_batch/checkpoint_store.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "hevc_batch/logging.hpp"

namespace hevc_batch {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// Write the whole buffer, retrying on EINTR and short writes
bool write_all(int fd, const std::string &data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

double unix_now() {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/// Lowercase hex of every byte
std::string hex_encode(const std::string &bytes) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(digits[c >> 4]);
    out.push_back(digits[c & 0x0f]);
  }
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::optional<std::string> hex_decode(const std::string &hex) {
  if (hex.size() % 2 != 0)
    return std::nullopt;
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

/**
 * @brief JSON text of one record.
 * @note File names are arbitrary bytes. A name that is not valid UTF-8 is
 *       stored exactly as "file_hex"; "file" then only carries a readable
 *       copy with U+FFFD replacements.
 */
std::string serialize(const std::string &file, int64_t frame) {
  json state = {{"file", file}, {"frame", frame}, {"timestamp", unix_now()}};
  try {
    return state.dump();
  } catch (const json::type_error &) {
    state["file_hex"] = hex_encode(file);
    return state.dump(-1, ' ', false, json::error_handler_t::replace);
  }
}

} // anonymous namespace

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

bool CheckpointStore::save(const std::string &file, int64_t frame) {
  if (frame < 0)
    frame = 0;

  std::string payload;
  try {
    payload = serialize(file, frame);
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to serialize checkpoint for {}: {}", file, e.what());
    return false;
  }
  const std::string tmp_path = path_ + ".tmp";

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create {}: {}", tmp_path, std::strerror(errno));
    return false;
  }

  bool ok = write_all(fd, payload) && ::fsync(fd) == 0;
  int saved_errno = errno;
  ::close(fd);

  if (!ok) {
    LOG_ERROR("Failed to write {}: {}", tmp_path, std::strerror(saved_errno));
    std::error_code ec;
    fs::remove(tmp_path, ec);
    return false;
  }

  /// rename(2) replaces the slot in a single step
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    LOG_ERROR("Failed to commit checkpoint {}: {}", path_,
              std::strerror(errno));
    std::error_code ec;
    fs::remove(tmp_path, ec);
    return false;
  }

  return true;
}

std::optional<Checkpoint> CheckpointStore::load() const {
  std::ifstream in(path_);
  if (!in)
    return std::nullopt;

  json state = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (state.is_discarded() || !state.is_object())
    return std::nullopt;

  auto file_it = state.find("file");
  auto hex_it = state.find("file_hex");
  auto frame_it = state.find("frame");
  if (file_it == state.end() || !file_it->is_string())
    return std::nullopt;
  if (frame_it == state.end() || !frame_it->is_number_integer())
    return std::nullopt;

  Checkpoint cp;
  if (hex_it != state.end()) {
    if (!hex_it->is_string())
      return std::nullopt;
    auto raw = hex_decode(hex_it->get<std::string>());
    if (!raw)
      return std::nullopt;
    cp.file = *raw;
  } else {
    cp.file = file_it->get<std::string>();
  }
  cp.frame = frame_it->get<int64_t>();
  if (cp.file.empty() || cp.frame < 0)
    return std::nullopt;

  auto ts_it = state.find("timestamp");
  if (ts_it != state.end() && ts_it->is_number())
    cp.timestamp = ts_it->get<double>();

  return cp;
}

void CheckpointStore::clear() {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    LOG_WARN("Could not remove checkpoint {}: {}", path_, ec.message());
  }
}

bool CheckpointStore::exists() const {
  std::error_code ec;
  return fs::exists(path_, ec);
}

} // namespace hevc_batch
