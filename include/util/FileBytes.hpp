// Bounded whole-input readers for the relite CLI
#pragma once
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>

namespace relite::util {

struct InputBytes {
  std::string data;
  bool truncated{false};  // source had more than max_bytes
};

// Read up to max_bytes from an open stream. Returns std::nullopt on a read error.
auto read_stream_bytes(std::FILE* f, std::size_t max_bytes) -> std::optional<InputBytes>;

// Read up to max_bytes from a file. Returns std::nullopt if it cannot be opened or read.
auto read_file_bytes(const std::string& path, std::size_t max_bytes) -> std::optional<InputBytes>;

} // namespace relite::util
