#include "util/FileBytes.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <new>

namespace relite::util {

namespace {
constexpr std::size_t kReadChunk = 64 * 1024;

struct FileCloser {
  void operator()(std::FILE* f) const { std::fclose(f); }
};
} // namespace

auto read_stream_bytes(std::FILE* f, std::size_t max_bytes) -> std::optional<InputBytes> {
  if (!f) return std::nullopt;
  InputBytes out;
  // Grow with what the stream actually delivers, never by max_bytes up front
  char chunk[kReadChunk];
  while (out.data.size() < max_bytes) {
    std::size_t want = std::min(sizeof(chunk), max_bytes - out.data.size());
    std::size_t n = std::fread(chunk, 1, want, f);
    if (n == 0) break;
    try {
      out.data.append(chunk, n);
    } catch (const std::bad_alloc&) {
      std::fprintf(stderr, "relite: FileBytes: out of memory after %zu bytes\n", out.data.size());
      return std::nullopt;
    }
  }
  if (std::ferror(f)) {
    std::fprintf(stderr, "relite: FileBytes: read failed: %s\n", std::strerror(errno));
    return std::nullopt;
  }
  // Probe for one more byte to tell "exactly max_bytes" from "cut short"
  if (out.data.size() == max_bytes && std::fgetc(f) != EOF) out.truncated = true;
  return out;
}

auto read_file_bytes(const std::string& path, std::size_t max_bytes) -> std::optional<InputBytes> {
  std::unique_ptr<std::FILE, FileCloser> f(std::fopen(path.c_str(), "rb"));
  if (!f) {
    std::fprintf(stderr, "relite: FileBytes: failed to open %s: %s\n",
                 path.c_str(), std::strerror(errno));
    return std::nullopt;
  }
  return read_stream_bytes(f.get(), max_bytes);
}

} // namespace relite::util
