#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relite::util {

// Flat TOML subset: [section] headers, key = value lines, # comments,
// double-quoted strings. Enough for relite's config file.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current_section;
    while (!text.empty()) {
      auto nl = text.find('\n');
      auto sv = trim(text.substr(0, nl));
      text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto val = trim(sv.substr(eq + 1));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = val.substr(1, val.size() - 2);
      } else if (auto hash = val.find(" #"); hash != std::string_view::npos) {
        val = trim(val.substr(0, hash));  // trailing comment on a bare value
      }
      ensure_section(current_section).set(key, std::string(val));
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    int out = def;
    return parse_number(section, key, out) ? out : def;
  }

  [[nodiscard]] uint64_t get_u64(std::string_view section, std::string_view key, uint64_t def = 0) const {
    uint64_t out = def;
    return parse_number(section, key, out) ? out : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, std::string val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = std::move(val); return; }
      }
      entries.emplace_back(key, std::move(val));
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  template <typename T>
  bool parse_number(std::string_view section, std::string_view key, T& out) const {
    const auto* s = find_section(section);
    if (!s) return false;
    auto val = s->get(key, "");
    if (val.empty()) return false;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    return ec == std::errc() && ptr == val.data() + val.size();
  }

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace relite::util
