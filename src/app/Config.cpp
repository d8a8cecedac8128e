#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace relite::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("RELITE_", 0) == 0) {
    alt = std::string("relite_") + n.substr(7);
  } else if (n.rfind("relite_", 0) == 0) {
    alt = std::string("RELITE_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

uint64_t getenv_u64(const char* name, uint64_t defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  uint64_t out = defv;
  auto [ptr, ec] = std::from_chars(v, v + std::strlen(v), out);
  if (ec != std::errc() || *ptr != '\0') return defv;
  return out;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/relite/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/relite/config.toml";
  return {};
}

// Resolve a size from TOML -> env -> compiled default
static uint64_t resolve_u64(const util::TomlReader& toml, bool have_toml,
                            const char* section, const char* key,
                            const char* env_name, uint64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_u64(section, key, def);
  return getenv_u64(env_name, def);
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  return env_flag(env_name, def);
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (const char* v = getenv_compat(env_name)) return std::string(v);
  return def;
}

Config load_config(const std::string& explicit_path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = false;

  if (!explicit_path.empty()) {
    have_toml = toml.load(explicit_path);
    if (!have_toml)
      std::fprintf(stderr, "relite: Config: cannot read %s, using defaults\n", explicit_path.c_str());
    else
      c.source = explicit_path;
  } else {
    auto path = config_file_path();
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
      have_toml = toml.load(path);
      if (have_toml) c.source = path;
    }
  }

  c.pattern = resolve_string(toml, have_toml, "regex", "pattern", "RELITE_PATTERN", kDefaultPattern);
  c.limits.max_threads = resolve_u64(toml, have_toml, "engine", "max_threads",
                                     "RELITE_MAX_THREADS", c.limits.max_threads);
  c.limits.max_steps = resolve_u64(toml, have_toml, "engine", "max_steps",
                                   "RELITE_MAX_STEPS", c.limits.max_steps);
  c.max_input_bytes = resolve_u64(toml, have_toml, "input", "max_bytes",
                                  "RELITE_MAX_BYTES", kDefaultMaxInputBytes);
  c.debug = resolve_bool(toml, have_toml, "log", "debug", "RELITE_DEBUG", false);
  return c;
}

} // namespace relite::app
