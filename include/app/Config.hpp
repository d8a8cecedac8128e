#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "regex/Vm.hpp"

namespace relite::app {

inline constexpr const char* kDefaultPattern = "c(ab)*c";
inline constexpr std::size_t kDefaultMaxInputBytes = 65536;

struct Config {
  std::string pattern{kDefaultPattern};
  regex::RunLimits limits{};
  std::size_t max_input_bytes{kDefaultMaxInputBytes};
  bool debug{false};
  std::string source;  // config file actually read, empty if none
};

// Environment variable helpers. Accept both RELITE_ and relite_ prefixes.
const char* getenv_compat(const char* name);
uint64_t getenv_u64(const char* name, uint64_t defv);
bool env_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/relite/config.toml, else ~/.config/relite/config.toml.
std::string config_file_path();

// Resolve every setting TOML -> environment -> compiled default.
// An explicit path that cannot be read is reported on stderr and ignored.
Config load_config(const std::string& explicit_path = {});

} // namespace relite::app
