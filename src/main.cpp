#include "app/Config.hpp"
#include "regex/Regex.hpp"
#include "util/FileBytes.hpp"

#include <cstdio>
#include <cstring>
#include <optional>
#include <string>

using relite::regex::Regex;
using relite::regex::RunError;

namespace {

enum ExitCode { kExitMatch = 0, kExitNoMatch = 1, kExitError = 2 };

struct Options {
  std::string config_path;
  std::string input_path;
  std::optional<std::string> pattern;
  bool dump{false};
  bool search{false};
  bool help{false};
};

void print_usage(std::FILE* out) {
  std::fprintf(out,
    "usage: relite [--config PATH] [--file PATH] [--dump] [--search] [PATTERN]\n"
    "\n"
    "Compile PATTERN (literals . * + | and grouping) and run it against the\n"
    "input read from stdin or --file. Matching starts at offset 0 unless\n"
    "--search is given, which tries every start offset.\n"
    "\n"
    "  --config PATH  read settings from PATH instead of the default config file\n"
    "  --file PATH    read input from PATH instead of stdin\n"
    "  --dump         print the compiled program before running it\n"
    "  --search       report the first offset where the pattern matches\n"
    "\n"
    "Exit status: 0 match, 1 no match, 2 error.\n");
}

// Returns false on a usage error (already reported).
bool parse_args(int argc, char** argv, Options& o) {
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto need_value = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "relite: %s requires a value\n", flag);
        return nullptr;
      }
      return argv[++i];
    };
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      o.help = true;
    } else if (std::strcmp(a, "--dump") == 0) {
      o.dump = true;
    } else if (std::strcmp(a, "--search") == 0) {
      o.search = true;
    } else if (std::strcmp(a, "--config") == 0) {
      const char* v = need_value(a); if (!v) return false;
      o.config_path = v;
    } else if (std::strcmp(a, "--file") == 0) {
      const char* v = need_value(a); if (!v) return false;
      o.input_path = v;
    } else if (std::strcmp(a, "--") == 0) {
      if (i + 1 < argc) o.pattern = argv[++i];
    } else if (a[0] == '-' && a[1] == '-') {
      std::fprintf(stderr, "relite: unknown option %s\n", a);
      return false;
    } else if (!o.pattern) {
      o.pattern = a;
    } else {
      std::fprintf(stderr, "relite: unexpected argument %s\n", a);
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage(stderr);
    return kExitError;
  }
  if (opts.help) {
    print_usage(stdout);
    return kExitMatch;
  }

  auto cfg = relite::app::load_config(opts.config_path);
  if (opts.pattern) cfg.pattern = *opts.pattern;
  if (cfg.debug && !cfg.source.empty())
    std::fprintf(stderr, "relite: Config: loaded %s\n", cfg.source.c_str());

  Regex re(cfg.pattern, cfg.limits);
  if (!re.valid()) {
    std::fprintf(stderr, "relite: Compiler: invalid pattern \"%s\" at offset %zu: %s\n",
                 cfg.pattern.c_str(), re.error_offset(), relite::regex::describe(re.error()));
    return kExitError;
  }

  if (opts.dump) {
    std::fputs(relite::regex::disassemble(re.program()).c_str(), stdout);
  } else if (cfg.debug) {
    std::fprintf(stderr, "relite: Compiler: %zu instructions for \"%s\"\n%s",
                 re.program().size(), cfg.pattern.c_str(),
                 relite::regex::disassemble(re.program()).c_str());
  }

  auto input = opts.input_path.empty()
      ? relite::util::read_stream_bytes(stdin, cfg.max_input_bytes)
      : relite::util::read_file_bytes(opts.input_path, cfg.max_input_bytes);
  if (!input) return kExitError;
  if (input->truncated)
    std::fprintf(stderr, "relite: input truncated to %zu bytes\n", cfg.max_input_bytes);
  if (cfg.debug)
    std::fprintf(stderr, "relite: input size %zu\n", input->data.size());

  RunError err = RunError::NONE;
  if (opts.search) {
    std::ptrdiff_t at = re.search(input->data, &err);
    if (err != RunError::NONE) {
      std::fprintf(stderr, "relite: Vm: %s\n", relite::regex::describe(err));
      return kExitError;
    }
    if (at < 0) {
      std::puts("no match");
      return kExitNoMatch;
    }
    std::printf("match at %td\n", at);
    return kExitMatch;
  }

  relite::regex::RunStats stats{};
  auto matched = relite::regex::run(re.program(), input->data, re.limits(), &err, &stats);
  if (cfg.debug)
    std::fprintf(stderr, "relite: Vm: %zu steps, %zu sweeps, peak %zu threads\n",
                 stats.steps, stats.sweeps, stats.peak_threads);
  if (!matched) {
    std::fprintf(stderr, "relite: Vm: %s\n", relite::regex::describe(err));
    return kExitError;
  }
  std::puts(*matched ? "match" : "no match");
  return *matched ? kExitMatch : kExitNoMatch;
}
