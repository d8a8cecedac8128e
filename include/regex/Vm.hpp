#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include "regex/Program.hpp"

namespace relite::regex {

enum class RunError : uint8_t {
    NONE,
    THREAD_LIMIT,   // live thread count exceeded RunLimits::max_threads
    STEP_LIMIT,     // dispatched instructions exceeded RunLimits::max_steps
    OUT_OF_MEMORY,  // growing the thread set failed
};

const char* describe(RunError e);

// Bounds for a single run(). 0 disables a limit.
// Threads are never deduplicated, so nested loops (a**, (a+)+) can grow the
// thread set exponentially. max_steps is off by default: a run that does not
// hit max_threads always terminates.
struct RunLimits {
    std::size_t max_threads{1u << 20};
    std::size_t max_steps{0};
};

struct RunStats {
    std::size_t steps{0};
    std::size_t sweeps{0};
    std::size_t peak_threads{0};
};

// One simulated NFA path: program counter and input position.
// idle counts JMP/SPLIT instructions on this path since input was last
// consumed; a path longer than the program has looped without progress.
struct Thread {
    uint32_t    pc;
    uint32_t    idle;
    std::size_t sp;
};

// Execute `prog` against `input` starting at offset 0.
// Returns true once any thread reaches MATCH (trailing input is ignored),
// false when every thread has died, std::nullopt on a RunError.
//
// Threads are visited in insertion order. CHAR/ANY advance a thread by one
// byte or drop it, JMP is followed immediately within the same sweep, SPLIT
// continues at its first target and appends a thread for the second.
// A thread that runs more JMP/SPLIT instructions than the program holds
// without consuming a byte is dropped: it is on an empty loop and repeats a
// path some other thread already follows.
[[nodiscard]] std::optional<bool> run(const Program& prog, std::string_view input,
                                      const RunLimits& limits = {},
                                      RunError* err = nullptr,
                                      RunStats* stats = nullptr);

// First offset at which run() accepts input.substr(offset), or -1.
// Returns -1 with *err set if an attempt fails.
[[nodiscard]] std::ptrdiff_t search(const Program& prog, std::string_view input,
                         const RunLimits& limits = {},
                         RunError* err = nullptr);

} // namespace relite::regex
