#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "regex/Compiler.hpp"
#include "regex/Program.hpp"
#include "regex/Vm.hpp"

namespace relite::regex {

// Compiled pattern plus the limits it runs under.
// Supports: literals . * + | ()   (no classes, anchors or escapes)
// Matching is anchored at the start of the input only; trailing bytes after
// a match are ignored. Use search() to try every start offset.
class Regex {
public:
    explicit Regex(std::string_view pattern, RunLimits limits = {});

    // Did the pattern compile successfully?
    [[nodiscard]] bool valid() const { return program_.has_value(); }
    [[nodiscard]] CompileError error() const { return error_; }
    [[nodiscard]] std::size_t error_offset() const { return error_offset_; }
    [[nodiscard]] const std::string& pattern() const { return pattern_; }

    // Empty program (see Program()) when !valid().
    [[nodiscard]] const Program& program() const;

    [[nodiscard]] const RunLimits& limits() const { return limits_; }
    void set_limits(const RunLimits& limits) { limits_ = limits; }

    // std::nullopt if the pattern is invalid or the run hit a limit.
    [[nodiscard]] std::optional<bool> match(std::string_view input, RunError* err = nullptr) const;

    // First accepting start offset, -1 if none (or on error, see err).
    [[nodiscard]] std::ptrdiff_t search(std::string_view input, RunError* err = nullptr) const;

private:
    std::string pattern_;
    std::optional<Program> program_;
    CompileError error_{CompileError::NONE};
    std::size_t error_offset_{0};
    RunLimits limits_;
};

} // namespace relite::regex
