#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include "regex/Program.hpp"

namespace relite::regex {

enum class CompileError : uint8_t {
    NONE,
    NOTHING_TO_REPEAT,  // + * | with no preceding sub-expression
    UNMATCHED_CLOSE,    // ) with no open group
    GROUP_OVERFLOW,     // more than MAX_GROUP_DEPTH open groups
};

const char* describe(CompileError e);

// Thompson-construction compiler.
// Single left-to-right pass over the pattern, emitting straight into the
// instruction buffer. * and | insert a SPLIT in front of the sub-expression
// they apply to by shifting it right one slot and renumbering its targets.
// Metacharacters: ( ) * + | .   Every other byte is a literal.
class Compiler {
public:
    static constexpr int MAX_GROUP_DEPTH = 10;

    explicit Compiler(std::string_view pattern) : pattern_(pattern) {}

    // Compile the pattern. Returns std::nullopt on error; see error().
    [[nodiscard]] std::optional<Program> compile();

    [[nodiscard]] CompileError error() const { return error_; }
    // Byte offset in the pattern where the error was detected.
    [[nodiscard]] std::size_t error_offset() const { return error_offset_; }

private:
    // Where the current sub-expression of one nesting level starts.
    struct Level {
        uint32_t mark{0};
        bool     has_atom{false};
    };

    void emit_atom(const Instruction& ins);
    bool open_group();
    bool close_group();
    bool one_or_more();
    bool zero_or_more();
    bool alternate();

    // Move out_[from, end) up one slot, bumping every moved target by one.
    void shift_right(uint32_t from);

    [[nodiscard]] Level& top() { return levels_[depth_]; }
    [[nodiscard]] uint32_t pos() const { return (uint32_t)out_.size(); }
    bool fail(CompileError e, std::size_t offset);

    std::string_view pattern_;
    std::vector<Instruction> out_;
    std::array<Level, MAX_GROUP_DEPTH + 1> levels_{};
    int depth_{0};
    CompileError error_{CompileError::NONE};
    std::size_t error_offset_{0};
};

// Exact instruction count a successful compile of `pattern` emits:
// literal/. +1, + +1, * +2, | +1, ( ) +0, trailing MATCH +1.
[[nodiscard]] std::size_t program_size(std::string_view pattern);

[[nodiscard]] std::optional<Program> compile(std::string_view pattern, CompileError* err = nullptr);

} // namespace relite::regex
