#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "regex/Instruction.hpp"

namespace relite::regex {

// Compiled instruction sequence. Read-only once built; the compiler is the
// only producer of non-empty programs, which always end in their single MATCH.
// Safe to share between any number of run() calls.
class Program {
public:
    // Empty program: the "no program" value handed out for a pattern that
    // failed to compile. It holds no MATCH, so run() rejects every input.
    Program() = default;

    [[nodiscard]] std::size_t size() const { return code_.size(); }
    [[nodiscard]] bool empty() const { return code_.empty(); }
    [[nodiscard]] const Instruction& operator[](std::size_t pc) const { return code_[pc]; }

    [[nodiscard]] std::vector<Instruction>::const_iterator begin() const { return code_.begin(); }
    [[nodiscard]] std::vector<Instruction>::const_iterator end() const { return code_.end(); }

    [[nodiscard]] const std::vector<Instruction>& instructions() const { return code_; }

    bool operator==(const Program&) const = default;

private:
    friend class Compiler;
    explicit Program(std::vector<Instruction> code) : code_(std::move(code)) {}

    std::vector<Instruction> code_;
};

// One instruction per line, prefixed with its zero-padded index.
std::string disassemble(const Program& prog);

} // namespace relite::regex
