#pragma once

#include <cstdint>
#include <string>

namespace relite::regex {

enum class Op : uint8_t { CHAR, ANY, MATCH, JMP, SPLIT };

// One bytecode step. Payload use per op:
//   CHAR  -- ch
//   JMP   -- x (target)
//   SPLIT -- x (preferred target), y (second target)
struct Instruction {
    Op       op{Op::MATCH};
    uint8_t  ch{0};
    uint32_t x{0};
    uint32_t y{0};

    static constexpr Instruction make_char(uint8_t c) { return {Op::CHAR, c, 0, 0}; }
    static constexpr Instruction make_any()           { return {Op::ANY, 0, 0, 0}; }
    static constexpr Instruction make_match()         { return {Op::MATCH, 0, 0, 0}; }
    static constexpr Instruction make_jmp(uint32_t target) { return {Op::JMP, 0, target, 0}; }
    static constexpr Instruction make_split(uint32_t a, uint32_t b) { return {Op::SPLIT, 0, a, b}; }

    [[nodiscard]] bool is_branch() const { return op == Op::JMP || op == Op::SPLIT; }

    bool operator==(const Instruction&) const = default;
};

// "char 'a'", "any", "match", "jmp 3", "split 1, 4"
std::string to_string(const Instruction& ins);

} // namespace relite::regex
