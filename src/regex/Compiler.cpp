#include "regex/Compiler.hpp"
#include <utility>

namespace relite::regex {

const char* describe(CompileError e) {
    switch (e) {
        case CompileError::NONE:              return "no error";
        case CompileError::NOTHING_TO_REPEAT: return "quantifier or alternation has nothing to apply to";
        case CompileError::UNMATCHED_CLOSE:   return "closing group without matching open";
        case CompileError::GROUP_OVERFLOW:    return "groups nested too deeply";
    }
    return "unknown error";
}

std::size_t program_size(std::string_view pattern) {
    std::size_t size = 1; // trailing MATCH
    for (char c : pattern) {
        switch (c) {
            case '(': case ')': break;
            case '*': size += 2; break;
            default:  size += 1; break; // literal, '.', '+', '|'
        }
    }
    return size;
}

// ── Emission helpers ───────────────────────────────────────────────────

bool Compiler::fail(CompileError e, std::size_t offset) {
    error_ = e;
    error_offset_ = offset;
    return false;
}

void Compiler::emit_atom(const Instruction& ins) {
    top().mark = pos();
    top().has_atom = true;
    out_.push_back(ins);
}

void Compiler::shift_right(uint32_t from) {
    out_.push_back(Instruction{});
    for (uint32_t j = pos() - 1; j > from; --j) {
        Instruction ins = out_[j - 1];
        if (ins.op == Op::SPLIT) {
            ins.x += 1;
            ins.y += 1;
        } else if (ins.op == Op::JMP) {
            ins.x += 1;
        }
        out_[j] = ins;
    }
}

bool Compiler::open_group() {
    if (depth_ >= MAX_GROUP_DEPTH) return false;
    // The group as a whole becomes the current atom of the enclosing level
    // once it closes.
    top().mark = pos();
    top().has_atom = false;
    ++depth_;
    top() = Level{pos(), false};
    return true;
}

bool Compiler::close_group() {
    if (depth_ == 0) return false;
    --depth_;
    top().has_atom = pos() > top().mark;
    return true;
}

bool Compiler::one_or_more() {
    if (!top().has_atom) return false;
    uint32_t i = pos();
    out_.push_back(Instruction::make_split(top().mark, i + 1));
    return true;
}

bool Compiler::zero_or_more() {
    if (!top().has_atom) return false;
    uint32_t mark = top().mark;
    uint32_t i = pos();
    shift_right(mark);
    out_[mark] = Instruction::make_split(mark + 1, i + 2);
    out_.push_back(Instruction::make_jmp(mark));
    return true;
}

// The left alternative is the current atom. No JMP is appended after it:
// the left branch falls through into the right alternative's code.
bool Compiler::alternate() {
    if (!top().has_atom) return false;
    uint32_t mark = top().mark;
    uint32_t i = pos();
    shift_right(mark);
    out_[mark] = Instruction::make_split(mark + 1, i + 1);
    top().has_atom = false;
    return true;
}

// ── Compile ────────────────────────────────────────────────────────────

std::optional<Program> Compiler::compile() {
    out_.clear();
    levels_.fill(Level{});
    depth_ = 0;
    error_ = CompileError::NONE;
    error_offset_ = 0;

    out_.reserve(program_size(pattern_));

    for (std::size_t off = 0; off < pattern_.size(); ++off) {
        auto c = (uint8_t)pattern_[off];
        bool ok = true;
        switch (c) {
            case '(':
                ok = open_group() || fail(CompileError::GROUP_OVERFLOW, off);
                break;
            case ')':
                ok = close_group() || fail(CompileError::UNMATCHED_CLOSE, off);
                break;
            case '+':
                ok = one_or_more() || fail(CompileError::NOTHING_TO_REPEAT, off);
                break;
            case '*':
                ok = zero_or_more() || fail(CompileError::NOTHING_TO_REPEAT, off);
                break;
            case '|':
                ok = alternate() || fail(CompileError::NOTHING_TO_REPEAT, off);
                break;
            case '.':
                emit_atom(Instruction::make_any());
                break;
            default:
                emit_atom(Instruction::make_char(c));
                break;
        }
        if (!ok) {
            out_.clear();
            return std::nullopt;
        }
    }

    out_.push_back(Instruction::make_match());
    return Program(std::move(out_));
}

std::optional<Program> compile(std::string_view pattern, CompileError* err) {
    Compiler c(pattern);
    auto prog = c.compile();
    if (err) *err = c.error();
    return prog;
}

} // namespace relite::regex
