#include "regex/Program.hpp"
#include <cctype>
#include <cstdio>

namespace relite::regex {

std::string to_string(const Instruction& ins) {
    char buf[48];
    switch (ins.op) {
        case Op::CHAR:
            if (std::isprint(ins.ch))
                std::snprintf(buf, sizeof(buf), "char '%c'", (char)ins.ch);
            else
                std::snprintf(buf, sizeof(buf), "char 0x%02x", (unsigned)ins.ch);
            return buf;
        case Op::ANY:   return "any";
        case Op::MATCH: return "match";
        case Op::JMP:
            std::snprintf(buf, sizeof(buf), "jmp %u", (unsigned)ins.x);
            return buf;
        case Op::SPLIT:
            std::snprintf(buf, sizeof(buf), "split %u, %u", (unsigned)ins.x, (unsigned)ins.y);
            return buf;
    }
    return "?";
}

std::string disassemble(const Program& prog) {
    std::string out;
    char idx[24];
    for (std::size_t pc = 0; pc < prog.size(); ++pc) {
        std::snprintf(idx, sizeof(idx), "%03zu  ", pc);
        out += idx;
        out += to_string(prog[pc]);
        out += '\n';
    }
    return out;
}

} // namespace relite::regex
