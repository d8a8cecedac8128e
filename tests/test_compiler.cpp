#include "minitest.hpp"
#include "regex/Compiler.hpp"

#include <string>
#include <vector>

using namespace relite::regex;

static std::vector<Instruction> code_of(const char* pattern) {
    auto prog = compile(pattern);
    if (!prog) throw ::mini::AssertionError(std::string("pattern failed to compile: ") + pattern);
    return prog->instructions();
}

static const char* const kValidPatterns[] = {
    "a", "abc", "a.c", "...", "ab*c", "ab+c", "c(ab)*c", "(a|b)*",
    "((ab)+c)*d", "a**", "a+*+", "x(y(z)*)+", "ab|cd|ef", "(((a)))",
    "a.+b*|c", "(ab", "a|", "hello world", "((((((((((a))))))))))",
};

// ============================================================================
// EMITTED CODE
// ============================================================================

TEST(compile_literals) {
    auto code = code_of("abc");
    ASSERT_EQ(code.size(), 4u);
    ASSERT_TRUE(code[0] == Instruction::make_char('a'));
    ASSERT_TRUE(code[1] == Instruction::make_char('b'));
    ASSERT_TRUE(code[2] == Instruction::make_char('c'));
    ASSERT_TRUE(code[3] == Instruction::make_match());
}

TEST(compile_dot_is_any) {
    auto code = code_of("a.c");
    ASSERT_TRUE(code[1] == Instruction::make_any());
}

TEST(compile_star_wraps_atom) {
    // 0 char a | 1 split 2,4 | 2 char b | 3 jmp 1 | 4 char c | 5 match
    std::vector<Instruction> want = {
        Instruction::make_char('a'),
        Instruction::make_split(2, 4),
        Instruction::make_char('b'),
        Instruction::make_jmp(1),
        Instruction::make_char('c'),
        Instruction::make_match(),
    };
    ASSERT_TRUE(code_of("ab*c") == want);
}

TEST(compile_plus_loops_back) {
    std::vector<Instruction> want = {
        Instruction::make_char('a'),
        Instruction::make_char('b'),
        Instruction::make_split(1, 3),
        Instruction::make_char('c'),
        Instruction::make_match(),
    };
    ASSERT_TRUE(code_of("ab+c") == want);
}

TEST(compile_star_over_group) {
    std::vector<Instruction> want = {
        Instruction::make_char('c'),
        Instruction::make_split(2, 5),
        Instruction::make_char('a'),
        Instruction::make_char('b'),
        Instruction::make_jmp(1),
        Instruction::make_char('c'),
        Instruction::make_match(),
    };
    ASSERT_TRUE(code_of("c(ab)*c") == want);
}

TEST(compile_alternation_applies_to_last_atom) {
    // Left branch falls through into the right one; no jump past it.
    std::vector<Instruction> want = {
        Instruction::make_char('a'),
        Instruction::make_split(2, 3),
        Instruction::make_char('b'),
        Instruction::make_char('c'),
        Instruction::make_match(),
    };
    ASSERT_TRUE(code_of("ab|c") == want);
}

TEST(compile_star_renumbers_shifted_targets) {
    std::vector<Instruction> want = {
        Instruction::make_split(1, 5),
        Instruction::make_split(2, 3),
        Instruction::make_char('a'),
        Instruction::make_char('b'),
        Instruction::make_jmp(0),
        Instruction::make_match(),
    };
    ASSERT_TRUE(code_of("(a|b)*") == want);
}

TEST(compile_nested_star_renumbers_inner_jump) {
    auto code = code_of("(ab+)*");
    // split 1,5 | a | b | split 2,4 | jmp 0 | match
    ASSERT_EQ(code.size(), 6u);
    ASSERT_TRUE(code[0] == Instruction::make_split(1, 5));
    ASSERT_TRUE(code[3] == Instruction::make_split(2, 4));
    ASSERT_TRUE(code[4] == Instruction::make_jmp(0));
}

TEST(compile_unclosed_group_is_accepted) {
    auto code = code_of("(ab");
    ASSERT_EQ(code.size(), 3u);
}

// ============================================================================
// STRUCTURAL INVARIANTS
// ============================================================================

TEST(compile_size_matches_formula) {
    for (const char* p : kValidPatterns) {
        auto prog = compile(p);
        ASSERT_TRUE(prog.has_value());
        if (prog->size() != program_size(p))
            throw ::mini::AssertionError(std::string("size mismatch for ") + p);
    }
}

TEST(compile_size_formula_counts) {
    ASSERT_EQ(program_size(""), 1u);
    ASSERT_EQ(program_size("abc"), 4u);
    ASSERT_EQ(program_size("a+"), 3u);
    ASSERT_EQ(program_size("a*"), 4u);
    ASSERT_EQ(program_size("(a)"), 2u);
    ASSERT_EQ(program_size("a|b"), 4u);
}

TEST(compile_single_trailing_match) {
    for (const char* p : kValidPatterns) {
        auto prog = compile(p);
        ASSERT_TRUE(prog.has_value());
        ASSERT_TRUE((*prog)[prog->size() - 1].op == Op::MATCH);
        int matches = 0;
        for (const auto& ins : *prog)
            if (ins.op == Op::MATCH) ++matches;
        ASSERT_EQ(matches, 1);
    }
}

TEST(compile_targets_in_range) {
    for (const char* p : kValidPatterns) {
        auto prog = compile(p);
        ASSERT_TRUE(prog.has_value());
        for (const auto& ins : *prog) {
            if (ins.op == Op::JMP) ASSERT_TRUE(ins.x < prog->size());
            if (ins.op == Op::SPLIT) {
                ASSERT_TRUE(ins.x < prog->size());
                ASSERT_TRUE(ins.y < prog->size());
            }
        }
    }
}

TEST(compile_is_deterministic) {
    for (const char* p : kValidPatterns) {
        auto a = compile(p);
        auto b = compile(p);
        ASSERT_TRUE(a.has_value() && b.has_value());
        ASSERT_TRUE(*a == *b);
    }
}

TEST(compile_empty_pattern) {
    auto prog = compile("");
    ASSERT_TRUE(prog.has_value());
    ASSERT_EQ(prog->size(), 1u);
    ASSERT_TRUE((*prog)[0].op == Op::MATCH);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(compile_leading_plus_fails) {
    CompileError err = CompileError::NONE;
    ASSERT_FALSE(compile("+ab", &err).has_value());
    ASSERT_TRUE(err == CompileError::NOTHING_TO_REPEAT);
}

TEST(compile_unmatched_close_fails) {
    CompileError err = CompileError::NONE;
    ASSERT_FALSE(compile("a)", &err).has_value());
    ASSERT_TRUE(err == CompileError::UNMATCHED_CLOSE);
}

TEST(compile_group_overflow_fails) {
    CompileError err = CompileError::NONE;
    ASSERT_FALSE(compile("(((((((((((a", &err).has_value());
    ASSERT_TRUE(err == CompileError::GROUP_OVERFLOW);

    Compiler c("(((((((((((a");
    ASSERT_FALSE(c.compile().has_value());
    ASSERT_EQ(c.error_offset(), 10u);
}

TEST(compile_ten_nested_groups_ok) {
    CompileError err = CompileError::GROUP_OVERFLOW;
    ASSERT_TRUE(compile("((((((((((a))))))))))", &err).has_value());
    ASSERT_TRUE(err == CompileError::NONE);
}

TEST(compile_quantifier_without_operand_fails) {
    const char* bad[] = { "*a", "|a", "a(+)", "a()*", "a|*", "(|b)" };
    for (const char* p : bad) {
        CompileError err = CompileError::NONE;
        ASSERT_FALSE(compile(p, &err).has_value());
        ASSERT_TRUE(err == CompileError::NOTHING_TO_REPEAT);
    }
}

TEST(compile_error_offset) {
    Compiler c("ab)c");
    ASSERT_FALSE(c.compile().has_value());
    ASSERT_TRUE(c.error() == CompileError::UNMATCHED_CLOSE);
    ASSERT_EQ(c.error_offset(), 2u);
}

TEST(compile_describe_errors) {
    ASSERT_EQ(std::string(describe(CompileError::UNMATCHED_CLOSE)), "closing group without matching open");
    ASSERT_EQ(std::string(describe(CompileError::GROUP_OVERFLOW)), "groups nested too deeply");
}

// ============================================================================
// DISASSEMBLY
// ============================================================================

TEST(disassemble_lists_each_instruction) {
    auto prog = compile("ab*.");
    ASSERT_TRUE(prog.has_value());
    std::string want =
        "000  char 'a'\n"
        "001  split 2, 4\n"
        "002  char 'b'\n"
        "003  jmp 1\n"
        "004  any\n"
        "005  match\n";
    ASSERT_EQ(disassemble(*prog), want);
}

TEST(disassemble_non_printable_byte) {
    ASSERT_EQ(to_string(Instruction::make_char(0x01)), std::string("char 0x01"));
}

TEST(disassemble_wide_indices) {
    auto prog = compile(std::string(1500, 'a'));
    ASSERT_TRUE(prog.has_value());
    std::string text = disassemble(*prog);
    ASSERT_TRUE(text.find("\n999  char 'a'\n1000  char 'a'\n") != std::string::npos);
    ASSERT_TRUE(text.find("\n1500  match\n") != std::string::npos);
}
