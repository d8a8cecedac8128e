#include "regex/Regex.hpp"

namespace relite::regex {

Regex::Regex(std::string_view pattern, RunLimits limits)
    : pattern_(pattern), limits_(limits) {
    Compiler c(pattern_);
    program_ = c.compile();
    error_ = c.error();
    error_offset_ = c.error_offset();
}

const Program& Regex::program() const {
    static const Program empty{};
    return program_ ? *program_ : empty;
}

std::optional<bool> Regex::match(std::string_view input, RunError* err) const {
    if (err) *err = RunError::NONE;
    if (!program_) return std::nullopt;
    return run(*program_, input, limits_, err);
}

std::ptrdiff_t Regex::search(std::string_view input, RunError* err) const {
    if (err) *err = RunError::NONE;
    if (!program_) return -1;
    return regex::search(*program_, input, limits_, err);
}

} // namespace relite::regex
