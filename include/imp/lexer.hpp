#pragma once
#include "imp/token.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace imp {

struct lex_error : std::runtime_error {
    lex_error(const std::string& msg, int ln, int cl) : std::runtime_error(msg), line(ln), col(cl) {}
    int line;
    int col;
};

// Tokenize IMP source text. Whitespace and '#' line comments are dropped.
// Throws lex_error (1-based line/col) at the first character that starts no token.
token_list lex(std::string_view src, std::string_view filename = "<memory>");

} // namespace imp
