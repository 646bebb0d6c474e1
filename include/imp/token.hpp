// Token model shared by the lexer and the parser combinators
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace imp {

enum class token_tag {
    reserved,   // keywords and punctuation
    integer,
    identifier,
};

struct token {
    token_tag tag;
    std::string text;
};

using token_list = std::vector<token>;

inline bool operator==(const token& a, const token& b) { return a.tag == b.tag && a.text == b.text; }
inline bool operator!=(const token& a, const token& b) { return !(a == b); }

inline const char* tag_name(token_tag t) {
    switch (t) {
    case token_tag::reserved: return "reserved";
    case token_tag::integer: return "integer";
    case token_tag::identifier: return "identifier";
    }
    return "<unknown>";
}

inline token make_token(token_tag t, std::string text) { return token{t, std::move(text)}; }

} // namespace imp
