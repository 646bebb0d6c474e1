#include "imp/lexer.hpp"
#include <tao/pegtl.hpp>
#include <cstdio>
#include <string>

namespace imp::lexer_front {

namespace grammar {
using namespace tao::pegtl;

struct comment : seq< one<'#'>, until< eolf > > {};
struct skip : sor< space, comment > {};

// Words are matched whole: "android" is an identifier, not "and" followed by "roid".
struct reserved_word : sor< keyword<'a','n','d'>, keyword<'o','r'>, keyword<'n','o','t'>,
                            keyword<'i','f'>, keyword<'t','h','e','n'>, keyword<'e','l','s','e'>,
                            keyword<'w','h','i','l','e'>, keyword<'d','o'>, keyword<'e','n','d'> > {};
// Two-character symbols first so "<=" never lexes as "<" "=".
struct reserved_symbol : sor< string<':','='>, string<'<','='>, string<'>','='>, string<'!','='>,
                              one<'(',')',';','+','-','*','/','<','>','='> > {};
struct integer : plus< digit > {};
struct ident_first : ranges<'a','z','A','Z'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct identifier : seq< ident_first, star< ident_rest > > {};

struct token_rule : sor< reserved_word, reserved_symbol, integer, identifier > {};
struct file : seq< star< skip >, star< token_rule, star< skip > >, must< eof > > {};

} // namespace grammar

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<token_tag Tag>
struct push_token {
    template<typename ActionInput>
    static void apply(const ActionInput& in, token_list& out) { out.push_back(token{Tag, in.string()}); }
};

template<> struct action< grammar::reserved_word > : push_token<token_tag::reserved> {};
template<> struct action< grammar::reserved_symbol > : push_token<token_tag::reserved> {};
template<> struct action< grammar::integer > : push_token<token_tag::integer> {};
template<> struct action< grammar::identifier > : push_token<token_tag::identifier> {};

} // namespace actions

} // namespace imp::lexer_front

namespace imp {

// The whole UTF-8 sequence starting at pos, or \xNN when the byte does not start a valid one.
static std::string offending_char(std::string_view src, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(src[pos]);
    std::size_t len = lead < 0x80 ? 1 : (lead & 0xE0) == 0xC0 ? 2 : (lead & 0xF0) == 0xE0 ? 3 : (lead & 0xF8) == 0xF0 ? 4 : 0;
    bool valid = len != 0 && pos + len <= src.size();
    for (std::size_t i = 1; valid && i < len; ++i)
        valid = (static_cast<unsigned char>(src[pos + i]) & 0xC0) == 0x80;
    if (valid && (len > 1 || lead >= 0x20))
        return std::string(src.substr(pos, len));
    char buf[5];
    std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(lead));
    return buf;
}

token_list lex(std::string_view src, std::string_view filename) {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    token_list out;
    try {
        tao::pegtl::parse< lexer_front::grammar::file, lexer_front::actions::action >(in, out);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        std::string msg = "unexpected character";
        if (p.byte < src.size())
            msg += " '" + offending_char(src, p.byte) + "'";
        throw lex_error(msg, static_cast<int>(p.line), static_cast<int>(p.column));
    }
    return out;
}

} // namespace imp
