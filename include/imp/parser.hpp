#pragma once
#include "imp/ast.hpp"
#include "imp/combinators.hpp"
#include "imp/precedence.hpp"
#include "imp/token.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace imp {

// Parse a whole program. Fails (std::nullopt) unless every token is consumed.
std::optional<stmt_ptr> imp_parse(const token_list& tokens);

// Grammar rules. Each call builds a fresh, stateless parser; rules that refer back
// to themselves go through pc::lazy so construction terminates.
namespace grammar {

using pc::parser;

parser<stmt_ptr> program(); // phrase(stmt_list)

// Statements
parser<stmt_ptr> stmt_list();
parser<stmt_ptr> stmt();
parser<stmt_ptr> assignment();
parser<stmt_ptr> conditional();
parser<stmt_ptr> while_loop();

// Boolean expressions
parser<bexp_ptr> bexp();
parser<bexp_ptr> bexp_term();
parser<bexp_ptr> bexp_not();
parser<bexp_ptr> bexp_relop();
parser<bexp_ptr> bexp_group();

// Arithmetic expressions
parser<aexp_ptr> aexp();
parser<aexp_ptr> aexp_term();
parser<aexp_ptr> aexp_value();
parser<aexp_ptr> aexp_group();

parser<std::int64_t> num();
parser<std::string> id();

const pc::precedence_levels& aexp_precedence_levels(); // {{*, /}, {+, -}}
const pc::precedence_levels& bexp_precedence_levels(); // {{and}, {or}}

pc::combiner<aexp_ptr> process_binop(const std::string& op);
// Throws std::logic_error for anything other than "and" / "or".
pc::combiner<bexp_ptr> process_logic(const std::string& op);

} // namespace grammar

} // namespace imp
