#include "imp/parser.hpp"
#include <charconv>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace imp {

std::optional<stmt_ptr> imp_parse(const token_list& tokens) {
    auto r = grammar::program()(tokens, 0);
    if (!r)
        return std::nullopt;
    return r->value;
}

namespace grammar {

using pc::alternate;
using pc::keyword;
using pc::lazy;
using pc::map;
using pc::sequence;

parser<std::int64_t> num() {
    return pc::try_map(pc::tag(token_tag::integer), [](const std::string& text) -> std::optional<std::int64_t> {
        std::int64_t v = 0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, v);
        if (ec != std::errc() || ptr != end)
            return std::nullopt; // out of range for i64
        return v;
    });
}

parser<std::string> id() { return pc::tag(token_tag::identifier); }

parser<stmt_ptr> program() { return pc::phrase(stmt_list()); }

// ------ Statements ------

parser<stmt_ptr> stmt_list() {
    auto separator = map(keyword(";"), [](const std::string&) -> pc::combiner<stmt_ptr> {
        return [](stmt_ptr l, stmt_ptr r) { return make_compound(std::move(l), std::move(r)); };
    });
    return pc::fold_separated(stmt(), std::move(separator));
}

parser<stmt_ptr> stmt() { return alternate(alternate(assignment(), conditional()), while_loop()); }

parser<stmt_ptr> assignment() {
    // ((name ':=') aexp)
    auto p = sequence(sequence(id(), keyword(":=")), aexp());
    return map(std::move(p), [](const auto& parsed) { return make_assign(parsed.first.first, parsed.second); });
}

parser<stmt_ptr> conditional() {
    auto else_part = pc::optional(sequence(keyword("else"), lazy(stmt_list)));
    auto p = sequence(
        sequence(sequence(sequence(sequence(keyword("if"), bexp()), keyword("then")), lazy(stmt_list)), std::move(else_part)),
        keyword("end"));
    return map(std::move(p), [](const auto& parsed) {
        // (((((if cond) then) true) else?) end)
        const auto& head = parsed.first;
        const auto& condition = head.first.first.first.second;
        const auto& true_branch = head.first.second;
        stmt_ptr false_branch = head.second ? head.second->second : nullptr;
        return make_if(condition, true_branch, std::move(false_branch));
    });
}

parser<stmt_ptr> while_loop() {
    auto p = sequence(sequence(sequence(sequence(keyword("while"), bexp()), keyword("do")), lazy(stmt_list)), keyword("end"));
    return map(std::move(p), [](const auto& parsed) {
        // ((((while cond) do) body) end)
        const auto& head = parsed.first;
        return make_while(head.first.first.second, head.second);
    });
}

// ------ Boolean expressions ------

const pc::precedence_levels& bexp_precedence_levels() {
    static const pc::precedence_levels levels = {{"and"}, {"or"}};
    return levels;
}

pc::combiner<bexp_ptr> process_logic(const std::string& op) {
    if (op == "and")
        return [](bexp_ptr l, bexp_ptr r) { return make_and(std::move(l), std::move(r)); };
    if (op == "or")
        return [](bexp_ptr l, bexp_ptr r) { return make_or(std::move(l), std::move(r)); };
    throw std::logic_error("unknown logic operator: " + op);
}

parser<bexp_ptr> bexp() { return pc::precedence(bexp_term(), bexp_precedence_levels(), process_logic); }

parser<bexp_ptr> bexp_term() { return alternate(alternate(bexp_not(), bexp_relop()), bexp_group()); }

parser<bexp_ptr> bexp_not() {
    return map(sequence(keyword("not"), lazy(bexp_term)), [](const auto& parsed) { return make_not(parsed.second); });
}

parser<bexp_ptr> bexp_relop() {
    static const std::vector<std::string> relops = {"<", "<=", ">", ">=", "=", "!="};
    auto p = sequence(sequence(aexp(), pc::any_operator_in_list(relops)), aexp());
    return map(std::move(p), [](const auto& parsed) {
        const auto& [left, op] = parsed.first;
        return make_relop(op, left, parsed.second);
    });
}

parser<bexp_ptr> bexp_group() {
    auto p = sequence(sequence(keyword("("), lazy(bexp)), keyword(")"));
    return map(std::move(p), [](const auto& parsed) { return parsed.first.second; });
}

// ------ Arithmetic expressions ------

const pc::precedence_levels& aexp_precedence_levels() {
    static const pc::precedence_levels levels = {{"*", "/"}, {"+", "-"}};
    return levels;
}

pc::combiner<aexp_ptr> process_binop(const std::string& op) {
    return [op](aexp_ptr l, aexp_ptr r) { return make_binop(op, std::move(l), std::move(r)); };
}

parser<aexp_ptr> aexp() { return pc::precedence(aexp_term(), aexp_precedence_levels(), process_binop); }

parser<aexp_ptr> aexp_term() { return alternate(aexp_value(), aexp_group()); }

parser<aexp_ptr> aexp_value() {
    return alternate(map(num(), [](std::int64_t v) { return make_int(v); }),
                     map(id(), [](const std::string& name) { return make_var(name); }));
}

parser<aexp_ptr> aexp_group() {
    auto p = sequence(sequence(keyword("("), lazy(aexp)), keyword(")"));
    return map(std::move(p), [](const auto& parsed) { return parsed.first.second; });
}

} // namespace grammar

} // namespace imp
