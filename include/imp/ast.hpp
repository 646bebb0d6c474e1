// IMP abstract syntax tree: immutable nodes shared through std::shared_ptr<const T>
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace imp {

struct aexp;
struct bexp;
struct stmt;

using aexp_ptr = std::shared_ptr<const aexp>;
using bexp_ptr = std::shared_ptr<const bexp>;
using stmt_ptr = std::shared_ptr<const stmt>;

// Arithmetic expressions
struct int_aexp {
    std::int64_t value;
};
struct var_aexp {
    std::string name;
};
struct binop_aexp {
    std::string op; // one of + - * /
    aexp_ptr left;
    aexp_ptr right;
};
struct aexp {
    std::variant<int_aexp, var_aexp, binop_aexp> data;
};

// Boolean expressions
struct relop_bexp {
    std::string op; // one of < <= > >= = !=
    aexp_ptr left;
    aexp_ptr right;
};
struct not_bexp {
    bexp_ptr operand;
};
struct and_bexp {
    bexp_ptr left;
    bexp_ptr right;
};
struct or_bexp {
    bexp_ptr left;
    bexp_ptr right;
};
struct bexp {
    std::variant<relop_bexp, not_bexp, and_bexp, or_bexp> data;
};

// Statements
struct assign_stmt {
    std::string name;
    aexp_ptr value;
};
struct compound_stmt {
    stmt_ptr first;
    stmt_ptr second;
};
struct if_stmt {
    bexp_ptr condition;
    stmt_ptr true_branch;
    stmt_ptr false_branch; // null when there is no else
};
struct while_stmt {
    bexp_ptr condition;
    stmt_ptr body;
};
struct stmt {
    using variant_type = std::variant<assign_stmt, compound_stmt, if_stmt, while_stmt>;

    stmt(variant_type d) : data(std::move(d)) {}
    stmt(const stmt&) = delete;
    stmt& operator=(const stmt&) = delete;
    // A program of N statements is a ';' chain N levels deep. Tearing it down
    // uses a worklist so destruction depth does not grow with program length.
    ~stmt();

    variant_type data;
};

// ------ Factories ------
inline aexp_ptr make_int(std::int64_t v) { return std::make_shared<const aexp>(aexp{int_aexp{v}}); }
inline aexp_ptr make_var(std::string name) { return std::make_shared<const aexp>(aexp{var_aexp{std::move(name)}}); }
inline aexp_ptr make_binop(std::string op, aexp_ptr l, aexp_ptr r) {
    return std::make_shared<const aexp>(aexp{binop_aexp{std::move(op), std::move(l), std::move(r)}});
}

inline bexp_ptr make_relop(std::string op, aexp_ptr l, aexp_ptr r) {
    return std::make_shared<const bexp>(bexp{relop_bexp{std::move(op), std::move(l), std::move(r)}});
}
inline bexp_ptr make_not(bexp_ptr operand) { return std::make_shared<const bexp>(bexp{not_bexp{std::move(operand)}}); }
inline bexp_ptr make_and(bexp_ptr l, bexp_ptr r) { return std::make_shared<const bexp>(bexp{and_bexp{std::move(l), std::move(r)}}); }
inline bexp_ptr make_or(bexp_ptr l, bexp_ptr r) { return std::make_shared<const bexp>(bexp{or_bexp{std::move(l), std::move(r)}}); }

inline stmt_ptr make_assign(std::string name, aexp_ptr value) {
    return std::make_shared<stmt>(assign_stmt{std::move(name), std::move(value)});
}
inline stmt_ptr make_compound(stmt_ptr first, stmt_ptr second) {
    return std::make_shared<stmt>(compound_stmt{std::move(first), std::move(second)});
}
inline stmt_ptr make_if(bexp_ptr cond, stmt_ptr t, stmt_ptr f = nullptr) {
    return std::make_shared<stmt>(if_stmt{std::move(cond), std::move(t), std::move(f)});
}
inline stmt_ptr make_while(bexp_ptr cond, stmt_ptr body) {
    return std::make_shared<stmt>(while_stmt{std::move(cond), std::move(body)});
}

// Structural deep equality. Two null pointers compare equal.
bool equal(const aexp_ptr& a, const aexp_ptr& b);
bool equal(const bexp_ptr& a, const bexp_ptr& b);
bool equal(const stmt_ptr& a, const stmt_ptr& b);

// The statements of a ';' chain in execution order, with compound nodes removed.
// Iterative, so it is safe on chains of any length. A non-compound s yields {s}.
std::vector<stmt_ptr> flatten_sequence(const stmt_ptr& s);

// S-expression rendering, e.g. (+ (* 2 3) 4) or (if (< 1 2) (:= x 1) nil)
std::string to_string(const aexp_ptr& a);
std::string to_string(const bexp_ptr& b);
std::string to_string(const stmt_ptr& s);

} // namespace imp
