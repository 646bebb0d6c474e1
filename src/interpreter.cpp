#include "imp/interpreter.hpp"
#include <string>
#include <variant>

namespace imp {

env Interpreter::run(const stmt_ptr& program) {
    env e;
    steps_ = 0;
    exec(program, e);
    return e;
}

std::int64_t Interpreter::eval(const aexp_ptr& a, const env& e) const {
    if (!a)
        throw eval_error("null arithmetic expression");
    if (auto* i = std::get_if<int_aexp>(&a->data))
        return i->value;
    if (auto* v = std::get_if<var_aexp>(&a->data)) {
        auto it = e.find(v->name);
        return it == e.end() ? 0 : it->second;
    }
    const auto& b = std::get<binop_aexp>(a->data);
    std::int64_t l = eval(b.left, e);
    std::int64_t r = eval(b.right, e);
    if (b.op == "+") return wrapping_add(l, r);
    if (b.op == "-") return wrapping_sub(l, r);
    if (b.op == "*") return wrapping_mul(l, r);
    if (b.op == "/") {
        if (r == 0)
            throw eval_error("division by zero");
        return floor_div(l, r);
    }
    throw eval_error("unknown arithmetic operator: " + b.op);
}

bool Interpreter::eval(const bexp_ptr& b, const env& e) const {
    if (!b)
        throw eval_error("null boolean expression");
    struct V {
        const Interpreter& self;
        const env& e;
        bool operator()(const relop_bexp& x) const {
            std::int64_t l = self.eval(x.left, e);
            std::int64_t r = self.eval(x.right, e);
            if (x.op == "<") return l < r;
            if (x.op == "<=") return l <= r;
            if (x.op == ">") return l > r;
            if (x.op == ">=") return l >= r;
            if (x.op == "=") return l == r;
            if (x.op == "!=") return l != r;
            throw eval_error("unknown relational operator: " + x.op);
        }
        bool operator()(const not_bexp& x) const { return !self.eval(x.operand, e); }
        // Both operands are always evaluated (no short-circuit), matching the compiled form.
        bool operator()(const and_bexp& x) const {
            bool l = self.eval(x.left, e);
            bool r = self.eval(x.right, e);
            return l && r;
        }
        bool operator()(const or_bexp& x) const {
            bool l = self.eval(x.left, e);
            bool r = self.eval(x.right, e);
            return l || r;
        }
    };
    return std::visit(V{*this, e}, b->data);
}

void Interpreter::exec(const stmt_ptr& s, env& e) {
    if (!s)
        throw eval_error("null statement");
    if (auto* a = std::get_if<assign_stmt>(&s->data)) {
        e[a->name] = eval(a->value, e);
        return;
    }
    if (std::holds_alternative<compound_stmt>(s->data)) {
        for (const auto& part : flatten_sequence(s))
            exec(part, e);
        return;
    }
    if (auto* i = std::get_if<if_stmt>(&s->data)) {
        if (eval(i->condition, e))
            exec(i->true_branch, e);
        else if (i->false_branch)
            exec(i->false_branch, e);
        return;
    }
    const auto& w = std::get<while_stmt>(s->data);
    while (eval(w.condition, e)) {
        if (max_steps_ && ++steps_ > max_steps_)
            throw eval_error("step limit of " + std::to_string(max_steps_) + " loop iterations exceeded");
        exec(w.body, e);
    }
}

} // namespace imp
