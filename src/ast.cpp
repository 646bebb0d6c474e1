// Structural equality and S-expression printing for the IMP AST.
#include "imp/ast.hpp"
#include <string>
#include <type_traits>
#include <vector>

namespace imp {

bool equal(const aexp_ptr& a, const aexp_ptr& b) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	struct Visitor {
		const aexp& b;
		bool operator()(const int_aexp& x) const { return x.value == std::get<int_aexp>(b.data).value; }
		bool operator()(const var_aexp& x) const { return x.name == std::get<var_aexp>(b.data).name; }
		bool operator()(const binop_aexp& x) const {
			const auto& y = std::get<binop_aexp>(b.data);
			return x.op == y.op && equal(x.left, y.left) && equal(x.right, y.right);
		}
	};
	return std::visit(Visitor{*b}, a->data);
}

bool equal(const bexp_ptr& a, const bexp_ptr& b) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	struct Visitor {
		const bexp& b;
		bool operator()(const relop_bexp& x) const {
			const auto& y = std::get<relop_bexp>(b.data);
			return x.op == y.op && equal(x.left, y.left) && equal(x.right, y.right);
		}
		bool operator()(const not_bexp& x) const { return equal(x.operand, std::get<not_bexp>(b.data).operand); }
		bool operator()(const and_bexp& x) const {
			const auto& y = std::get<and_bexp>(b.data);
			return equal(x.left, y.left) && equal(x.right, y.right);
		}
		bool operator()(const or_bexp& x) const {
			const auto& y = std::get<or_bexp>(b.data);
			return equal(x.left, y.left) && equal(x.right, y.right);
		}
	};
	return std::visit(Visitor{*b}, a->data);
}

bool equal(const stmt_ptr& a, const stmt_ptr& b) {
	// Walk the left spine of ';' chains in a loop; only nested bodies recurse.
	const stmt_ptr* pa = &a;
	const stmt_ptr* pb = &b;
	for (;;) {
		if (pa->get() == pb->get()) return true;
		if (!*pa || !*pb) return false;
		const auto* ca = std::get_if<compound_stmt>(&(*pa)->data);
		const auto* cb = std::get_if<compound_stmt>(&(*pb)->data);
		if (!ca || !cb) break;
		if (!equal(ca->second, cb->second)) return false;
		pa = &ca->first;
		pb = &cb->first;
	}
	if ((*pa)->data.index() != (*pb)->data.index()) return false;

	struct Visitor {
		const stmt& b;
		bool operator()(const assign_stmt& x) const {
			const auto& y = std::get<assign_stmt>(b.data);
			return x.name == y.name && equal(x.value, y.value);
		}
		bool operator()(const compound_stmt&) const { return false; } // handled by the loop above
		bool operator()(const if_stmt& x) const {
			const auto& y = std::get<if_stmt>(b.data);
			return equal(x.condition, y.condition) && equal(x.true_branch, y.true_branch) && equal(x.false_branch, y.false_branch);
		}
		bool operator()(const while_stmt& x) const {
			const auto& y = std::get<while_stmt>(b.data);
			return equal(x.condition, y.condition) && equal(x.body, y.body);
		}
	};
	return std::visit(Visitor{**pb}, (*pa)->data);
}

std::string to_string(const aexp_ptr& a) {
	if (!a) return "nil";
	struct V {
		std::string operator()(const int_aexp& x) const { return std::to_string(x.value); }
		std::string operator()(const var_aexp& x) const { return x.name; }
		std::string operator()(const binop_aexp& x) const { return "(" + x.op + " " + to_string(x.left) + " " + to_string(x.right) + ")"; }
	};
	return std::visit(V{}, a->data);
}

std::string to_string(const bexp_ptr& b) {
	if (!b) return "nil";
	struct V {
		std::string operator()(const relop_bexp& x) const { return "(" + x.op + " " + to_string(x.left) + " " + to_string(x.right) + ")"; }
		std::string operator()(const not_bexp& x) const { return "(not " + to_string(x.operand) + ")"; }
		std::string operator()(const and_bexp& x) const { return "(and " + to_string(x.left) + " " + to_string(x.right) + ")"; }
		std::string operator()(const or_bexp& x) const { return "(or " + to_string(x.left) + " " + to_string(x.right) + ")"; }
	};
	return std::visit(V{}, b->data);
}

std::string to_string(const stmt_ptr& s) {
	if (!s) return "nil";
	// (do (do a b) c): collect the left spine, then print it without recursing into it.
	std::vector<const compound_stmt*> spine;
	const stmt* head = s.get();
	while (head) {
		const auto* c = std::get_if<compound_stmt>(&head->data);
		if (!c) break;
		spine.push_back(c);
		head = c->first.get();
	}
	struct V {
		std::string operator()(const assign_stmt& x) const { return "(:= " + x.name + " " + to_string(x.value) + ")"; }
		std::string operator()(const compound_stmt&) const { return {}; } // unreachable, spine is unrolled
		std::string operator()(const if_stmt& x) const {
			return "(if " + to_string(x.condition) + " " + to_string(x.true_branch) + " " + to_string(x.false_branch) + ")";
		}
		std::string operator()(const while_stmt& x) const { return "(while " + to_string(x.condition) + " " + to_string(x.body) + ")"; }
	};
	std::string out;
	for (std::size_t i = 0; i < spine.size(); ++i) out += "(do ";
	out += head ? std::visit(V{}, head->data) : std::string("nil");
	for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
		out += ' ';
		out += to_string((*it)->second);
		out += ')';
	}
	return out;
}

std::vector<stmt_ptr> flatten_sequence(const stmt_ptr& s) {
	std::vector<stmt_ptr> out;
	std::vector<stmt_ptr> todo{s};
	while (!todo.empty()) {
		stmt_ptr cur = std::move(todo.back());
		todo.pop_back();
		if (cur) {
			if (const auto* c = std::get_if<compound_stmt>(&cur->data)) {
				todo.push_back(c->second);
				todo.push_back(c->first);
				continue;
			}
		}
		out.push_back(std::move(cur));
	}
	return out;
}

// Moves a node's child statements into pending. Only the owner about to release the
// node may call this.
static void detach_children(stmt& node, std::vector<stmt_ptr>& pending) {
	std::visit([&pending](auto& x) {
		using T = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<T, compound_stmt>) {
			pending.push_back(std::move(x.first));
			pending.push_back(std::move(x.second));
		} else if constexpr (std::is_same_v<T, if_stmt>) {
			pending.push_back(std::move(x.true_branch));
			pending.push_back(std::move(x.false_branch));
		} else if constexpr (std::is_same_v<T, while_stmt>) {
			pending.push_back(std::move(x.body));
		}
	}, node.data);
}

stmt::~stmt() {
	std::vector<stmt_ptr> pending;
	detach_children(*this, pending);
	while (!pending.empty()) {
		stmt_ptr cur = std::move(pending.back());
		pending.pop_back();
		// Sole owner: strip the children first so cur's own destructor finds none.
		// Statement nodes are never created const (see the factories), so the cast is sound.
		if (cur && cur.use_count() == 1)
			detach_children(const_cast<stmt&>(*cur), pending);
	}
}

} // namespace imp
