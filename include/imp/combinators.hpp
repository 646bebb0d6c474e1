// Parser combinators over a token sequence.
//
// A parser<T> maps (tokens, position) to either a result<T>{value, next position}
// or std::nullopt. Parsers never consume input when they fail and hold no mutable
// state, so one parser object can be reused across positions, calls and threads.
#pragma once
#include "imp/token.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace imp::pc {

template <typename T>
struct result {
    T value;
    std::size_t pos;
};

template <typename T>
using outcome = std::optional<result<T>>;

template <typename T>
class parser {
public:
    using value_type = T;
    using fn_type = std::function<outcome<T>(const token_list&, std::size_t)>;

    parser() = default;
    explicit parser(fn_type fn) : fn_(std::make_shared<const fn_type>(std::move(fn))) {}

    outcome<T> operator()(const token_list& tokens, std::size_t pos) const {
        if (!fn_)
            throw std::logic_error("imp::pc::parser: invoked an empty parser");
        return (*fn_)(tokens, pos);
    }

    explicit operator bool() const { return static_cast<bool>(fn_); }

private:
    std::shared_ptr<const fn_type> fn_;
};

// ------ Primitives ------

// One token whose text and tag both match; yields the token text.
inline parser<std::string> literal(std::string text, token_tag t) {
    return parser<std::string>([text = std::move(text), t](const token_list& tokens, std::size_t pos) -> outcome<std::string> {
        if (pos < tokens.size() && tokens[pos].tag == t && tokens[pos].text == text)
            return result<std::string>{tokens[pos].text, pos + 1};
        return std::nullopt;
    });
}

// One token of the given category; yields the token text.
inline parser<std::string> tag(token_tag t) {
    return parser<std::string>([t](const token_list& tokens, std::size_t pos) -> outcome<std::string> {
        if (pos < tokens.size() && tokens[pos].tag == t)
            return result<std::string>{tokens[pos].text, pos + 1};
        return std::nullopt;
    });
}

inline parser<std::string> keyword(std::string text) { return literal(std::move(text), token_tag::reserved); }

// ------ Combinators ------

template <typename A, typename B>
parser<std::pair<A, B>> sequence(parser<A> p1, parser<B> p2) {
    using V = std::pair<A, B>;
    return parser<V>([p1 = std::move(p1), p2 = std::move(p2)](const token_list& tokens, std::size_t pos) -> outcome<V> {
        auto r1 = p1(tokens, pos);
        if (!r1)
            return std::nullopt;
        auto r2 = p2(tokens, r1->pos);
        if (!r2)
            return std::nullopt;
        return result<V>{V{std::move(r1->value), std::move(r2->value)}, r2->pos};
    });
}

// Ordered choice: the first alternative that matches wins; p2 restarts at pos.
template <typename T>
parser<T> alternate(parser<T> p1, parser<T> p2) {
    return parser<T>([p1 = std::move(p1), p2 = std::move(p2)](const token_list& tokens, std::size_t pos) -> outcome<T> {
        if (auto r = p1(tokens, pos))
            return r;
        return p2(tokens, pos);
    });
}

template <typename A, typename F>
auto map(parser<A> p, F f) -> parser<std::decay_t<std::invoke_result_t<const F&, A>>> {
    using B = std::decay_t<std::invoke_result_t<const F&, A>>;
    return parser<B>([p = std::move(p), f = std::move(f)](const token_list& tokens, std::size_t pos) -> outcome<B> {
        auto r = p(tokens, pos);
        if (!r)
            return std::nullopt;
        return result<B>{f(std::move(r->value)), r->pos};
    });
}

// Like map, but f returns std::optional<B>; an empty optional turns the match into a failure.
template <typename A, typename F>
auto try_map(parser<A> p, F f) -> parser<typename std::decay_t<std::invoke_result_t<const F&, A>>::value_type> {
    using B = typename std::decay_t<std::invoke_result_t<const F&, A>>::value_type;
    return parser<B>([p = std::move(p), f = std::move(f)](const token_list& tokens, std::size_t pos) -> outcome<B> {
        auto r = p(tokens, pos);
        if (!r)
            return std::nullopt;
        auto mapped = f(std::move(r->value));
        if (!mapped)
            return std::nullopt;
        return result<B>{std::move(*mapped), r->pos};
    });
}

// Zero or more; never fails. A match that consumes nothing ends the repetition.
template <typename T>
parser<std::vector<T>> repeat(parser<T> p) {
    using V = std::vector<T>;
    return parser<V>([p = std::move(p)](const token_list& tokens, std::size_t pos) -> outcome<V> {
        V out;
        std::size_t cur = pos;
        while (auto r = p(tokens, cur)) {
            out.push_back(std::move(r->value));
            if (r->pos == cur)
                break;
            cur = r->pos;
        }
        return result<V>{std::move(out), cur};
    });
}

template <typename T>
parser<std::optional<T>> optional(parser<T> p) {
    using V = std::optional<T>;
    return parser<V>([p = std::move(p)](const token_list& tokens, std::size_t pos) -> outcome<V> {
        if (auto r = p(tokens, pos))
            return result<V>{V{std::move(r->value)}, r->pos};
        return result<V>{V{}, pos};
    });
}

// Defers supplier() until the first invocation and reuses the parser it returns.
// Needed wherever a rule refers back to itself, directly or through other rules.
template <typename F>
auto lazy(F supplier) -> std::decay_t<std::invoke_result_t<F&>> {
    using P = std::decay_t<std::invoke_result_t<F&>>;
    using T = typename P::value_type;
    struct state {
        explicit state(F f) : supplier(std::move(f)) {}
        std::optional<F> supplier;
        std::once_flag once;
        P resolved;
    };
    auto st = std::make_shared<state>(std::move(supplier));
    return P([st](const token_list& tokens, std::size_t pos) -> outcome<T> {
        std::call_once(st->once, [&st] {
            st->resolved = (*st->supplier)();
            st->supplier.reset();
        });
        return st->resolved(tokens, pos);
    });
}

// Succeeds only when p consumes the whole token sequence.
template <typename T>
parser<T> phrase(parser<T> p) {
    return parser<T>([p = std::move(p)](const token_list& tokens, std::size_t pos) -> outcome<T> {
        auto r = p(tokens, pos);
        if (r && r->pos == tokens.size())
            return r;
        return std::nullopt;
    });
}

} // namespace imp::pc
