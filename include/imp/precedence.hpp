// Separator fold and operator-precedence engine built on imp::pc.
#pragma once
#include "imp/combinators.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace imp::pc {

template <typename T>
using combiner = std::function<T(T, T)>;

// Operator levels, tightest first: {{"*", "/"}, {"+", "-"}} makes * bind tighter than +.
using precedence_levels = std::vector<std::vector<std::string>>;

// item (sep item)*, folded left: a;b;c -> f(f(a, b), c).
// A separator that is not followed by an item is left unconsumed.
template <typename T>
parser<T> fold_separated(parser<T> item, parser<combiner<T>> sep) {
    auto rest = repeat(sequence(std::move(sep), item));
    return map(sequence(std::move(item), std::move(rest)), [](std::pair<T, std::vector<std::pair<combiner<T>, T>>> parsed) {
        T acc = std::move(parsed.first);
        for (auto& step : parsed.second)
            acc = step.first(std::move(acc), std::move(step.second));
        return acc;
    });
}

// Ordered alternation of keyword() over ops; yields the matched operator text.
inline parser<std::string> any_operator_in_list(const std::vector<std::string>& ops) {
    if (ops.empty())
        throw std::invalid_argument("any_operator_in_list: empty operator list");
    parser<std::string> p = keyword(ops.front());
    for (std::size_t i = 1; i < ops.size(); ++i)
        p = alternate(std::move(p), keyword(ops[i]));
    return p;
}

// Chains one fold per level over base. The parser built for a level becomes the
// operand of the next one, so levels listed earlier bind tighter.
// combine(op) must return something convertible to combiner<T>.
template <typename T, typename Combine>
parser<T> precedence(parser<T> base, const precedence_levels& levels, Combine combine) {
    parser<T> p = std::move(base);
    for (const auto& level : levels) {
        auto op = map(any_operator_in_list(level), [combine](const std::string& text) -> combiner<T> { return combine(text); });
        p = fold_separated(std::move(p), std::move(op));
    }
    return p;
}

} // namespace imp::pc
