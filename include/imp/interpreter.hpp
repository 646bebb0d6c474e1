// Tree-walking evaluator for IMP programs
#pragma once
#include "imp/ast.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace imp {

struct eval_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Final variable values, ordered by name. Only variables that were assigned appear.
using env = std::map<std::string, std::int64_t>;

// Arithmetic wraps on overflow (two's complement). Division floors toward negative
// infinity; the caller rejects a zero divisor.
inline std::int64_t wrapping_add(std::int64_t a, std::int64_t b) {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}
inline std::int64_t wrapping_sub(std::int64_t a, std::int64_t b) {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}
inline std::int64_t wrapping_mul(std::int64_t a, std::int64_t b) {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}
inline std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    if (b == -1)
        return wrapping_sub(0, a); // INT64_MIN / -1 wraps instead of trapping
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

class Interpreter {
public:
    // max_steps bounds the total number of loop iterations; 0 means unlimited.
    explicit Interpreter(std::uint64_t max_steps = 0) : max_steps_(max_steps) {}

    // Runs program from an empty environment. Throws eval_error on division by zero
    // or when the step limit is exceeded.
    env run(const stmt_ptr& program);

    // Unassigned variables read as 0.
    std::int64_t eval(const aexp_ptr& a, const env& e) const;
    bool eval(const bexp_ptr& b, const env& e) const;
    void exec(const stmt_ptr& s, env& e);

private:
    std::uint64_t max_steps_;
    std::uint64_t steps_ = 0;
};

} // namespace imp
