#pragma once
#include "imp/interpreter.hpp"
#include "imp/ir_emitter.hpp"

namespace imp::jit {

// Executes the module held by emitter (after a successful emit()) through ORC LLJIT.
// Consumes the module. Returns the same env the Interpreter would produce.
// Throws eval_error on division by zero or when the JIT cannot be set up.
env run(IREmitter& emitter);

// Convenience: emit + run. Throws eval_error if the module cannot be built.
env compile_and_run(const stmt_ptr& program, const EmitEnv& cfg);

} // namespace imp::jit
