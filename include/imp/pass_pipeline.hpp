#pragma once

#include <llvm/IR/Module.h>

#include "imp/context.hpp"

namespace imp::ir {

// Run optional optimization / custom pass pipeline based on env:
//   enablePasses gates running at all
//   passPipeline (textual) overrides presets if set; an unparsable pipeline falls back to presets
//   optLevel (0/1/2/3) selects preset when no custom pipeline
//   verifyIR adds verification before/after
// Returns false if verification failed at any point.
bool run_pass_pipeline(llvm::Module& M, const EmitEnv& env);

} // namespace imp::ir
