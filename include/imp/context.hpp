#pragma once
#include <cstdint>
#include <string>

namespace llvm { class Module; }

namespace imp {

struct EmitEnv {
    bool enablePasses = false;
    int optLevel = 1;          // preset pipeline level when no custom pipeline is given
    std::string passPipeline;  // textual pipeline; empty = use optLevel preset
    bool verifyIR = false;     // verify before and after the pass pipeline
    std::string targetTriple;  // empty = host default
    bool trace = false;
    bool diagJson = false;
    std::uint64_t maxSteps = 0; // interpreter loop-iteration limit, 0 = unlimited
};

// Detect configuration from process env vars:
//   IMP_ENABLE_PASSES=1, IMP_OPT_LEVEL=0..3, IMP_PASS_PIPELINE=<text>, IMP_VERIFY_IR=1,
//   IMP_TARGET_TRIPLE=<triple>, IMP_TRACE=1, IMP_DIAG_JSON=1, IMP_MAX_STEPS=<n>
EmitEnv detectEnv();

// Apply environment configuration to a module (e.g., target triple). Safe to call with defaults.
void applyEnvToModule(llvm::Module& M, const EmitEnv& env);

// Accepts 1/t/T/y/Y as enabled, like the other IMP_* switches.
bool flag_enabled(const char* name);

} // namespace imp
