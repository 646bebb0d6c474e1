#include "imp/jit.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <llvm/Config/llvm-config.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>

namespace imp::jit {

static void init_native_target() {
    static std::once_flag once;
    std::call_once(once, [] {
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
    });
}

env run(IREmitter& emitter) {
    init_native_target();
    const std::vector<std::string> names = emitter.slots();

    auto jitExp = llvm::orc::LLJITBuilder().create();
    if (!jitExp) throw eval_error("jit: " + llvm::toString(jitExp.takeError()));
    auto jit = std::move(*jitExp);
    if (auto err = jit->addIRModule(emitter.toThreadSafeModule()))
        throw eval_error("jit: " + llvm::toString(std::move(err)));
    auto sym = jit->lookup("imp_main");
    if (!sym) throw eval_error("jit: " + llvm::toString(sym.takeError()));

    using FnTy = int (*)(std::int64_t*, std::uint8_t*);
#if LLVM_VERSION_MAJOR >= 15
    auto fn = sym->toPtr<FnTy>();
#else
    auto fn = reinterpret_cast<FnTy>(static_cast<std::uintptr_t>(sym->getAddress()));
#endif

    // One extra element keeps data() non-null for programs without variables.
    std::vector<std::int64_t> values(names.size() + 1, 0);
    std::vector<std::uint8_t> written(names.size() + 1, 0);
    int status = fn(values.data(), written.data());
    if (status == IREmitter::kStatusDivByZero) throw eval_error("division by zero");
    if (status != IREmitter::kStatusOk) throw eval_error("jit: imp_main returned status " + std::to_string(status));

    env out;
    for (std::size_t i = 0; i < names.size(); ++i)
        if (written[i]) out[names[i]] = values[i];
    return out;
}

env compile_and_run(const stmt_ptr& program, const EmitEnv& cfg) {
    IREmitter emitter;
    if (!emitter.emit(program, cfg)) throw eval_error("jit: failed to build a valid module");
    return run(emitter);
}

} // namespace imp::jit
