#pragma once
#include "imp/ast.hpp"
#include "imp/context.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>

namespace imp {

// Lowers an IMP program into an LLVM module "imp.module" containing
//   i32 @imp_main(ptr %values, ptr %written)
// Variable i lives in values[i] (i64); the store that assigns it also sets written[i] (i8) to 1.
// Returns 0 on completion, 1 when a division by zero was attempted.
class IREmitter {
public:
    IREmitter();
    ~IREmitter();
    // Returns nullptr if the produced module does not verify (details on llvm::errs()).
    // The module stays owned by the emitter until toThreadSafeModule().
    llvm::Module* emit(const stmt_ptr& program, const EmitEnv& env);
    llvm::Module* emit(const stmt_ptr& program) { return emit(program, detectEnv()); }
    // Ownership transfer into ORC JIT
    llvm::orc::ThreadSafeModule toThreadSafeModule();
    llvm::Module* module() const { return module_.get(); }
    // Variable names by slot index, in order of first appearance in the program.
    const std::vector<std::string>& slots() const { return slots_; }
    std::string printIR() const;

    static constexpr int kStatusOk = 0;
    static constexpr int kStatusDivByZero = 1;

private:
    struct State {
        llvm::IRBuilder<>& B;
        llvm::Function* F;
        llvm::Value* values;
        llvm::Value* written;
        llvm::BasicBlock* divZeroBB;
        int cfCounter = 0;
    };

    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;
    std::vector<std::string> slots_;
    std::unordered_map<std::string, unsigned> slot_index_;

    void collect_slots(const stmt_ptr& s);
    void collect_slots(const bexp_ptr& b);
    void collect_slots(const aexp_ptr& a);
    unsigned slot_of(const std::string& name);

    llvm::Value* slot_ptr(State& S, llvm::Value* base, llvm::Type* elemTy, unsigned idx);
    llvm::Value* emit_aexp(State& S, const aexp_ptr& a);
    llvm::Value* emit_floor_div(State& S, llvm::Value* lhs, llvm::Value* rhs);
    llvm::Value* emit_bexp(State& S, const bexp_ptr& b);
    void emit_stmt(State& S, const stmt_ptr& s);
};

} // namespace imp
