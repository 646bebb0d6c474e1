// ir_emitter.cpp - IMP program -> LLVM IR lowering
#include "imp/ir_emitter.hpp"
#include "imp/pass_pipeline.hpp"

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Type.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>
#include <stdexcept>
#include <variant>

namespace imp {

IREmitter::IREmitter() : llctx_(std::make_unique<llvm::LLVMContext>()) {}
IREmitter::~IREmitter() = default;

unsigned IREmitter::slot_of(const std::string& name) {
    auto it = slot_index_.find(name);
    if (it != slot_index_.end()) return it->second;
    unsigned idx = static_cast<unsigned>(slots_.size());
    slots_.push_back(name);
    slot_index_.emplace(name, idx);
    return idx;
}

void IREmitter::collect_slots(const aexp_ptr& a) {
    if (!a) return;
    if (auto* v = std::get_if<var_aexp>(&a->data)) { slot_of(v->name); return; }
    if (auto* b = std::get_if<binop_aexp>(&a->data)) { collect_slots(b->left); collect_slots(b->right); }
}

void IREmitter::collect_slots(const bexp_ptr& b) {
    if (!b) return;
    if (auto* r = std::get_if<relop_bexp>(&b->data)) { collect_slots(r->left); collect_slots(r->right); return; }
    if (auto* n = std::get_if<not_bexp>(&b->data)) { collect_slots(n->operand); return; }
    if (auto* x = std::get_if<and_bexp>(&b->data)) { collect_slots(x->left); collect_slots(x->right); return; }
    if (auto* o = std::get_if<or_bexp>(&b->data)) { collect_slots(o->left); collect_slots(o->right); }
}

void IREmitter::collect_slots(const stmt_ptr& s) {
    if (!s) return;
    if (auto* a = std::get_if<assign_stmt>(&s->data)) { slot_of(a->name); collect_slots(a->value); return; }
    if (std::holds_alternative<compound_stmt>(s->data)) {
        for (const auto& part : flatten_sequence(s)) collect_slots(part);
        return;
    }
    if (auto* i = std::get_if<if_stmt>(&s->data)) {
        collect_slots(i->condition); collect_slots(i->true_branch); collect_slots(i->false_branch);
        return;
    }
    if (auto* w = std::get_if<while_stmt>(&s->data)) { collect_slots(w->condition); collect_slots(w->body); }
}

llvm::Value* IREmitter::slot_ptr(State& S, llvm::Value* base, llvm::Type* elemTy, unsigned idx) {
    return S.B.CreateInBoundsGEP(elemTy, base, S.B.getInt64(idx), slots_[idx] + ".addr");
}

llvm::Value* IREmitter::emit_floor_div(State& S, llvm::Value* lhs, llvm::Value* rhs) {
    auto& B = S.B;
    auto* i64 = B.getInt64Ty();
    auto* isZero = B.CreateICmpEQ(rhs, llvm::ConstantInt::get(i64, 0), "div.iszero");
    auto* okBB = llvm::BasicBlock::Create(*llctx_, "div.ok." + std::to_string(S.cfCounter++), S.F);
    B.CreateCondBr(isZero, S.divZeroBB, okBB);
    B.SetInsertPoint(okBB);
    // x / -1 is computed as 0 - x so INT64_MIN wraps instead of trapping in sdiv.
    auto* isNegOne = B.CreateICmpEQ(rhs, llvm::ConstantInt::getSigned(i64, -1), "div.isnegone");
    auto* safeRhs = B.CreateSelect(isNegOne, llvm::ConstantInt::get(i64, 1), rhs, "div.rhs");
    auto* q = B.CreateSDiv(lhs, safeRhs, "div.q");
    auto* r = B.CreateSRem(lhs, safeRhs, "div.r");
    // Round toward negative infinity: step down when the remainder is non-zero and the signs differ.
    auto* hasRem = B.CreateICmpNE(r, llvm::ConstantInt::get(i64, 0));
    auto* signsDiffer = B.CreateICmpSLT(B.CreateXor(lhs, safeRhs), llvm::ConstantInt::get(i64, 0));
    auto* adjust = B.CreateZExt(B.CreateAnd(hasRem, signsDiffer), i64);
    auto* floored = B.CreateSub(q, adjust, "div.floor");
    auto* negated = B.CreateSub(llvm::ConstantInt::get(i64, 0), lhs, "div.neg");
    return B.CreateSelect(isNegOne, negated, floored, "div");
}

llvm::Value* IREmitter::emit_aexp(State& S, const aexp_ptr& a) {
    auto& B = S.B;
    if (!a) throw std::logic_error("IREmitter: null arithmetic expression");
    if (auto* i = std::get_if<int_aexp>(&a->data))
        return llvm::ConstantInt::getSigned(B.getInt64Ty(), i->value);
    if (auto* v = std::get_if<var_aexp>(&a->data)) {
        unsigned idx = slot_of(v->name);
        return B.CreateLoad(B.getInt64Ty(), slot_ptr(S, S.values, B.getInt64Ty(), idx), v->name);
    }
    const auto& bin = std::get<binop_aexp>(a->data);
    llvm::Value* l = emit_aexp(S, bin.left);
    llvm::Value* r = emit_aexp(S, bin.right);
    if (bin.op == "+") return B.CreateAdd(l, r, "add");
    if (bin.op == "-") return B.CreateSub(l, r, "sub");
    if (bin.op == "*") return B.CreateMul(l, r, "mul");
    if (bin.op == "/") return emit_floor_div(S, l, r);
    throw std::logic_error("IREmitter: unknown arithmetic operator " + bin.op);
}

llvm::Value* IREmitter::emit_bexp(State& S, const bexp_ptr& b) {
    auto& B = S.B;
    if (!b) throw std::logic_error("IREmitter: null boolean expression");
    if (auto* r = std::get_if<relop_bexp>(&b->data)) {
        llvm::Value* l = emit_aexp(S, r->left);
        llvm::Value* rv = emit_aexp(S, r->right);
        if (r->op == "<") return B.CreateICmpSLT(l, rv, "lt");
        if (r->op == "<=") return B.CreateICmpSLE(l, rv, "le");
        if (r->op == ">") return B.CreateICmpSGT(l, rv, "gt");
        if (r->op == ">=") return B.CreateICmpSGE(l, rv, "ge");
        if (r->op == "=") return B.CreateICmpEQ(l, rv, "eq");
        if (r->op == "!=") return B.CreateICmpNE(l, rv, "ne");
        throw std::logic_error("IREmitter: unknown relational operator " + r->op);
    }
    if (auto* n = std::get_if<not_bexp>(&b->data))
        return B.CreateNot(emit_bexp(S, n->operand), "not");
    // and/or: both sides evaluated, same as the interpreter
    if (auto* x = std::get_if<and_bexp>(&b->data)) {
        llvm::Value* l = emit_bexp(S, x->left);
        llvm::Value* r = emit_bexp(S, x->right);
        return B.CreateAnd(l, r, "and");
    }
    const auto& o = std::get<or_bexp>(b->data);
    llvm::Value* l = emit_bexp(S, o.left);
    llvm::Value* r = emit_bexp(S, o.right);
    return B.CreateOr(l, r, "or");
}

void IREmitter::emit_stmt(State& S, const stmt_ptr& s) {
    auto& B = S.B;
    if (!s) throw std::logic_error("IREmitter: null statement");

    // assign ----------------------------------------------------------------
    if (auto* a = std::get_if<assign_stmt>(&s->data)) {
        llvm::Value* v = emit_aexp(S, a->value);
        unsigned idx = slot_of(a->name);
        B.CreateStore(v, slot_ptr(S, S.values, B.getInt64Ty(), idx));
        B.CreateStore(B.getInt8(1), slot_ptr(S, S.written, B.getInt8Ty(), idx));
        return;
    }

    // compound --------------------------------------------------------------
    if (std::holds_alternative<compound_stmt>(s->data)) {
        for (const auto& part : flatten_sequence(s))
            emit_stmt(S, part);
        return;
    }

    // if --------------------------------------------------------------------
    if (auto* i = std::get_if<if_stmt>(&s->data)) {
        llvm::Value* condV = emit_bexp(S, i->condition);
        int id = S.cfCounter++;
        auto* thenBB = llvm::BasicBlock::Create(*llctx_, "if.then." + std::to_string(id), S.F);
        llvm::BasicBlock* elseBB = nullptr;
        if (i->false_branch)
            elseBB = llvm::BasicBlock::Create(*llctx_, "if.else." + std::to_string(id), S.F);
        auto* mergeBB = llvm::BasicBlock::Create(*llctx_, "if.end." + std::to_string(id), S.F);
        B.CreateCondBr(condV, thenBB, elseBB ? elseBB : mergeBB);
        B.SetInsertPoint(thenBB);
        emit_stmt(S, i->true_branch);
        B.CreateBr(mergeBB);
        if (elseBB) {
            B.SetInsertPoint(elseBB);
            emit_stmt(S, i->false_branch);
            B.CreateBr(mergeBB);
        }
        B.SetInsertPoint(mergeBB);
        return;
    }

    // while -----------------------------------------------------------------
    const auto& w = std::get<while_stmt>(s->data);
    int id = S.cfCounter++;
    auto* condBB = llvm::BasicBlock::Create(*llctx_, "while.cond." + std::to_string(id), S.F);
    auto* bodyBB = llvm::BasicBlock::Create(*llctx_, "while.body." + std::to_string(id), S.F);
    auto* endBB  = llvm::BasicBlock::Create(*llctx_, "while.end."  + std::to_string(id), S.F);
    B.CreateBr(condBB);
    B.SetInsertPoint(condBB);
    llvm::Value* condV = emit_bexp(S, w.condition);
    B.CreateCondBr(condV, bodyBB, endBB);
    B.SetInsertPoint(bodyBB);
    emit_stmt(S, w.body);
    B.CreateBr(condBB);
    B.SetInsertPoint(endBB);
}

llvm::Module* IREmitter::emit(const stmt_ptr& program, const EmitEnv& env) {
    slots_.clear();
    slot_index_.clear();
    module_.reset();
    if (!program) return nullptr;
    if (!llctx_) llctx_ = std::make_unique<llvm::LLVMContext>(); // previous context moved into a ThreadSafeModule

    collect_slots(program);

    module_ = std::make_unique<llvm::Module>("imp.module", *llctx_);
    applyEnvToModule(*module_, env);

    auto& C = *llctx_;
    auto* i32 = llvm::Type::getInt32Ty(C);
    auto* valuesTy = llvm::PointerType::getUnqual(llvm::Type::getInt64Ty(C));
    auto* writtenTy = llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(C));
    auto* fnTy = llvm::FunctionType::get(i32, {valuesTy, writtenTy}, /*isVarArg*/false);
    auto* F = llvm::Function::Create(fnTy, llvm::Function::ExternalLinkage, "imp_main", module_.get());
    F->getArg(0)->setName("values");
    F->getArg(1)->setName("written");

    auto* entryBB = llvm::BasicBlock::Create(C, "entry", F);
    auto* divZeroBB = llvm::BasicBlock::Create(C, "div.zero", F);
    llvm::IRBuilder<> B(entryBB);
    State S{B, F, F->getArg(0), F->getArg(1), divZeroBB};

    try {
        emit_stmt(S, program);
    } catch (...) {
        // never leave a half-built function where toThreadSafeModule() could hand it out
        module_.reset();
        throw;
    }
    B.CreateRet(llvm::ConstantInt::get(i32, kStatusOk));
    B.SetInsertPoint(divZeroBB);
    B.CreateRet(llvm::ConstantInt::get(i32, kStatusDivByZero));

    if (llvm::verifyModule(*module_, &llvm::errs())) {
        llvm::errs() << "[imp] IR verify failed for imp_main\n";
        module_.reset();
        return nullptr;
    }
    if (!ir::run_pass_pipeline(*module_, env)) {
        module_.reset();
        return nullptr;
    }
    if (env.trace)
        llvm::errs() << "[imp] emitted imp_main with " << slots_.size() << " slot(s)\n";
    return module_.get();
}

llvm::orc::ThreadSafeModule IREmitter::toThreadSafeModule() {
    if (!module_) throw std::logic_error("IREmitter: no module to hand over (emit() failed or was not called)");
    return llvm::orc::ThreadSafeModule(std::move(module_), std::move(llctx_));
}

std::string IREmitter::printIR() const {
    if (!module_) return {};
    std::string out;
    llvm::raw_string_ostream os(out);
    module_->print(os, nullptr);
    os.flush();
    return out;
}

} // namespace imp
