#include <gtest/gtest.h>
#include <string>

#include "imp/ir_emitter.hpp"
#include "imp/lexer.hpp"
#include "imp/parser.hpp"
#include "imp/pass_pipeline.hpp"

using namespace imp;

namespace {

std::string emit_ir(const std::string& src, const EmitEnv& e){
    auto prog = imp_parse(lex(src));
    if(!prog) throw std::runtime_error("parse failed: " + src);
    IREmitter em;
    if(!em.emit(*prog, e)) throw std::runtime_error("emit failed: " + src);
    return em.printIR();
}

// The condition folds to a constant in IRBuilder; only simplifycfg removes the dead arm.
const char* kDeadBranch = "if 1 < 2 then x := 1 else x := 2 end";

} // namespace

TEST(PassPipeline, DisabledLeavesIRUntouched){
    EmitEnv e;
    e.enablePasses = false;
    auto ir = emit_ir(kDeadBranch, e);
    EXPECT_NE(ir.find("if.else.0"), std::string::npos) << ir;
    EXPECT_NE(ir.find("store i64 2"), std::string::npos) << ir;
}

TEST(PassPipeline, PresetRemovesDeadBranch){
    EmitEnv e;
    e.enablePasses = true;
    e.optLevel = 2;
    e.verifyIR = true;
    auto ir = emit_ir(kDeadBranch, e);
    EXPECT_EQ(ir.find("store i64 2"), std::string::npos) << ir;
    EXPECT_NE(ir.find("store i64 1"), std::string::npos) << ir;
}

TEST(PassPipeline, O0KeepsBlocks){
    EmitEnv e;
    e.enablePasses = true;
    e.optLevel = 0;
    e.verifyIR = true;
    auto ir = emit_ir(kDeadBranch, e);
    EXPECT_NE(ir.find("store i64 2"), std::string::npos) << ir;
}

TEST(PassPipeline, CustomPipelineOverridesPreset){
    EmitEnv e;
    e.enablePasses = true;
    e.optLevel = 0;
    e.passPipeline = "function(simplifycfg)";
    auto ir = emit_ir(kDeadBranch, e);
    EXPECT_EQ(ir.find("store i64 2"), std::string::npos) << ir;
}

TEST(PassPipeline, UnparsablePipelineFallsBackToPreset){
    EmitEnv e;
    e.enablePasses = true;
    e.optLevel = 2;
    e.passPipeline = "definitely-not-a-pass";
    auto ir = emit_ir(kDeadBranch, e);
    EXPECT_EQ(ir.find("store i64 2"), std::string::npos) << ir;
}

TEST(PassPipeline, RunsOnExistingModule){
    auto prog = imp_parse(lex("n := 5; p := 1; while n > 0 do p := p * n; n := n - 1 end"));
    ASSERT_TRUE(prog);
    IREmitter em;
    ASSERT_NE(em.emit(*prog, EmitEnv{}), nullptr);
    EmitEnv e;
    e.enablePasses = true;
    e.optLevel = 3;
    e.verifyIR = true;
    EXPECT_TRUE(ir::run_pass_pipeline(*em.module(), e));
}
