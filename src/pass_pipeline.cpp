#include "imp/pass_pipeline.hpp"
#include <string>
#include <llvm/IR/Verifier.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace imp::ir {

static bool verify(llvm::Module& M, const EmitEnv& env, const char* when){
    if(!env.verifyIR) return true;
    if(llvm::verifyModule(M, &llvm::errs())){
        llvm::errs() << "[imp] IR verify failed " << when << "\n";
        return false;
    }
    return true;
}

bool run_pass_pipeline(llvm::Module& M, const EmitEnv& env){
    if(!env.enablePasses) return true;
    llvm::PassBuilder PB;
    llvm::LoopAnalysisManager LAM;
    llvm::FunctionAnalysisManager FAM;
    llvm::CGSCCAnalysisManager CGAM;
    llvm::ModuleAnalysisManager MAM;
    PB.registerModuleAnalyses(MAM);
    PB.registerCGSCCAnalyses(CGAM);
    PB.registerFunctionAnalyses(FAM);
    PB.registerLoopAnalyses(LAM);
    PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);

    if(!env.passPipeline.empty()){
        llvm::ModulePassManager MPM;
        if(auto Err = PB.parsePassPipeline(MPM, env.passPipeline)){
            llvm::errs() << "[imp] ignoring pass pipeline '" << env.passPipeline << "': " << llvm::toString(std::move(Err)) << "\n";
        } else {
            if(!verify(M, env, "before custom pipeline")) return false;
            MPM.run(M, MAM);
            return verify(M, env, "after custom pipeline");
        }
    }
    llvm::OptimizationLevel optLevel = llvm::OptimizationLevel::O1;
    switch(env.optLevel){
        case 0: optLevel = llvm::OptimizationLevel::O0; break;
        case 2: optLevel = llvm::OptimizationLevel::O2; break;
        case 3: optLevel = llvm::OptimizationLevel::O3; break;
        default: break;
    }
    if(optLevel == llvm::OptimizationLevel::O0) return verify(M, env, "at O0"); // leave unoptimized
    llvm::ModulePassManager MPM = PB.buildPerModuleDefaultPipeline(optLevel);
    if(!verify(M, env, "before preset pipeline")) return false;
    MPM.run(M, MAM);
    return verify(M, env, "after preset pipeline");
}

} // namespace imp::ir
