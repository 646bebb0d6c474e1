#include "imp/context.hpp"
#include <llvm/IR/Module.h>

namespace imp {

void applyEnvToModule(llvm::Module& M, const EmitEnv& env){
    if(!env.targetTriple.empty()){
        M.setTargetTriple(env.targetTriple);
    }
}

} // namespace imp
