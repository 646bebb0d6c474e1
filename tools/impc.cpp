#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "imp/context.hpp"
#include "imp/diagnostics_json.hpp"
#include "imp/interpreter.hpp"
#include "imp/ir_emitter.hpp"
#include "imp/jit.hpp"
#include "imp/lexer.hpp"
#include "imp/parser.hpp"

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static int usage(){
    std::cerr << "usage: impc [--jit] [--emit-llvm] <input-file>\n";
    return 2;
}

static int fail(imp::DiagnosticReport& report, const imp::EmitEnv& env, imp::Diagnostic d, const std::string& text){
    std::cerr << text << "\n";
    report.success = false;
    report.errors.push_back(std::move(d));
    imp::maybe_print_json(report, env.diagJson);
    return 1;
}

int main(int argc, char** argv){
    try{
        bool useJit = false, emitLlvm = false;
        std::string path;
        for(int i = 1; i < argc; ++i){
            std::string a = argv[i];
            if(a == "--jit") useJit = true;
            else if(a == "--emit-llvm") emitLlvm = true;
            else if(!a.empty() && a[0] == '-') return usage();
            else if(path.empty()) path = a;
            else return usage();
        }
        if(path.empty()) return usage();

        std::ifstream f(path, std::ios::binary);
        if(!f){ std::cerr << "impc: cannot open '" << path << "'\n"; return 2; }
        const auto src = read_all(f);
        const auto env = imp::detectEnv();
        imp::DiagnosticReport report;
        report.file = path;

        imp::token_list tokens;
        try{
            tokens = imp::lex(src, path);
        } catch(const imp::lex_error& e){
            return fail(report, env, {"E0001", e.what(), e.line, e.col},
                        path + ":" + std::to_string(e.line) + ":" + std::to_string(e.col) + ": lex error: " + e.what());
        }
        if(env.trace) std::fprintf(stderr, "[imp] lexed %zu token(s) from %s\n", tokens.size(), path.c_str());

        auto program = imp::imp_parse(tokens);
        if(!program)
            return fail(report, env, {"E0002", "parse error", -1, -1}, path + ": parse error");
        if(env.trace) std::fprintf(stderr, "[imp] parsed %s\n", imp::to_string(*program).c_str());

        if(emitLlvm){
            imp::IREmitter emitter;
            if(!emitter.emit(*program, env)){ std::cerr << "impc: failed to build LLVM module\n"; return 1; }
            std::cout << emitter.printIR();
            return 0;
        }

        if(useJit && env.maxSteps)
            std::fprintf(stderr, "[imp] warning: IMP_MAX_STEPS=%llu is not enforced with --jit\n", (unsigned long long)env.maxSteps);

        imp::env result;
        try{
            if(useJit) result = imp::jit::compile_and_run(*program, env);
            else result = imp::Interpreter(env.maxSteps).run(*program);
        } catch(const imp::eval_error& e){
            return fail(report, env, {"E0003", e.what(), -1, -1}, path + ": evaluation error: " + e.what());
        }

        imp::maybe_print_json(report, env.diagJson);
        std::cout << "Final variable values:\n";
        for(const auto& kv : result)
            std::cout << kv.first << ": " << kv.second << "\n";
        return 0;
    } catch(const std::exception& e){
        std::cerr << "impc: exception: " << e.what() << "\n";
        return 1;
    }
}
