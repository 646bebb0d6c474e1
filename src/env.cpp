#include "imp/context.hpp"
#include <cctype>
#include <cstdlib>
#include <string>

namespace imp {

bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

// Reads process env vars and constructs an EmitEnv. Malformed numbers fall back to defaults.
EmitEnv detectEnv(){
    EmitEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    e.enablePasses = flag_enabled("IMP_ENABLE_PASSES");
    e.verifyIR = flag_enabled("IMP_VERIFY_IR");
    e.trace = flag_enabled("IMP_TRACE");
    e.diagJson = flag_enabled("IMP_DIAG_JSON");

    if (const char* v = get("IMP_OPT_LEVEL")) {
        std::string s = v; for (char &c : s) c = (char)std::tolower((unsigned char)c);
        if (s=="0"||s=="o0") e.optLevel = 0;
        else if (s=="2"||s=="o2") e.optLevel = 2;
        else if (s=="3"||s=="o3") e.optLevel = 3;
        else e.optLevel = 1;
    }

    if (const char* v = get("IMP_PASS_PIPELINE")) e.passPipeline = v;
    if (const char* v = get("IMP_TARGET_TRIPLE")) e.targetTriple = v;

    if (const char* v = get("IMP_MAX_STEPS")) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(v, &end, 10);
        if (end && *end == '\0' && v[0] != '-') e.maxSteps = n;
    }

    return e;
}

} // namespace imp
