#include "deepcheck/options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace deepcheck {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}

CheckEnv detectEnv(){
    CheckEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (get("DEEPCHECK_TRACE")) e.traceCompare = env_flag_enabled("DEEPCHECK_TRACE");
    if (get("DEEPCHECK_DIAG_JSON")) e.diagJson = env_flag_enabled("DEEPCHECK_DIAG_JSON");

    // Guard stays on unless explicitly switched off
    if (const char* v = get("DEEPCHECK_CYCLE_GUARD")) e.cycleGuard = !(v[0]=='0' || v[0]=='n' || v[0]=='N' || v[0]=='f' || v[0]=='F');

    if (const char* v = get("DEEPCHECK_NAME_RECOGNIZER")) {
        std::string r = v;
        std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        if (r == "plain" || r == "synthesized") e.recognizer = r;
    }
    return e;
}

} // namespace deepcheck
