#pragma once
#include <string>

namespace deepcheck {

struct CheckEnv {
    bool traceCompare = false;   // DEEPCHECK_TRACE=1
    bool diagJson = false;       // DEEPCHECK_DIAG_JSON=1
    bool cycleGuard = true;      // DEEPCHECK_CYCLE_GUARD=0 disables
    std::string recognizer = "synthesized"; // DEEPCHECK_NAME_RECOGNIZER=plain|synthesized
};

// Read the process environment into a CheckEnv. Nothing is cached; call again to pick up changes.
CheckEnv detectEnv();

// "1", "t", "T", "y", "Y" prefixes are true.
bool env_flag_enabled(const char* name);

} // namespace deepcheck
