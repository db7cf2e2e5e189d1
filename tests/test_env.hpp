#pragma once
#include <optional>
#include <string>

// Sets an environment variable for the lifetime of the object and restores the previous
// value (or absence) afterwards. nullptr unsets.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};

// POSIX-style helper; empty or null value unsets.
int set_test_env(const char* name, const char* value);
