// Structural deep equality over described object graphs.
#pragma once
#include "deepcheck/names.hpp"
#include "deepcheck/options.hpp"
#include "deepcheck/reflect.hpp"
#include "deepcheck/value.hpp"
#include <string>
#include <string_view>

namespace deepcheck {

enum class VerdictKind { Match, Mismatch, MissingMember, CyclicStructure };

// Outcome of one top-level comparison; not yet a pass/fail decision.
struct EqualityVerdict {
    VerdictKind kind = VerdictKind::Match;
    std::string path;         // e.g. "address.city", "items[2].name"; empty for the root
    std::string raw_name;     // raw member name at `path` (Mismatch / MissingMember on a member)
    MemberOrigin origin = MemberOrigin::Ordinary;
    value actual;
    value expected;
    std::string reason;
    bool matched() const { return kind == VerdictKind::Match; }
};

struct CompareOptions {
    const NameRecognizer* names = nullptr; // null: synthesized_recognizer()
    // Revisiting an (expected, actual) pair already under examination yields CyclicStructure.
    // When false, self-referential graphs recurse until the stack runs out.
    bool detect_cycles = true;
    bool trace = false;

    static CompareOptions from_env(const CheckEnv& env);
};

// Walk every member of `actual`'s runtime type (inherited ones included), resolve the
// counterpart on `expected`'s type, and stop at the first difference. Polarity-free:
// negation is decided by the caller from the returned verdict.
EqualityVerdict compare_fields(const value& expected, const value& actual,
                               std::string_view path_prefix = {}, const CompareOptions& options = {});

template<class E, class A>
EqualityVerdict compare_fields_of(const E& expected, const A& actual, const CompareOptions& options = {}){
    return compare_fields(to_value(expected), to_value(actual), {}, options);
}

const char* verdict_kind_name(VerdictKind k);

} // namespace deepcheck
