// Pass/fail checks over the comparison engines, reported like compiler diagnostics.
#pragma once
#include "deepcheck/collections.hpp"
#include "deepcheck/compare.hpp"
#include "deepcheck/options.hpp"
#include "deepcheck/reflect.hpp"
#include "deepcheck/value.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace deepcheck {

struct CheckNote { std::string message; };
struct CheckError { std::string code; std::string message; std::string hint; std::string path; std::vector<CheckNote> notes; };
struct CheckResult { bool success = true; std::vector<CheckError> errors; };

// Thrown by enforce(); what() is the JSON form of the result.
struct check_failure : std::runtime_error {
    explicit check_failure(CheckResult r);
    CheckResult result;
};

struct CheckReporter {
    CheckResult* result = nullptr;
    void emit_error(CheckError e){ if(result){ result->success = false; result->errors.push_back(std::move(e)); } }
    CheckError make_error(std::string code, std::string message, std::string hint, std::string path = {}){
        return CheckError{std::move(code), std::move(message), std::move(hint), std::move(path), {}};
    }
};

// Polarity is applied here and nowhere else: a check passes when what it observed
// differs from `negated`.
inline bool passes(bool holds, bool negated){ return holds != negated; }

// ------ structural ------

// Options default to the process environment (see detectEnv()).
CheckResult check_fields(const value& actual, const value& expected, bool negated = false);
CheckResult check_fields(const value& actual, const value& expected, bool negated, const CompareOptions& options);

template<class A, class E>
CheckResult check_fields_of(const A& actual, const E& expected, bool negated = false){
    return check_fields(to_value(actual), to_value(expected), negated);
}

// ------ plain value checks ------

CheckResult check_equal(const value& actual, const value& expected, bool negated = false);
CheckResult check_null(const value& actual, bool negated = false);
// Same instance: both sides are objects at the same address.
CheckResult check_same_instance(const value& actual, const value& expected, bool negated = false);
inline CheckResult check_distinct_from(const value& actual, const value& expected){ return check_same_instance(actual, expected, true); }
CheckResult check_inherits_from(const value& actual, const TypeDescriptor& ancestor, bool negated = false);
// Exact runtime type; a derived instance is not an instance of its base here.
CheckResult check_instance_of(const value& actual, const TypeDescriptor& type, bool negated = false);
// Nullable holds a value (an empty std::optional or null pointer converts to nil).
CheckResult check_has_value(const value& actual, bool negated = false);
template<class T>
CheckResult check_has_value(const std::optional<T>& actual, bool negated = false){ return check_has_value(to_value(actual), negated); }
// Throws std::invalid_argument when `collection` is not a sequence.
CheckResult check_size(const value& collection, size_t expected, bool negated = false);
CheckResult check_empty(const value& collection, bool negated = false);

// Throws check_failure when the result is not a success.
void enforce(const CheckResult& result);

// ------ collections ------

namespace detail {

template<class C>
std::string render_elements(const C& c){
    std::string out = "[";
    bool first = true;
    for(const auto& e : c){
        if(!first) out += ' ';
        first = false;
        out += to_string(to_value(e));
    }
    return out + "]";
}

template<class T>
std::string render_optional(const std::optional<T>& o){ return o ? to_string(to_value(*o)) : std::string("<end>"); }

void add_expected_found(CheckError& e, const std::string& expected, const std::string& found);

} // namespace detail

// `expected` goes through expected_elements(): a single string (or char sequence) is one
// element, any other collection is the expected set, a sequence value is unwrapped.
template<class Haystack, class Expected>
CheckResult check_contains(const Haystack& haystack, const Expected& expected, bool negated = false){
    CheckResult r;
    CheckReporter rep{&r};
    const auto needles = expected_elements(expected);
    auto v = contains_at_least(haystack, needles);
    if(passes(v.all_found(), negated)) return r;
    if(negated){
        auto e = rep.make_error("D0204", "collection contains every excluded element", "remove at least one of the excluded elements");
        detail::add_expected_found(e, "not all of " + detail::render_elements(needles), detail::render_elements(haystack));
        rep.emit_error(std::move(e));
        return r;
    }
    auto e = rep.make_error("D0200", "collection is missing expected elements", "add the missing elements");
    detail::add_expected_found(e, detail::render_elements(needles), detail::render_elements(haystack));
    e.notes.push_back(CheckNote{" missing: " + detail::render_elements(v.missing)});
    rep.emit_error(std::move(e));
    return r;
}

template<class Haystack, class Expected>
CheckResult check_contains_exactly(const Haystack& haystack, const Expected& expected, bool negated = false){
    CheckResult r;
    CheckReporter rep{&r};
    const auto needles = expected_elements(expected);
    auto v = contains_exactly(haystack, needles);
    if(passes(v.all_found(), negated)) return r;
    if(negated){
        auto e = rep.make_error("D0204", "collection holds exactly the excluded elements in order", "");
        detail::add_expected_found(e, "anything but " + detail::render_elements(needles), detail::render_elements(haystack));
        rep.emit_error(std::move(e));
        return r;
    }
    auto e = rep.make_error("D0202", "collection differs in order or content", "", "[" + std::to_string(v.index) + "]");
    detail::add_expected_found(e, detail::render_optional(v.expected_at), detail::render_optional(v.actual_at));
    e.notes.push_back(CheckNote{"    full: " + detail::render_elements(haystack)});
    rep.emit_error(std::move(e));
    return r;
}

// No expected collection is a failure in either polarity.
template<class Haystack>
CheckResult check_contains_exactly(const Haystack& haystack, std::nullopt_t, bool /*negated*/ = false){
    CheckResult r;
    CheckReporter rep{&r};
    auto e = rep.make_error("D0203", "no expected collection was given", "pass an expected collection, possibly empty");
    e.notes.push_back(CheckNote{"   found: " + detail::render_elements(haystack)});
    rep.emit_error(std::move(e));
    return r;
}

template<class Haystack, class Expected>
CheckResult check_contains_only(const Haystack& haystack, const Expected& expected, bool negated = false){
    CheckResult r;
    CheckReporter rep{&r};
    const auto needles = expected_elements(expected);
    auto v = contains_only(haystack, needles);
    if(passes(v.all_found(), negated)) return r;
    if(negated){
        auto e = rep.make_error("D0204", "collection holds only the excluded elements", "");
        detail::add_expected_found(e, "something outside " + detail::render_elements(needles), detail::render_elements(haystack));
        rep.emit_error(std::move(e));
        return r;
    }
    auto e = rep.make_error("D0201", "collection holds unexpected elements", "remove the unexpected elements");
    detail::add_expected_found(e, "only " + detail::render_elements(needles), detail::render_elements(haystack));
    e.notes.push_back(CheckNote{"unexpected: " + detail::render_elements(v.unexpected)});
    rep.emit_error(std::move(e));
    return r;
}

} // namespace deepcheck
