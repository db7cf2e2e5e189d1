#include "deepcheck/checks.hpp"
#include "deepcheck/diagnostics_json.hpp"
#include <utility>

namespace deepcheck {

check_failure::check_failure(CheckResult r)
    : std::runtime_error(check_result_to_json(r)), result(std::move(r)) {}

namespace detail {
void add_expected_found(CheckError& e, const std::string& expected, const std::string& found){
    e.notes.push_back(CheckNote{"expected: " + expected});
    e.notes.push_back(CheckNote{"   found: " + found});
}
} // namespace detail

CheckResult check_fields(const value& actual, const value& expected, bool negated){
    return check_fields(actual, expected, negated, CompareOptions::from_env(detectEnv()));
}

CheckResult check_fields(const value& actual, const value& expected, bool negated, const CompareOptions& options){
    CheckResult r;
    CheckReporter rep{&r};
    EqualityVerdict v = compare_fields(expected, actual, {}, options);

    if(passes(v.matched(), negated)) return r;

    if(v.kind == VerdictKind::CyclicStructure){
        auto e = rep.make_error("D0103", "object graph is cyclic", "compare an acyclic projection or disable the cycle guard", v.path);
        e.notes.push_back(CheckNote{"revisited: " + to_string(v.actual)});
        rep.emit_error(std::move(e));
        return r;
    }
    if(negated){
        auto e = rep.make_error("D0101", "all fields are equal", "expected at least one field to differ");
        detail::add_expected_found(e, "a difference", to_string(actual));
        rep.emit_error(std::move(e));
        return r;
    }
    if(v.kind == VerdictKind::MissingMember){
        auto e = rep.make_error("D0102", "member has no counterpart on expected", "declare the member on the expected type", v.path);
        e.notes.push_back(CheckNote{"  member: " + v.raw_name + " (" + origin_name(v.origin) + ")"});
        e.notes.push_back(CheckNote{"expected type: " + to_string(v.expected)});
        rep.emit_error(std::move(e));
        return r;
    }
    auto e = rep.make_error("D0100", "field values differ", v.reason, v.path);
    detail::add_expected_found(e, to_string(v.expected), to_string(v.actual));
    if(!v.raw_name.empty() && v.origin != MemberOrigin::Ordinary)
        e.notes.push_back(CheckNote{"  member: " + v.raw_name + " (" + origin_name(v.origin) + ")"});
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_equal(const value& actual, const value& expected, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    if(passes(value_equals(actual, expected), negated)) return r;
    auto e = negated ? rep.make_error("D0305", "values are equal", "")
                     : rep.make_error("D0305", "values differ", "");
    detail::add_expected_found(e, (negated ? "not " : "") + to_string(expected), to_string(actual));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_null(const value& actual, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    if(passes(is_null(actual), negated)) return r;
    auto e = rep.make_error("D0300", negated ? "value is null" : "value is not null", "");
    detail::add_expected_found(e, negated ? "a value" : "nil", to_string(actual));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_same_instance(const value& actual, const value& expected, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    bool same = is_null(actual) && is_null(expected);
    const object_ref* a = as_object(actual);
    const object_ref* x = as_object(expected);
    if(a && x) same = a->self.get() == x->self.get();
    if(passes(same, negated)) return r;
    auto e = rep.make_error("D0301", negated ? "both sides are the same instance" : "sides are different instances", "");
    detail::add_expected_found(e, to_string(expected), to_string(actual));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_inherits_from(const value& actual, const TypeDescriptor& ancestor, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    const object_ref* o = as_object(actual);
    const bool holds = o && o->type && inherits_from(*o->type, ancestor);
    if(passes(holds, negated)) return r;
    auto e = rep.make_error("D0302", negated ? "type derives from the excluded ancestor" : "type does not derive from ancestor", "");
    detail::add_expected_found(e, (negated ? "not " : "") + ancestor.name, o && o->type ? o->type->name : to_string(actual));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_instance_of(const value& actual, const TypeDescriptor& type, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    const object_ref* o = as_object(actual);
    const bool holds = o && o->type == &type;
    if(passes(holds, negated)) return r;
    auto e = rep.make_error("D0306", negated ? "value is an instance of the excluded type" : "value is not an instance of the type", "");
    detail::add_expected_found(e, (negated ? "not " : "") + type.name, o && o->type ? o->type->name : to_string(actual));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_has_value(const value& actual, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    if(passes(!is_null(actual), negated)) return r;
    auto e = rep.make_error("D0307", negated ? "nullable has a value" : "nullable has no value", "");
    detail::add_expected_found(e, negated ? "no value" : "a value", to_string(actual));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_size(const value& collection, size_t expected, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    const size_t n = elements_of(collection).size();
    if(passes(n == expected, negated)) return r;
    auto e = rep.make_error("D0303", negated ? "collection has the excluded size" : "collection size differs", "");
    detail::add_expected_found(e, (negated ? "not " : "") + std::to_string(expected), std::to_string(n));
    rep.emit_error(std::move(e));
    return r;
}

CheckResult check_empty(const value& collection, bool negated){
    CheckResult r;
    CheckReporter rep{&r};
    if(passes(elements_of(collection).empty(), negated)) return r;
    auto e = rep.make_error("D0304", negated ? "collection is empty" : "collection is not empty", "");
    detail::add_expected_found(e, negated ? "at least one element" : "[]", to_string(collection));
    rep.emit_error(std::move(e));
    return r;
}

void enforce(const CheckResult& result){
    if(result.success) return;
    maybe_print_json(result);
    throw check_failure(result);
}

} // namespace deepcheck
