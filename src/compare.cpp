// Structural equality walk (first mismatch wins).
#include "deepcheck/compare.hpp"
#include "deepcheck/resolver.hpp"
#include <cstdio>
#include <set>
#include <utility>

namespace deepcheck {

CompareOptions CompareOptions::from_env(const CheckEnv& env){
    CompareOptions o;
    o.names = &recognizer_named(env.recognizer);
    o.detect_cycles = env.cycleGuard;
    o.trace = env.traceCompare;
    return o;
}

const char* verdict_kind_name(VerdictKind k){
    switch(k){
        case VerdictKind::Match: return "match";
        case VerdictKind::Mismatch: return "mismatch";
        case VerdictKind::MissingMember: return "missing-member";
        case VerdictKind::CyclicStructure: return "cyclic-structure";
    }
    return "unknown";
}

namespace {

std::string join_path(const std::string& prefix, const std::string& name){
    return prefix.empty() ? name : prefix + "." + name;
}

EqualityVerdict mismatch(const std::string& path, const value& actual, const value& expected, const char* reason){
    EqualityVerdict v;
    v.kind = VerdictKind::Mismatch;
    v.path = path; v.actual = actual; v.expected = expected; v.reason = reason;
    return v;
}

class FieldWalker {
public:
    explicit FieldWalker(const CompareOptions& o): names_(o.names ? *o.names : synthesized_recognizer()), opts_(o) {}

    EqualityVerdict walk(const value& expected, const value& actual, const std::string& path){
        if(opts_.trace)
            std::fprintf(stderr, "[dbg][compare] path=%s expected=%s actual=%s\n",
                         path.empty() ? "<root>" : path.c_str(), to_string(expected).c_str(), to_string(actual).c_str());
        if(is_null(expected)) return is_null(actual) ? EqualityVerdict{} : mismatch(path, actual, expected, "expected null");
        if(is_null(actual)) return mismatch(path, actual, expected, "actual null");
        if(is_object(expected) && is_object(actual)) return walk_members(*as_object(expected), *as_object(actual), path);
        if(is_sequence(expected) && is_sequence(actual)) return walk_sequence(expected, actual, path);
        if(is_scalar(expected) != is_scalar(actual)) return mismatch(path, actual, expected, "kind differs");
        return value_equals(expected, actual) ? EqualityVerdict{} : mismatch(path, actual, expected, "value differs");
    }

private:
    const NameRecognizer& names_;
    const CompareOptions& opts_;
    std::set<std::pair<const void*, const void*>> in_progress_;

    // Removes the pair again when the walk of that pair returns.
    struct PairGuard {
        std::set<std::pair<const void*, const void*>>* set = nullptr;
        std::set<std::pair<const void*, const void*>>::iterator it;
        ~PairGuard(){ if(set) set->erase(it); }
    };

    EqualityVerdict walk_members(const object_ref& expected, const object_ref& actual, const std::string& path){
        PairGuard guard;
        if(opts_.detect_cycles){
            auto ins = in_progress_.insert({expected.self.get(), actual.self.get()});
            if(!ins.second){
                EqualityVerdict v;
                v.kind = VerdictKind::CyclicStructure;
                v.path = path;
                v.actual = value{actual};
                v.expected = value{expected};
                v.reason = "cyclic structure";
                return v;
            }
            guard.set = &in_progress_;
            guard.it = ins.first;
        }

        for(const auto& m : list_members(*actual.type, names_)){
            const std::string member_path = join_path(path, m.semantic_name);
            auto counterpart = resolve_member(*expected.type, m.raw_name, names_);
            if(!counterpart){
                EqualityVerdict v;
                v.kind = VerdictKind::MissingMember;
                v.path = member_path;
                v.raw_name = m.raw_name;
                v.origin = m.origin;
                v.actual = m.read(actual);
                v.expected = value{expected};
                v.reason = "absent from expected";
                return v;
            }
            value av = m.read(actual);
            value ev = counterpart->read(expected);
            auto v = compare_member(*counterpart, ev, av, member_path);
            if(!v.matched()){
                if(v.raw_name.empty() && v.path == member_path){ v.raw_name = m.raw_name; v.origin = m.origin; }
                return v;
            }
        }
        return {};
    }

    EqualityVerdict walk_sequence(const value& expected, const value& actual, const std::string& path){
        const auto& le = elements_of(expected);
        const auto& la = elements_of(actual);
        if(le.size() != la.size()) return mismatch(path, actual, expected, "length differs");
        for(size_t i = 0; i < le.size(); ++i){
            auto v = compare_by(EqualityKind::Inferred, le[i], la[i], path + "[" + std::to_string(i) + "]");
            if(!v.matched()) return v;
        }
        return {};
    }

    // Decision for one member, driven by the expected side's declared type.
    EqualityVerdict compare_member(const MemberDescriptor& counterpart, const value& ev, const value& av, const std::string& path){
        return compare_by(counterpart.equality(), ev, av, path);
    }

    EqualityVerdict compare_by(EqualityKind kind, const value& ev, const value& av, const std::string& path){
        if(is_null(ev)) return is_null(av) ? EqualityVerdict{} : mismatch(path, av, ev, "expected null");
        bool by_value = kind == EqualityKind::ByValue;
        if(kind == EqualityKind::Inferred){
            const object_ref* o = as_object(ev);
            by_value = is_scalar(ev) || (o && o->type && o->type->equals);
        }
        if(by_value) return value_equals(ev, av) ? EqualityVerdict{} : mismatch(path, av, ev, "value differs");
        return walk(ev, av, path);
    }
};

} // namespace

EqualityVerdict compare_fields(const value& expected, const value& actual, std::string_view path_prefix, const CompareOptions& options){
    FieldWalker walker(options);
    return walker.walk(expected, actual, std::string(path_prefix));
}

} // namespace deepcheck
