// Value equality + rendering.
#include "deepcheck/value.hpp"
#include "deepcheck/reflect.hpp"
#include "deepcheck/resolver.hpp"
#include <sstream>

namespace deepcheck {

const std::vector<value>& elements_of(const value& v){
    if(auto* s = std::get_if<sequence>(&v.data)){
        static const std::vector<value> empty;
        return s->elems ? *s->elems : empty;
    }
    throw std::invalid_argument("value is not a sequence: " + to_string(v));
}

static bool numeric(const value& v, double& out){
    if(auto* i = std::get_if<int64_t>(&v.data)){ out = static_cast<double>(*i); return true; }
    if(auto* d = std::get_if<double>(&v.data)){ out = *d; return true; }
    return false;
}

bool value_equals(const value& a, const value& b){
    if(is_null(a) || is_null(b)) return is_null(a) && is_null(b);
    if(a.data.index() != b.data.index()){
        double x = 0, y = 0;
        return numeric(a, x) && numeric(b, y) && x == y;
    }

    struct Visitor {
        const value& a; const value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool) const { return std::get<bool>(a.data) == std::get<bool>(b.data); }
        bool operator()(int64_t) const { return std::get<int64_t>(a.data) == std::get<int64_t>(b.data); }
        bool operator()(double) const { return std::get<double>(a.data) == std::get<double>(b.data); }
        bool operator()(const std::string&) const { return std::get<std::string>(a.data) == std::get<std::string>(b.data); }
        bool operator()(const object_ref&) const {
            const auto& lo = std::get<object_ref>(a.data);
            const auto& ro = std::get<object_ref>(b.data);
            if(lo.self.get() == ro.self.get()) return true;
            if(lo.type != ro.type || !lo.type || !lo.type->equals) return false;
            return lo.type->equals(lo.self.get(), ro.self.get());
        }
        bool operator()(const sequence&) const {
            const auto& le = elements_of(a);
            const auto& re = elements_of(b);
            if(le.size() != re.size()) return false;
            for(size_t i = 0; i < le.size(); ++i) if(!value_equals(le[i], re[i])) return false;
            return true;
        }
    };

    return std::visit(Visitor{a, b}, a.data);
}

namespace {

// Only the outermost object is expanded; any object below it (member or sequence element)
// is named, not expanded, so cyclic graphs stay printable.
std::string render(const value& v, bool nested){
    if(is_null(v)) return "nil";
    struct V {
        bool nested;
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { std::ostringstream oss; oss << d; return oss.str(); }
        std::string operator()(const std::string& s) const { return '"' + s + '"'; }
        std::string operator()(const object_ref& o) const {
            const std::string head = "#" + (o.type ? o.type->name : std::string("?")) + "{";
            if(nested) return head + "...}";
            std::string out = head;
            if(o.type){
                bool first = true;
                for(const auto& m : list_members(*o.type)){
                    if(!first) out += ' ';
                    first = false;
                    out += ':' + m.semantic_name + ' ';
                    out += render(m.read(o), true);
                }
            }
            out += '}';
            return out;
        }
        std::string operator()(const sequence& s) const {
            std::string out = "[";
            bool first = true;
            if(s.elems) for(const auto& e : *s.elems){
                if(!first) out += ' ';
                first = false;
                out += render(e, nested);
            }
            out += ']';
            return out;
        }
    };
    return std::visit(V{nested}, v.data);
}

} // namespace

std::string to_string(const value& v){ return render(v, false); }

} // namespace deepcheck
