#include "deepcheck/names.hpp"
#include <tao/pegtl.hpp>

namespace deepcheck {

namespace grammar {
using namespace tao::pegtl;

// <Name>k__BackingField  |  <Name>i__Field
struct semantic_name : plus< not_one<'<', '>'> > {};
struct accessor_suffix : TAO_PEGTL_STRING(">k__BackingField") {};
struct capture_suffix : TAO_PEGTL_STRING(">i__Field") {};
struct accessor_field : seq< one<'<'>, semantic_name, accessor_suffix, eof > {};
struct capture_field : seq< one<'<'>, semantic_name, capture_suffix, eof > {};

template<typename Rule> struct action : nothing<Rule> {};
template<> struct action<semantic_name> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, std::string& out){ out = in.string(); }
};

} // namespace grammar

namespace {
// Actions may fire on a prefix even when the whole rule fails, so the capture is only
// trusted after a successful parse.
template<typename Rule>
bool match_pattern(std::string_view raw, std::string& semantic){
    tao::pegtl::memory_input in(raw.data(), raw.size(), "member-name");
    std::string captured;
    if(!tao::pegtl::parse< Rule, grammar::action >(in, captured)) return false;
    semantic = std::move(captured);
    return true;
}
} // namespace

NormalizedName SynthesizedNameRecognizer::normalize(std::string_view raw) const {
    NormalizedName out;
    if(match_pattern<grammar::accessor_field>(raw, out.semantic)){ out.origin = MemberOrigin::SynthesizedAccessor; return out; }
    if(match_pattern<grammar::capture_field>(raw, out.semantic)){ out.origin = MemberOrigin::SynthesizedCapture; return out; }
    out.semantic = std::string(raw);
    out.origin = MemberOrigin::Ordinary;
    return out;
}

const NameRecognizer& synthesized_recognizer(){ static const SynthesizedNameRecognizer r; return r; }
const NameRecognizer& plain_recognizer(){ static const PlainNameRecognizer r; return r; }

const NameRecognizer& recognizer_named(std::string_view name){
    if(name == "plain") return plain_recognizer();
    return synthesized_recognizer();
}

const char* origin_name(MemberOrigin o){
    switch(o){
        case MemberOrigin::Ordinary: return "field";
        case MemberOrigin::SynthesizedAccessor: return "autoproperty";
        case MemberOrigin::SynthesizedCapture: return "capture";
    }
    return "field";
}

} // namespace deepcheck
