#include "deepcheck/diagnostics_json.hpp"
#include "deepcheck/options.hpp"
#include <cstdio>
#include <sstream>

namespace deepcheck {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes_json(std::ostringstream& os, const std::vector<CheckNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)<<"}";
    }
    os<<"]";
}

std::string check_result_to_json(const CheckResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        const auto &e=r.errors[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(e.code)
            <<",\"message\":"<<json_escape(e.message)
            <<",\"hint\":"<<json_escape(e.hint)
            <<",\"path\":"<<json_escape(e.path)
            <<",\"notes\":";
        append_notes_json(os,e.notes);
        os<<"}";
    }
    os<<"]}";
    return os.str();
}

std::string verdict_to_json(const EqualityVerdict& v){
    std::ostringstream os;
    os<<"{\"kind\":"<<json_escape(verdict_kind_name(v.kind))
      <<",\"path\":"<<json_escape(v.path)
      <<",\"raw_name\":"<<json_escape(v.raw_name)
      <<",\"origin\":"<<json_escape(origin_name(v.origin))
      <<",\"expected\":"<<json_escape(to_string(v.expected))
      <<",\"actual\":"<<json_escape(to_string(v.actual))
      <<",\"reason\":"<<json_escape(v.reason)
      <<"}";
    return os.str();
}

void maybe_print_json(const CheckResult& r){
    if(r.success || !detectEnv().diagJson) return;
    auto js=check_result_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace deepcheck
