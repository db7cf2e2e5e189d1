#include "deepcheck/reader.hpp"
#include "deepcheck/resolver.hpp"
#include <cctype>
#include <utility>
#include <vector>

namespace deepcheck {

namespace {

struct reader {
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s): d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get(){
        if(eof()) return '\0';
        char c = d[p++];
        if(c == '\n'){ ++line; col = 1; } else ++col;
        return c;
    }
    // Commas are whitespace in EDN.
    void skip_ws(){
        while(!eof()){
            char c = peek();
            if(c == ';'){ while(!eof() && get() != '\n') {} continue; }
            if(c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ','){ get(); continue; }
            break;
        }
    }
    [[noreturn]] void fail(const std::string& msg, int l, int c) const { throw parse_error(msg, l, c); }
    [[noreturn]] void fail(const std::string& msg) const { throw parse_error(msg, line, col); }
};

bool is_digit(char c){ return c >= '0' && c <= '9'; }
bool is_symbol_start(char c){ return std::isalpha((unsigned char)c) || c=='*' || c=='!' || c=='_' || c=='?' || c=='-' || c=='+' || c=='/' || c=='<' || c=='>' || c=='=' || c=='$' || c=='%' || c=='&'; }
bool is_symbol_char(char c){ return is_symbol_start(c) || is_digit(c) || c=='.' || c=='#' || c==':'; }

class fixture_parser {
public:
    fixture_parser(std::string_view text, const RecordSchema* schema, const NameRecognizer& names)
        : r_(text), schema_(schema), names_(names) {}

    value parse_all(){
        r_.skip_ws();
        if(r_.eof()) r_.fail("empty input");
        value v = parse_value();
        r_.skip_ws();
        if(!r_.eof()) r_.fail("unexpected trailing characters");
        return v;
    }

private:
    reader r_;
    const RecordSchema* schema_;
    const NameRecognizer& names_;

    // One map entry with the position of its key, for diagnostics.
    struct entry { std::string key; value val; int line; int col; };

    value parse_value(){
        r_.skip_ws();
        const int sl = r_.line, sc = r_.col;
        char c = r_.peek();
        switch(c){
            case '"': return parse_string();
            case '(': r_.get(); return v_seq(parse_forms(')', sl, sc));
            case '[': r_.get(); return v_seq(parse_forms(']', sl, sc));
            case '{': r_.get(); return RecordSchema::make_anonymous(pairs_of(parse_entries(sl, sc)));
            case '#': r_.get(); return parse_tagged(sl, sc);
            case '\0': r_.fail("unexpected end of input");
            default: break;
        }
        if(is_digit(c) || ((c == '+' || c == '-') && r_.p + 1 < r_.d.size() && is_digit(r_.d[r_.p + 1])))
            return parse_number();
        if(c == ':' || is_symbol_start(c)) return parse_symbol_or_keyword();
        r_.fail(std::string("unexpected character '") + c + "'");
    }

    std::vector<value> parse_forms(char end, int sl, int sc){
        std::vector<value> elems;
        r_.skip_ws();
        while(!r_.eof() && r_.peek() != end){
            elems.push_back(parse_value());
            r_.skip_ws();
        }
        if(r_.get() != end) r_.fail("unterminated collection", sl, sc);
        return elems;
    }

    // Map body after '{'. Keys are keywords, symbols or strings.
    std::vector<entry> parse_entries(int sl, int sc){
        std::vector<entry> out;
        r_.skip_ws();
        while(!r_.eof() && r_.peek() != '}'){
            const int kl = r_.line, kc = r_.col;
            value k = parse_value();
            const std::string* key = std::get_if<std::string>(&k.data);
            if(!key) r_.fail("map key must be a keyword, symbol or string", kl, kc);
            for(const auto& e : out)
                if(e.key == *key) r_.fail("duplicate map key '" + *key + "'", kl, kc);
            r_.skip_ws();
            if(r_.eof() || r_.peek() == '}') r_.fail("map requires even number of forms", sl, sc);
            value v = parse_value();
            out.push_back(entry{*key, std::move(v), kl, kc});
            r_.skip_ws();
        }
        if(r_.get() != '}') r_.fail("unterminated collection", sl, sc);
        return out;
    }

    static std::vector<std::pair<std::string, value>> pairs_of(std::vector<entry> entries){
        std::vector<std::pair<std::string, value>> out;
        out.reserve(entries.size());
        for(auto& e : entries) out.emplace_back(std::move(e.key), std::move(e.val));
        return out;
    }

    // '#' already consumed: #{...} is a set, #Name {...} a declared record.
    value parse_tagged(int sl, int sc){
        if(r_.peek() == '{'){ r_.get(); return v_seq(parse_forms('}', sl, sc)); }
        std::string tag;
        while(is_symbol_char(r_.peek())) tag += r_.get();
        if(tag.empty()) r_.fail("expected tag after '#'", sl, sc);
        r_.skip_ws();
        const int ml = r_.line, mc = r_.col;
        if(r_.peek() != '{') r_.fail("tagged value '#" + tag + "' must be followed by a map", ml, mc);
        r_.get();
        auto entries = parse_entries(ml, mc);

        auto type = schema_ ? schema_->find_shared(tag) : nullptr;
        if(!type) r_.fail("unknown record type '" + tag + "'", sl, sc);
        std::vector<value> slots(hierarchy_member_count(*type));
        std::vector<bool> filled(slots.size(), false);
        for(auto& e : entries){
            auto m = resolve_member(*type, e.key, names_);
            if(!m) r_.fail("record type '" + tag + "' has no member '" + e.key + "'", e.line, e.col);
            const size_t i = slot_index(*m);
            // raw and semantic spellings of one member land on the same slot
            if(filled[i]) r_.fail("duplicate member '" + m->semantic_name + "' in '#" + tag + "'", e.line, e.col);
            filled[i] = true;
            slots[i] = std::move(e.val);
        }
        return make_record(std::move(type), std::move(slots));
    }

    // Record slots are laid out base-first; the owner's members follow all of its ancestors'.
    static size_t slot_index(const MemberDescriptor& m){
        const size_t first = hierarchy_member_count(*m.owner) - m.owner->members.size();
        return first + static_cast<size_t>(m.slot - m.owner->members.data());
    }

    value parse_string(){
        const int sl = r_.line, sc = r_.col;
        r_.get();
        std::string out;
        for(;;){
            if(r_.eof()) r_.fail("unterminated string", sl, sc);
            char c = r_.get();
            if(c == '"') break;
            if(c == '\\'){
                if(r_.eof()) r_.fail("bad escape");
                char e = r_.get();
                switch(e){
                    case 'n': out += '\n'; break;
                    case 'r': out += '\r'; break;
                    case 't': out += '\t'; break;
                    default: out += e; break;
                }
            } else out += c;
        }
        return v_str(std::move(out));
    }

    value parse_number(){
        const int sl = r_.line, sc = r_.col;
        std::string num;
        if(r_.peek() == '+' || r_.peek() == '-') num += r_.get();
        bool is_float = false;
        while(is_digit(r_.peek())) num += r_.get();
        if(r_.peek() == '.'){
            is_float = true;
            num += r_.get();
            while(is_digit(r_.peek())) num += r_.get();
        }
        if(r_.peek() == 'e' || r_.peek() == 'E'){
            is_float = true;
            num += r_.get();
            if(r_.peek() == '+' || r_.peek() == '-') num += r_.get();
            while(is_digit(r_.peek())) num += r_.get();
        }
        try {
            if(is_float) return v_f64(std::stod(num));
            return v_i64(static_cast<int64_t>(std::stoll(num)));
        } catch(const std::logic_error&) {
            r_.fail("invalid number '" + num + "'", sl, sc);
        }
    }

    value parse_symbol_or_keyword(){
        const int sl = r_.line, sc = r_.col;
        bool kw = false;
        if(r_.peek() == ':'){ kw = true; r_.get(); }
        std::string s;
        while(is_symbol_char(r_.peek())) s += r_.get();
        if(s.empty()) r_.fail("empty keyword", sl, sc);
        if(!kw){
            if(s == "nil") return v_null();
            if(s == "true") return v_bool(true);
            if(s == "false") return v_bool(false);
        }
        return v_str(std::move(s));
    }
};

} // namespace

value read_value(std::string_view text, const RecordSchema& schema, const NameRecognizer& names){
    return fixture_parser(text, &schema, names).parse_all();
}

value read_value(std::string_view text){
    return fixture_parser(text, nullptr, synthesized_recognizer()).parse_all();
}

} // namespace deepcheck
