#include <cassert>
#include <iostream>
#include <string>
#include "deepcheck/reader.hpp"
#include "deepcheck/resolver.hpp"

using namespace deepcheck;

static bool throws_parse_error(std::string_view text, const RecordSchema& s, int* line = nullptr){
    try { (void)read_value(text, s); }
    catch(const parse_error& e){ if(line) *line = e.line; return true; }
    return false;
}

static value member(const value& obj, const char* name){
    const object_ref* o = as_object(obj);
    assert(o);
    auto m = resolve_member(*o->type, name);
    assert(m);
    return m->read(*o);
}

static void test_scalars(){
    assert(is_null(read_value("nil")));
    assert(read_value("true") == v_bool(true));
    assert(read_value("false") == v_bool(false));
    assert(read_value("42") == v_i64(42));
    assert(read_value("-7") == v_i64(-7));
    assert(read_value("2.5") == v_f64(2.5));
    assert(read_value("1e3") == v_f64(1000.0));
    assert(read_value("\"a\\n\\\"b\\\"\"") == v_str("a\n\"b\""));
    assert(read_value(":kw") == v_str("kw"));
    assert(read_value("sym") == v_str("sym"));
}

static void test_collections(){
    auto v = read_value("[1 2 (3 4) #{5}] ; trailing comment");
    assert(is_sequence(v));
    const auto& xs = elements_of(v);
    assert(xs.size() == 4);
    assert(xs[0] == v_i64(1));
    assert(elements_of(xs[2]).size() == 2);
    assert(elements_of(xs[3]).size() == 1);
    assert(elements_of(read_value("[1, 2, 3]")).size() == 3);
}

static void test_anonymous_map(){
    auto v = read_value("{:Name \"Ada\" :age 36}");
    const object_ref* o = as_object(v);
    assert(o);
    assert(o->type->members.size() == 2);
    assert(o->type->members[0].raw_name == "<Name>i__Field");
    assert(member(v, "Name") == v_str("Ada"));
    assert(member(v, "age") == v_i64(36));
}

static void test_tagged_records(){
    RecordSchema s;
    s.declare("Base", {"<Id>k__BackingField"});
    s.declare("Person", {"<Name>k__BackingField", "age"}, "Base");
    auto v = read_value("; fixture\n#Person {:Name \"Ada\" :Id 7}", s);
    const object_ref* o = as_object(v);
    assert(o && o->type->name == "Person");
    assert(member(v, "Name") == v_str("Ada"));
    assert(member(v, "Id") == v_i64(7));
    assert(is_null(member(v, "age")));
    // raw names address the same slots
    auto w = read_value("#Person {:<Name>k__BackingField \"Ada\" :age 1}", s);
    assert(member(w, "Name") == v_str("Ada"));
}

static void test_errors(){
    RecordSchema s;
    s.declare("Person", {"name"});
    int line = 0;
    assert(throws_parse_error("[1 2", s));
    assert(throws_parse_error("{:a}", s));
    assert(throws_parse_error("{:a 1 :a 2}", s));
    assert(throws_parse_error("1 2", s));
    assert(throws_parse_error("", s));
    assert(throws_parse_error("\"open", s));
    assert(throws_parse_error("#Nope {}", s));
    assert(throws_parse_error("#Person [1]", s));
    assert(throws_parse_error("\n\n#Person {:missing 1}", s, &line));
    assert(line == 3);
    assert(throws_parse_error("{1 2}", s));
    assert(throws_parse_error("@", s));
}

// Two keys naming the same member of a record.
static void test_duplicate_member_slots(){
    RecordSchema s;
    s.declare("Person", {"<Name>k__BackingField", "age"});
    int line = 0;
    assert(throws_parse_error("#Person {:Name \"a\" :<Name>k__BackingField \"b\"}", s));
    assert(throws_parse_error("#Person {:<Name>k__BackingField \"a\"\n :Name \"b\"}", s, &line));
    assert(line == 2);
    auto p = read_value("#Person {:Name \"a\" :age 3}", s);
    assert(value_equals(member(p, "<Name>k__BackingField"), v_str("a")));
}

void run_reader_tests(){
    std::cout << "[reader] fixture reader tests...\n";
    test_scalars();
    test_collections();
    test_anonymous_map();
    test_tagged_records();
    test_errors();
    test_duplicate_member_slots();
    std::cout << "[reader] fixture reader tests passed\n";
}
