#include <cassert>
#include <iostream>
#include "deepcheck/names.hpp"

using namespace deepcheck;

static void test_accessor_pattern(){
    auto n = normalize("<Name>k__BackingField");
    assert(n.semantic == "Name");
    assert(n.origin == MemberOrigin::SynthesizedAccessor);
}

static void test_capture_pattern(){
    auto n = normalize("<total>i__Field");
    assert(n.semantic == "total");
    assert(n.origin == MemberOrigin::SynthesizedCapture);
    assert(normalize(capture_name("total")).semantic == "total");
}

static void test_ordinary_names_untouched(){
    const char* plain[] = { "age", "Name", "_x", "k__BackingField" };
    for(const char* raw : plain){
        auto n = normalize(raw);
        assert(n.semantic == raw);
        assert(n.origin == MemberOrigin::Ordinary);
    }
}

// Anything short of the whole wrapper is an ordinary name.
static void test_near_misses_are_ordinary(){
    const char* near[] = {
        "<>k__BackingField",        // empty inner name
        "<Name>k__BackingFieldX",   // trailing text
        "x<Name>k__BackingField",   // leading text
        "<Name>k__Backing",         // truncated suffix
        "<A<B>k__BackingField",     // nested bracket
        "<Name>i__FieldName",
        ""
    };
    for(const char* raw : near){
        auto n = normalize(raw);
        assert(n.origin == MemberOrigin::Ordinary);
        assert(n.semantic == raw);
    }
}

static void test_plain_recognizer(){
    auto n = plain_recognizer().normalize("<Name>k__BackingField");
    assert(n.semantic == "<Name>k__BackingField");
    assert(n.origin == MemberOrigin::Ordinary);
    assert(&recognizer_named("plain") == &plain_recognizer());
    assert(&recognizer_named("synthesized") == &synthesized_recognizer());
    assert(&recognizer_named("bogus") == &synthesized_recognizer());
}

static void test_origin_names(){
    assert(std::string(origin_name(MemberOrigin::Ordinary)) == "field");
    assert(std::string(origin_name(MemberOrigin::SynthesizedAccessor)) == "autoproperty");
    assert(std::string(origin_name(MemberOrigin::SynthesizedCapture)) == "capture");
}

void run_names_tests(){
    std::cout << "[names] normalizer tests...\n";
    test_accessor_pattern();
    test_capture_pattern();
    test_ordinary_names_untouched();
    test_near_misses_are_ordinary();
    test_plain_recognizer();
    test_origin_names();
    std::cout << "[names] normalizer tests passed\n";
}
