#include <cassert>
#include <exception>
#include <iostream>
// Only GTest::gtest is linked (not gtest_main): the manual harness runs first, then any
// GoogleTest cases compiled into this binary.
#include <gtest/gtest.h>
#include "deepcheck/reader.hpp"
#include "deepcheck/compare.hpp"

void run_names_tests();
void run_reader_tests();
void run_diagnostics_json_tests();

int main(int argc, char** argv){
    using namespace deepcheck;
    // Smoke: a fixture compared with itself
    auto v = read_value("{:name \"x\" :items [1 2 3]}");
    assert(compare_fields(v, v).matched());
    assert(to_string(v).find("#") == 0);

    try{
        run_names_tests();
        run_reader_tests();
        run_diagnostics_json_tests();
    }catch(const std::exception& e){ std::cerr << "[harness] exception: " << e.what() << "\n"; return 1; }
    std::cout << "All harness tests passed" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
