#include "deepcheck/collections.hpp"
#include "deepcheck/compare.hpp"
#include "deepcheck/reader.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

namespace {

struct order_line { std::string sku; int qty = 0; double price = 0.0; };
struct order { std::string id; std::vector<order_line> lines; order* parent = nullptr; };

void describe(deepcheck::type_builder<order_line>& t){
    t.name("order_line").field("<Sku>k__BackingField", &order_line::sku).field("qty", &order_line::qty).field("price", &order_line::price);
}
void describe(deepcheck::type_builder<order>& t){
    t.name("order").field("id", &order::id).field("lines", &order::lines).field("parent", &order::parent);
}

order make_order(size_t lines){
    order o;
    o.id = "o-1";
    for(size_t i = 0; i < lines; ++i) o.lines.push_back(order_line{"sku-" + std::to_string(i), int(i), i * 1.5});
    return o;
}

std::string fixture_text(size_t lines){
    std::string s = "{:id \"o-1\" :lines [";
    for(size_t i = 0; i < lines; ++i) s += "{:Sku \"sku-" + std::to_string(i) + "\" :qty " + std::to_string(i) + "} ";
    return s + "]}";
}

struct RunResult { double ms; bool ok; };

template<class F>
RunResult time_case(int reps, F&& f){
    bool ok = true;
    auto t0 = Clock::now();
    for(int i = 0; i < reps; ++i) ok = f() && ok;
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count() / reps, ok };
}

} // namespace

int main(){
    const int reps = std::getenv("DEEPCHECK_BENCH_REPS") ? std::atoi(std::getenv("DEEPCHECK_BENCH_REPS")) : 20;
    const size_t sizes[] = { 10, 100, 1000 };

    std::cout << "name,size,ms_per_run,ok\n";
    for(size_t n : sizes){
        order a = make_order(n), b = make_order(n);
        auto native = time_case(reps, [&]{ return deepcheck::compare_fields_of(a, b).matched(); });
        std::cout << "native_fields," << n << "," << native.ms << "," << native.ok << "\n";

        // anonymous subset against the native graph
        auto partial = deepcheck::read_value(fixture_text(n));
        auto mixed = time_case(reps, [&]{ return deepcheck::compare_fields(deepcheck::to_value(a), partial).matched(); });
        std::cout << "fixture_fields," << n << "," << mixed.ms << "," << mixed.ok << "\n";

        std::vector<int> hay, needles;
        for(size_t i = 0; i < n; ++i){ hay.push_back(int(i % 97)); needles.push_back(int((n - i) % 97)); }
        auto multiset = time_case(reps, [&]{ return deepcheck::contains_at_least(hay, needles).all_found(); });
        std::cout << "contains_at_least," << n << "," << multiset.ms << "," << multiset.ok << "\n";
        auto only = time_case(reps, [&]{ return deepcheck::contains_only(hay, needles).all_found(); });
        std::cout << "contains_only," << n << "," << only.ms << "," << only.ok << "\n";
    }
    return 0;
}
