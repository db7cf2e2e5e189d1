// Described types shared by the tests.
#pragma once
#include "deepcheck/reflect.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fixtures {

struct address { std::string city; std::string street; };

struct person {
    std::string name; // auto-property backing field
    int age = 0;
    address home;
    std::vector<std::string> tags;
};

struct employee : person { double salary = 0.0; };

// Same shape as person, but with hand-written member names.
struct person_dto { std::string Name; int age = 0; };

struct point {
    int x = 0, y = 0;
    bool operator==(const point& o) const { return x == o.x && y == o.y; }
};

struct shape { point origin; std::string label; };

// Has operator== but is always walked.
struct tolerant_point {
    int x = 0, y = 0;
    bool operator==(const tolerant_point&) const { return true; }
};

struct chain {
    int id = 0;
    std::shared_ptr<chain> next;
};

// Neighbours may point back at the node itself.
struct mesh_node {
    int id = 0;
    std::vector<std::shared_ptr<mesh_node>> links;
};

inline void describe(deepcheck::type_builder<address>& t){
    t.name("address").field("city", &address::city).field("street", &address::street);
}
inline void describe(deepcheck::type_builder<person>& t){
    t.name("person")
        .field("<Name>k__BackingField", &person::name)
        .field("age", &person::age)
        .field("home", &person::home)
        .field("tags", &person::tags);
}
inline void describe(deepcheck::type_builder<employee>& t){
    t.name("employee").base<person>().field("salary", &employee::salary);
}
inline void describe(deepcheck::type_builder<person_dto>& t){
    t.name("person_dto").field("Name", &person_dto::Name).field("age", &person_dto::age);
}
inline void describe(deepcheck::type_builder<point>& t){
    t.name("point").field("x", &point::x).field("y", &point::y);
}
inline void describe(deepcheck::type_builder<shape>& t){
    t.name("shape").field("origin", &shape::origin).field("label", &shape::label);
}
inline void describe(deepcheck::type_builder<tolerant_point>& t){
    t.name("tolerant_point").structural().field("x", &tolerant_point::x).field("y", &tolerant_point::y);
}
inline void describe(deepcheck::type_builder<chain>& t){
    t.name("chain").field("id", &chain::id).field("next", &chain::next);
}

inline void describe(deepcheck::type_builder<mesh_node>& t){
    t.name("mesh_node").field("id", &mesh_node::id).field("links", &mesh_node::links);
}

inline person make_person(std::string name, int age, std::string city){
    person p;
    p.name = std::move(name);
    p.age = age;
    p.home.city = std::move(city);
    p.home.street = "Main St";
    p.tags = {"a", "b"};
    return p;
}

} // namespace fixtures
