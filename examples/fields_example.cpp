// Compare a native object graph with an EDN fixture and print the diagnostics.
#include <iostream>
#include <string>
#include <vector>
#include "deepcheck/checks.hpp"
#include "deepcheck/diagnostics_json.hpp"
#include "deepcheck/reader.hpp"

struct customer {
    std::string name;
    std::string email;
    std::vector<std::string> roles;
};

void describe(deepcheck::type_builder<customer>& t){
    t.name("Customer")
        .field("<Name>k__BackingField", &customer::name)
        .field("<Email>k__BackingField", &customer::email)
        .field("roles", &customer::roles);
}

int main(){
    using namespace deepcheck;
    customer c{"Ada", "ada@example.org", {"admin", "ops"}};

    RecordSchema schema;
    schema.declare("Customer", {"Name", "Email", "roles"});
    const char* src = R"EDN(
        ; expected state after the import
        #Customer {:Name "Ada" :Email "ada@example.com" :roles ["admin" "ops"]}
    )EDN";

    auto expected = read_value(src, schema);
    auto r = check_fields(to_value(c), expected);
    for(const auto& e : r.errors){
        std::cerr << e.code << ": " << e.message << " at " << e.path << "\n";
        for(const auto& n : e.notes) std::cerr << "  " << n.message << "\n";
    }
    std::cout << check_result_to_json(r) << "\n";

    auto roles = check_contains(c.roles, "ops");
    std::cout << "roles contain ops: " << (roles.success ? "yes" : "no") << "\n";

    // The fixture's address differs on purpose: exactly one value mismatch on Email.
    const bool email_only = !r.success && r.errors.size() == 1
                            && r.errors[0].code == "D0100" && r.errors[0].path == "Email";
    if(!email_only || !roles.success){ std::cerr << "fields example: unexpected outcome\n"; return 1; }
    std::cout << "fields example OK\n";
    return 0;
}
