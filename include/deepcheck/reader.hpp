// EDN fixture reader producing dynamic values.
//
//   RecordSchema s;
//   s.declare("Person", {"<Name>k__BackingField", "age"});
//   auto v = read_value("#Person {:Name \"Ada\" :age 36}", s);
//
// Keys of a tagged map go through the member resolver, so semantic names reach synthesized
// members. Fields a tagged map leaves out are null. Untagged maps become anonymous records.
#pragma once
#include "deepcheck/names.hpp"
#include "deepcheck/reflect.hpp"
#include "deepcheck/value.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace deepcheck
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " at " + std::to_string(line) + ":" + std::to_string(col)), line(line), col(col) {}
        int line = 0;
        int col = 0;
    };

    // Parse exactly one form (trailing input other than whitespace/comments is an error).
    value read_value(std::string_view text, const RecordSchema &schema,
                     const NameRecognizer &names = synthesized_recognizer());

    // Same, for fixtures without declared record types.
    value read_value(std::string_view text);

} // namespace deepcheck
