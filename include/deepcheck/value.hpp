// Dynamic value model the comparison engines operate on.
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace deepcheck
{

    struct TypeDescriptor; // reflect.hpp
    struct value;

    // Handle to an instance of a described type. Identity is the `self` address.
    // Native objects are usually viewed (non-owning); records are owned.
    struct object_ref
    {
        const TypeDescriptor *type = nullptr;
        std::shared_ptr<const void> self;
    };

    struct sequence
    {
        std::shared_ptr<const std::vector<value>> elems;
    };

    using value_data = std::variant<std::monostate, bool, int64_t, double, std::string, object_ref, sequence>;

    struct value
    {
        value_data data;
    };

    inline bool is_null(const value &v)
    {
        if (std::holds_alternative<std::monostate>(v.data))
            return true;
        if (auto *o = std::get_if<object_ref>(&v.data))
            return !o->self;
        return false;
    }
    inline bool is_object(const value &v) { return !is_null(v) && std::holds_alternative<object_ref>(v.data); }
    inline bool is_sequence(const value &v) { return std::holds_alternative<sequence>(v.data); }
    inline bool is_scalar(const value &v) { return !is_null(v) && !is_object(v) && !is_sequence(v); }
    inline const object_ref *as_object(const value &v) { return is_object(v) ? &std::get<object_ref>(v.data) : nullptr; }

    // Elements of a sequence value. Throws std::invalid_argument for anything else.
    const std::vector<value> &elements_of(const value &v);

    // Factory helpers
    inline value v_null() { return value{}; }
    inline value v_bool(bool b) { return value{b}; }
    inline value v_i64(int64_t i) { return value{i}; }
    inline value v_f64(double d) { return value{d}; }
    inline value v_str(std::string s) { return value{std::move(s)}; }
    inline value v_seq(std::vector<value> elems)
    {
        return value{sequence{std::make_shared<const std::vector<value>>(std::move(elems))}};
    }
    inline value v_seq(std::initializer_list<value> xs) { return v_seq(std::vector<value>(xs)); }

    // Value equality: scalars by value (integers and doubles compare numerically), sequences
    // element-wise, objects through the type's equality hook when both share the same type,
    // otherwise by identity.
    bool value_equals(const value &a, const value &b);
    inline bool operator==(const value &a, const value &b) { return value_equals(a, b); }
    inline bool operator!=(const value &a, const value &b) { return !value_equals(a, b); }

    // EDN-style rendering: nil, true, 42, 1.5, "text", [1 2], #Type{:field v}.
    std::string to_string(const value &v);

} // namespace deepcheck
