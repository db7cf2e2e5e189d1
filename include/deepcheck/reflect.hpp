// Type descriptors: the introspection capability the comparator walks.
//
// Native C++ types describe themselves through an ADL hook found next to the type:
//
//   void describe(deepcheck::type_builder<person>& t) {
//       t.name("person").field("<Name>k__BackingField", &person::name).field("age", &person::age);
//   }
//   void describe(deepcheck::type_builder<employee>& t) {
//       t.name("employee").base<person>().field("salary", &employee::salary);
//   }
//
// Types only known at runtime (fixtures, anonymous records) are declared through RecordSchema.
#pragma once
#include "deepcheck/value.hpp"
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace deepcheck
{

    struct reflection_error : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    // How a member's declared type is compared.
    enum class EqualityKind
    {
        ByValue,    // declared type has meaningful value equality
        Structural, // identity-only type (pointers, classes without operator==): recurse
        Inferred    // decided from the runtime value (sequences, runtime records)
    };

    struct MemberSlot
    {
        std::string raw_name;
        EqualityKind equality = EqualityKind::Inferred;
        std::function<value(const void *)> read;
    };

    struct TypeDescriptor
    {
        std::string name;
        const TypeDescriptor *base = nullptr;
        // Converts an instance address of this type into the address of its base subobject.
        std::function<const void *(const void *)> upcast;
        // Members declared on this type only (inherited ones live on `base`).
        std::vector<MemberSlot> members;
        // Value equality between two instances of this exact type; empty = identity only.
        std::function<bool(const void *, const void *)> equals;
        // Keeps a runtime-declared base alive; unused for native types.
        std::shared_ptr<const TypeDescriptor> base_owner;

        const MemberSlot *find_declared(std::string_view raw_name) const;
    };

    // True when `type` is `ancestor` or derives from it.
    bool inherits_from(const TypeDescriptor &type, const TypeDescriptor &ancestor);

    // Walk `self` (an instance of `from`) up to its `to` subobject. Throws reflection_error
    // when `to` is not an ancestor of `from`.
    const void *upcast_to(const TypeDescriptor &from, const void *self, const TypeDescriptor &to);

    // Number of members declared across the whole hierarchy of `type`.
    size_t hierarchy_member_count(const TypeDescriptor &type);

    template <class T>
    class type_builder;

    namespace detail
    {
        template <class>
        inline constexpr bool dependent_false = false;

        template <class T, class = void>
        struct is_equality_comparable : std::false_type
        {
        };
        template <class T>
        struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T &>() == std::declval<const T &>())>>
            : std::is_convertible<decltype(std::declval<const T &>() == std::declval<const T &>()), bool>
        {
        };

        template <class T, class = void>
        struct is_iterable : std::false_type
        {
        };
        template <class T>
        struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T &>())), decltype(std::end(std::declval<const T &>()))>>
            : std::true_type
        {
        };

        template <class T>
        struct is_string_like
        {
            using U = std::remove_cv_t<std::remove_reference_t<T>>;
            using D = std::decay_t<T>;
            static constexpr bool value =
                std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view> ||
                std::is_same_v<D, const char *> || std::is_same_v<D, char *> ||
                (std::is_array_v<U> && std::is_same_v<std::remove_cv_t<std::remove_extent_t<U>>, char>);
        };

        template <class T>
        struct is_optional : std::false_type
        {
        };
        template <class T>
        struct is_optional<std::optional<T>> : std::true_type
        {
        };

        template <class T>
        struct is_smart_pointer : std::false_type
        {
        };
        template <class T>
        struct is_smart_pointer<std::shared_ptr<T>> : std::true_type
        {
        };
        template <class T, class D>
        struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type
        {
        };

        template <class T, class = void>
        struct is_reflected : std::false_type
        {
        };
        template <class T>
        struct is_reflected<T, std::void_t<decltype(describe(std::declval<type_builder<T> &>()))>> : std::true_type
        {
        };

        // Non-owning shared_ptr: identity without ownership.
        inline std::shared_ptr<const void> view_of(const void *p)
        {
            return std::shared_ptr<const void>(std::shared_ptr<const void>(), p);
        }
    } // namespace detail

    template <class T>
    inline constexpr bool is_reflected_v = detail::is_reflected<std::remove_cv_t<T>>::value;

    template <class T>
    const TypeDescriptor &describe_type();

    template <class T>
    value to_value(const T &x);

    // Classify a member by its declared type.
    template <class M>
    EqualityKind equality_of()
    {
        using U = std::remove_cv_t<M>;
        if constexpr (detail::is_optional<U>::value)
            return equality_of<typename U::value_type>();
        else if constexpr (detail::is_string_like<U>::value)
            return EqualityKind::ByValue;
        else if constexpr (std::is_pointer_v<U> || detail::is_smart_pointer<U>::value)
            return EqualityKind::Structural;
        else if constexpr (std::is_arithmetic_v<U> || std::is_enum_v<U>)
            return EqualityKind::ByValue;
        else if constexpr (is_reflected_v<U>)
            return describe_type<U>().equals ? EqualityKind::ByValue : EqualityKind::Structural;
        else if constexpr (detail::is_iterable<U>::value)
            return EqualityKind::Inferred;
        else if constexpr (std::is_same_v<U, value>)
            return EqualityKind::Inferred;
        else
            static_assert(detail::dependent_false<M>, "member type cannot be described; add a describe() hook");
    }

    template <class T>
    class type_builder
    {
    public:
        type_builder()
        {
            desc_.name = typeid(T).name();
            if constexpr (detail::is_equality_comparable<T>::value)
                desc_.equals = [](const void *a, const void *b)
                { return static_cast<bool>(*static_cast<const T *>(a) == *static_cast<const T *>(b)); };
        }

        type_builder &name(std::string n)
        {
            desc_.name = std::move(n);
            return *this;
        }

        template <class B>
        type_builder &base()
        {
            static_assert(std::is_base_of_v<B, T>, "base<B>() requires T to derive from B");
            desc_.base = &describe_type<B>();
            desc_.upcast = [](const void *p) -> const void *
            { return static_cast<const B *>(static_cast<const T *>(p)); };
            return *this;
        }

        template <class M>
        type_builder &field(std::string raw_name, M T::*member)
        {
            MemberSlot slot;
            slot.raw_name = std::move(raw_name);
            slot.equality = equality_of<M>();
            slot.read = [member](const void *self)
            { return to_value(static_cast<const T *>(self)->*member); };
            desc_.members.push_back(std::move(slot));
            return *this;
        }

        // Always walk members, even when T has operator==.
        type_builder &structural()
        {
            desc_.equals = nullptr;
            return *this;
        }

        TypeDescriptor build() { return std::move(desc_); }

    private:
        TypeDescriptor desc_;
    };

    template <class T>
    const TypeDescriptor &describe_type()
    {
        static_assert(is_reflected_v<T>, "describe_type<T>() requires a describe(type_builder<T>&) hook");
        static const TypeDescriptor desc = []
        {
            type_builder<T> b;
            describe(b);
            return b.build();
        }();
        return desc;
    }

    // Convert a C++ value into the dynamic model. Reflected objects are viewed, not copied:
    // the result must not outlive `x`.
    template <class T>
    value to_value(const T &x)
    {
        using U = std::remove_cv_t<T>;
        if constexpr (std::is_same_v<U, value>)
            return x;
        else if constexpr (std::is_same_v<U, std::nullptr_t>)
            return value{};
        else if constexpr (std::is_same_v<U, bool>)
            return v_bool(x);
        else if constexpr (std::is_same_v<U, char>)
            return v_str(std::string(1, x));
        else if constexpr (std::is_enum_v<U>)
            return v_i64(static_cast<int64_t>(x));
        else if constexpr (std::is_integral_v<U>)
            return v_i64(static_cast<int64_t>(x));
        else if constexpr (std::is_floating_point_v<U>)
            return v_f64(static_cast<double>(x));
        else if constexpr (detail::is_string_like<U>::value)
        {
            if constexpr (std::is_pointer_v<U>)
            {
                if (!x)
                    return value{};
            }
            return v_str(std::string(x));
        }
        else if constexpr (detail::is_optional<U>::value)
            return x ? to_value(*x) : value{};
        else if constexpr (std::is_pointer_v<U> || detail::is_smart_pointer<U>::value)
        {
            if (!x)
                return value{};
            using P = std::remove_cv_t<std::remove_reference_t<decltype(*x)>>;
            if constexpr (is_reflected_v<P>)
                return value{object_ref{&describe_type<P>(), detail::view_of(&*x)}};
            else
                return to_value(*x);
        }
        else if constexpr (is_reflected_v<U>)
            return value{object_ref{&describe_type<U>(), detail::view_of(&x)}};
        else if constexpr (detail::is_iterable<U>::value)
        {
            std::vector<value> out;
            for (const auto &e : x)
                out.push_back(to_value(e));
            return v_seq(std::move(out));
        }
        else
            static_assert(detail::dependent_false<T>, "type cannot be converted to a deepcheck::value");
    }

    // ------ Runtime records ------

    // Instance of a runtime-declared type. Slots are laid out base-first.
    struct record
    {
        std::shared_ptr<const TypeDescriptor> type;
        std::vector<value> slots;
    };

    class RecordSchema
    {
    public:
        // Declare a record type. `base` names a type declared earlier (empty = root).
        const TypeDescriptor &declare(const std::string &name, const std::vector<std::string> &fields, const std::string &base = {});
        const TypeDescriptor *find(std::string_view name) const;
        std::shared_ptr<const TypeDescriptor> find_shared(std::string_view name) const;

        // Build an instance; `slots` must cover the whole hierarchy, base members first.
        value make(std::string_view name, std::vector<value> slots) const;

        // Anonymous record: each field gets a synthesized capture name `<field>i__Field`.
        static value make_anonymous(const std::vector<std::pair<std::string, value>> &fields);

    private:
        std::map<std::string, std::shared_ptr<const TypeDescriptor>, std::less<>> types_;
    };

    // Wrap a record type and its slots into a value (owned).
    value make_record(std::shared_ptr<const TypeDescriptor> type, std::vector<value> slots);

} // namespace deepcheck
