// Collection membership: multiset contains, positional contains-exactly, set contains-only.
// Element comparison is operator==; elements are never walked structurally, and elements of
// types with no operator== between them never match.
#pragma once
#include "deepcheck/reflect.hpp"
#include "deepcheck/value.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace deepcheck {

enum class CollectionVerdictKind { AllFound, MissingElements, UnexpectedElements, OrderMismatch };

// A = element type of the checked collection, E = element type of the expected values.
template<class A, class E>
struct CollectionVerdict {
    CollectionVerdictKind kind = CollectionVerdictKind::AllFound;
    std::vector<E> missing;    // MissingElements: needles left unmatched, first-appearance order
    std::vector<A> unexpected; // UnexpectedElements: haystack elements absent from the needles
    // OrderMismatch: first differing position; an exhausted side has no element.
    size_t index = 0;
    std::optional<A> actual_at;
    std::optional<E> expected_at;
    bool expected_absent = false; // no expected collection was supplied at all
    size_t actual_count = 0;
    size_t expected_count = 0;

    bool all_found() const { return kind == CollectionVerdictKind::AllFound; }
};

const char* collection_verdict_kind_name(CollectionVerdictKind k);

namespace detail {

template<class C>
using element_of_t = std::remove_cv_t<std::remove_reference_t<decltype(*std::begin(std::declval<const C&>()))>>;

template<class C>
size_t count_of(const C& c){ return static_cast<size_t>(std::distance(std::begin(c), std::end(c))); }

// Any sequence of chars (std::vector<char>, std::array<char, N>, ...) reads as text.
template<class T, class = void>
struct is_char_sequence : std::false_type {};
template<class T>
struct is_char_sequence<T, std::enable_if_t<is_iterable<T>::value>> : std::is_same<element_of_t<T>, char> {};

// True for a collection argument that stands for the whole expected set.
template<class T>
inline constexpr bool is_expected_collection_v =
    is_iterable<std::remove_cv_t<std::remove_reference_t<T>>>::value && !is_string_like<T>::value
    && !is_char_sequence<std::remove_cv_t<std::remove_reference_t<T>>>::value;

template<class A, class E, class = void>
struct is_comparable_with : std::false_type {};
template<class A, class E>
struct is_comparable_with<A, E, std::void_t<decltype(std::declval<const A&>() == std::declval<const E&>())>> : std::true_type {};

// Elements of types with no operator== between them are never equal.
template<class A, class E>
bool elements_equal(const A& a, const E& e){
    if constexpr (is_comparable_with<A, E>::value) return static_cast<bool>(a == e);
    else return false;
}

// String literals are kept as const char* elements, everything else by value.
template<class T>
using needle_t = std::conditional_t<is_string_like<T>::value && !std::is_same_v<std::remove_cv_t<std::remove_reference_t<T>>, std::string>
                                        && !std::is_same_v<std::remove_cv_t<std::remove_reference_t<T>>, std::string_view>,
                                    const char*, std::decay_t<T>>;

} // namespace detail

template<class Haystack, class Needles>
CollectionVerdict<detail::element_of_t<Haystack>, detail::element_of_t<Needles>>
contains_at_least(const Haystack& haystack, const Needles& needles){
    using A = detail::element_of_t<Haystack>;
    using E = detail::element_of_t<Needles>;
    CollectionVerdict<A, E> v;
    std::vector<E> remaining(std::begin(needles), std::end(needles));
    v.expected_count = remaining.size();
    for(const auto& h : haystack){
        ++v.actual_count;
        for(auto it = remaining.begin(); it != remaining.end(); ++it){
            if(detail::elements_equal(h, *it)){ remaining.erase(it); break; }
        }
    }
    if(!remaining.empty()){
        v.kind = CollectionVerdictKind::MissingElements;
        v.missing = std::move(remaining);
    }
    return v;
}

template<class Haystack, class Needles>
CollectionVerdict<detail::element_of_t<Haystack>, detail::element_of_t<Needles>>
contains_exactly(const Haystack& haystack, const Needles& needles){
    using A = detail::element_of_t<Haystack>;
    using E = detail::element_of_t<Needles>;
    CollectionVerdict<A, E> v;
    v.actual_count = detail::count_of(haystack);
    v.expected_count = detail::count_of(needles);
    auto h = std::begin(haystack); auto he = std::end(haystack);
    auto n = std::begin(needles); auto ne = std::end(needles);
    for(size_t i = 0;; ++i, ++h, ++n){
        const bool h_done = h == he, n_done = n == ne;
        if(h_done && n_done) return v;
        if(h_done || n_done || !detail::elements_equal(*h, *n)){
            v.kind = CollectionVerdictKind::OrderMismatch;
            v.index = i;
            if(!h_done) v.actual_at = *h;
            if(!n_done) v.expected_at = *n;
            return v;
        }
    }
}

// No expected collection at all (as opposed to an empty one).
template<class Haystack>
CollectionVerdict<detail::element_of_t<Haystack>, detail::element_of_t<Haystack>>
contains_exactly(const Haystack& haystack, std::nullopt_t){
    CollectionVerdict<detail::element_of_t<Haystack>, detail::element_of_t<Haystack>> v;
    v.kind = CollectionVerdictKind::OrderMismatch;
    v.expected_absent = true;
    v.actual_count = detail::count_of(haystack);
    if(std::begin(haystack) != std::end(haystack)) v.actual_at = *std::begin(haystack);
    return v;
}

template<class Haystack, class Needles>
CollectionVerdict<detail::element_of_t<Haystack>, detail::element_of_t<Needles>>
contains_only(const Haystack& haystack, const Needles& needles){
    using A = detail::element_of_t<Haystack>;
    using E = detail::element_of_t<Needles>;
    CollectionVerdict<A, E> v;
    v.expected_count = detail::count_of(needles);
    for(const auto& h : haystack){
        ++v.actual_count;
        bool known = false;
        for(const auto& n : needles){
            if(detail::elements_equal(h, n)){ known = true; break; }
        }
        if(!known) v.unexpected.push_back(h);
    }
    if(!v.unexpected.empty()) v.kind = CollectionVerdictKind::UnexpectedElements;
    return v;
}

// ------ argument normalization ------

namespace detail {
template<class C>
std::vector<element_of_t<C>> collect(const C& c){ return std::vector<element_of_t<C>>(std::begin(c), std::end(c)); }
} // namespace detail

// A single argument that is a whole (non-string) collection is the expected set; otherwise
// the arguments themselves are the expected elements.
template<class... Needles>
auto expected_elements(const Needles&... needles){
    static_assert(sizeof...(Needles) > 0, "at least one expected value is required");
    if constexpr (sizeof...(Needles) == 1 && (detail::is_expected_collection_v<Needles> && ...)){
        return detail::collect(needles...);
    } else {
        using E = std::common_type_t<detail::needle_t<Needles>...>;
        return std::vector<E>{ E(needles)... };
    }
}

// Dynamic variant: a single sequence value is unwrapped at runtime, a string value never is.
std::vector<value> expected_elements(const value& single);

template<class Haystack, class... Needles>
auto contains(const Haystack& haystack, const Needles&... needles){
    return contains_at_least(haystack, expected_elements(needles...));
}

template<class Haystack, class... Needles>
auto contains_exactly_values(const Haystack& haystack, const Needles&... needles){
    return contains_exactly(haystack, expected_elements(needles...));
}

template<class Haystack, class... Needles>
auto contains_only_values(const Haystack& haystack, const Needles&... needles){
    return contains_only(haystack, expected_elements(needles...));
}

} // namespace deepcheck
