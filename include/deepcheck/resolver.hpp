// Member resolution over a type hierarchy (exact raw name first, then semantic name).
#pragma once
#include "deepcheck/names.hpp"
#include "deepcheck/reflect.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deepcheck {

struct MemberDescriptor {
    std::string raw_name;
    std::string semantic_name;
    MemberOrigin origin = MemberOrigin::Ordinary;
    const TypeDescriptor* owner = nullptr;
    const MemberSlot* slot = nullptr;

    EqualityKind equality() const { return slot ? slot->equality : EqualityKind::Inferred; }
    // Read the member from an instance whose runtime type is `owner` or derives from it.
    // Throws reflection_error otherwise.
    value read(const object_ref& instance) const;
};

MemberDescriptor describe_member(const TypeDescriptor& owner, const MemberSlot& slot, const NameRecognizer& names);

// Locate `name` (raw or semantic) on `type`, climbing ancestors one level at a time.
// Accessibility plays no role: every declared member is visible.
std::optional<MemberDescriptor> resolve_member(const TypeDescriptor& type, std::string_view name,
                                               const NameRecognizer& names = synthesized_recognizer());

// All members of `type` and its ancestors, most-derived first, each once.
std::vector<MemberDescriptor> list_members(const TypeDescriptor& type,
                                           const NameRecognizer& names = synthesized_recognizer());

} // namespace deepcheck
