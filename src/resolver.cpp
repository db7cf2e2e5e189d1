#include "deepcheck/resolver.hpp"

namespace deepcheck {

value MemberDescriptor::read(const object_ref& instance) const {
    if(!owner || !slot || !instance.type)
        throw reflection_error("member '" + raw_name + "' read through an incomplete descriptor");
    const void* self = upcast_to(*instance.type, instance.self.get(), *owner);
    return slot->read(self);
}

MemberDescriptor describe_member(const TypeDescriptor& owner, const MemberSlot& slot, const NameRecognizer& names){
    auto n = names.normalize(slot.raw_name);
    MemberDescriptor d;
    d.raw_name = slot.raw_name;
    d.semantic_name = std::move(n.semantic);
    d.origin = n.origin;
    d.owner = &owner;
    d.slot = &slot;
    return d;
}

std::optional<MemberDescriptor> resolve_member(const TypeDescriptor& type, std::string_view name, const NameRecognizer& names){
    // 1. exact raw name (both sides ordinary, or both the same kind of synthesized member)
    if(const MemberSlot* s = type.find_declared(name))
        return describe_member(type, *s, names);
    // 2. reconcile hand-written and synthesized spellings of the same logical member
    const auto wanted = names.normalize(name);
    for(const auto& s : type.members){
        if(names.normalize(s.raw_name).semantic == wanted.semantic)
            return describe_member(type, s, names);
    }
    // 3. one ancestor level per call
    if(!type.base) return std::nullopt;
    return resolve_member(*type.base, name, names);
}

std::vector<MemberDescriptor> list_members(const TypeDescriptor& type, const NameRecognizer& names){
    std::vector<MemberDescriptor> out;
    for(const TypeDescriptor* t = &type; t; t = t->base){
        for(const auto& s : t->members) out.push_back(describe_member(*t, s, names));
    }
    return out;
}

} // namespace deepcheck
