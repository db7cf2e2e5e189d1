#include "deepcheck/reflect.hpp"
#include "deepcheck/names.hpp"

namespace deepcheck {

const MemberSlot* TypeDescriptor::find_declared(std::string_view raw_name) const {
    for(const auto& m : members) if(m.raw_name == raw_name) return &m;
    return nullptr;
}

bool inherits_from(const TypeDescriptor& type, const TypeDescriptor& ancestor){
    for(const TypeDescriptor* t = &type; t; t = t->base) if(t == &ancestor) return true;
    return false;
}

const void* upcast_to(const TypeDescriptor& from, const void* self, const TypeDescriptor& to){
    const TypeDescriptor* t = &from;
    while(t && t != &to){
        if(t->base && t->upcast) self = t->upcast(self);
        t = t->base;
    }
    if(!t) throw reflection_error("type '" + from.name + "' does not derive from '" + to.name + "'");
    return self;
}

size_t hierarchy_member_count(const TypeDescriptor& type){
    size_t n = 0;
    for(const TypeDescriptor* t = &type; t; t = t->base) n += t->members.size();
    return n;
}

// ------ records ------

namespace {

MemberSlot record_slot(std::string raw_name, size_t index){
    MemberSlot s;
    s.raw_name = std::move(raw_name);
    s.equality = EqualityKind::Inferred;
    s.read = [index](const void* self){
        const auto* r = static_cast<const record*>(self);
        return index < r->slots.size() ? r->slots[index] : value{};
    };
    return s;
}

const void* same_record(const void* self){ return self; }

} // namespace

value make_record(std::shared_ptr<const TypeDescriptor> type, std::vector<value> slots){
    if(!type) throw reflection_error("record without a type");
    const size_t expected = hierarchy_member_count(*type);
    if(slots.size() != expected)
        throw reflection_error("record '" + type->name + "' expects " + std::to_string(expected) + " slots, got " + std::to_string(slots.size()));
    const TypeDescriptor* raw = type.get();
    auto r = std::make_shared<const record>(record{std::move(type), std::move(slots)});
    return value{object_ref{raw, std::shared_ptr<const void>(r, r.get())}};
}

const TypeDescriptor& RecordSchema::declare(const std::string& name, const std::vector<std::string>& fields, const std::string& base){
    if(types_.count(name)) throw reflection_error("record type '" + name + "' already declared");
    auto t = std::make_shared<TypeDescriptor>();
    t->name = name;
    size_t offset = 0;
    if(!base.empty()){
        auto b = find_shared(base);
        if(!b) throw reflection_error("unknown base record type '" + base + "' for '" + name + "'");
        t->base = b.get();
        t->base_owner = b;
        t->upcast = same_record;
        offset = hierarchy_member_count(*b);
    }
    for(size_t i = 0; i < fields.size(); ++i){
        if(t->find_declared(fields[i])) throw reflection_error("duplicate field '" + fields[i] + "' in record '" + name + "'");
        t->members.push_back(record_slot(fields[i], offset + i));
    }
    auto& slot = types_[name];
    slot = std::move(t);
    return *slot;
}

const TypeDescriptor* RecordSchema::find(std::string_view name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : it->second.get();
}

std::shared_ptr<const TypeDescriptor> RecordSchema::find_shared(std::string_view name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : it->second;
}

value RecordSchema::make(std::string_view name, std::vector<value> slots) const {
    auto t = find_shared(name);
    if(!t) throw reflection_error("unknown record type '" + std::string(name) + "'");
    return make_record(std::move(t), std::move(slots));
}

value RecordSchema::make_anonymous(const std::vector<std::pair<std::string, value>>& fields){
    auto t = std::make_shared<TypeDescriptor>();
    t->name = "<>f__AnonymousType";
    std::vector<value> slots;
    slots.reserve(fields.size());
    for(size_t i = 0; i < fields.size(); ++i){
        auto raw = capture_name(fields[i].first);
        if(t->find_declared(raw)) throw reflection_error("duplicate field '" + fields[i].first + "' in anonymous record");
        t->members.push_back(record_slot(std::move(raw), i));
        slots.push_back(fields[i].second);
    }
    return make_record(std::move(t), std::move(slots));
}

} // namespace deepcheck
