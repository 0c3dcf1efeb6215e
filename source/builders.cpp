// builders.cpp - ObjectBuilder / ArrayBuilder

#include <semdiff/builders.h>
#include <semdiff/diagnostics.h>

namespace semdiff {

ObjectBuilder::ObjectBuilder(const ValueObject& existing)
    : transient_(existing.transient())
{
    index_.reserve(existing.size());
    for (std::size_t i = 0; i < existing.size(); ++i) {
        index_.emplace(existing[i].key, i);
    }
}

ObjectBuilder& ObjectBuilder::set(std::string_view key, Value val)
{
    std::string k(key);
    auto found = index_.find(k);
    if (found != index_.end()) {
        transient_.set(found->second, ObjectMember{std::move(k), ValueBox{std::move(val)}});
        return *this;
    }
    index_.emplace(k, transient_.size());
    transient_.push_back(ObjectMember{std::move(k), ValueBox{std::move(val)}});
    return *this;
}

ObjectIndex::ObjectIndex(const ValueObject& object)
    : object_(object)
{
    index_.reserve(object.size());
    for (std::size_t i = 0; i < object.size(); ++i) {
        index_.emplace(object[i].key, i);
    }
}

const Value* ObjectIndex::find(std::string_view key) const
{
    auto found = index_.find(key);
    if (found == index_.end()) return nullptr;
    return &object_[found->second].value.get();
}

ArrayBuilder& ArrayBuilder::set(std::size_t index, Value val)
{
    if (index >= transient_.size()) {
        detail::log_index_error("ArrayBuilder::set", index, "out of range");
        return *this;
    }
    transient_.set(index, ValueBox{std::move(val)});
    return *this;
}

} // namespace semdiff
