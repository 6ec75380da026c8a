/**
 * @file Context.cpp
 * @brief Implementation of the decode Context.
 */

#include "binform/Context.hpp"
#include "binform/Errors.hpp"

#include <algorithm>

namespace binform
{

const Value* Context::find(std::string_view name) const
{
    for (const Context* ctx = this; ctx != nullptr; ctx = ctx->m_parent)
    {
        auto it = std::find_if(ctx->m_fields.begin(), ctx->m_fields.end(),
            [&](const Field& f) { return f.name == name; });
        if (it != ctx->m_fields.end()) return &it->value;
    }
    return nullptr;
}

const Value& Context::at(std::string_view name) const
{
    const Value* v = find(name);
    if (!v) throw UnresolvedReference(std::string(name));
    return *v;
}

void Context::insert(std::string name, Value value)
{
    bool duplicate = std::any_of(m_fields.begin(), m_fields.end(),
        [&](const Field& f) { return f.name == name; });
    if (duplicate)
    {
        throw InvalidConfiguration("field '" + name + "' decoded twice in the same context");
    }
    m_fields.push_back(Field{std::move(name), std::move(value)});
}

Value Context::toValue() &&
{
    return Value(std::move(m_fields));
}

} // namespace binform
