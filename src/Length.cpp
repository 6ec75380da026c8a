/**
 * @file Length.cpp
 * @brief Resolution of literal, referenced and computed lengths.
 */

#include "binform/Length.hpp"
#include "binform/Errors.hpp"

namespace binform
{
namespace
{
    std::size_t checkedLength(std::int64_t n, const std::string& what)
    {
        if (n < 0)
        {
            throw InvalidConfiguration(what + " resolved to negative length " + std::to_string(n));
        }
        return static_cast<std::size_t>(n);
    }
} // namespace

std::size_t Length::checkedLiteral(long long n)
{
    return checkedLength(n, "literal");
}

Length::Length(std::string fieldName)
    : m_form(Reference{std::move(fieldName)})
{
    if (std::get<Reference>(m_form).name.empty())
    {
        throw InvalidConfiguration("length reference needs a field name");
    }
}

Length::Length(const char* fieldName)
    : Length(std::string(fieldName))
{
}

std::size_t Length::resolve(const Context& context) const
{
    if (const auto* n = std::get_if<std::size_t>(&m_form))
    {
        return *n;
    }

    if (const auto* ref = std::get_if<Reference>(&m_form))
    {
        const Value& value = context.at(ref->name);
        if (value.isBool())
        {
            return value.asBool() ? 1 : 0;
        }
        if (auto u = value.toUInt64())
        {
            return static_cast<std::size_t>(*u);
        }
        if (auto s = value.toInt64())
        {
            return checkedLength(*s, "field '" + ref->name + "'");
        }
        throw InvalidConfiguration(
            "field '" + ref->name + "' used as a length is not an integer: " + value.toString()
        );
    }

    const auto& fn = std::get<Computed>(m_form);
    return checkedLength(fn(context), "computed length");
}

std::string Length::describe() const
{
    if (const auto* n = std::get_if<std::size_t>(&m_form)) return std::to_string(*n);
    if (const auto* ref = std::get_if<Reference>(&m_form)) return "field '" + ref->name + "'";
    return "computed";
}

} // namespace binform
