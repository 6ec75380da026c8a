/**
 * @file Context.hpp
 * @brief Ordered set of fields already decoded by the current Format.
 */

#pragma once

#include "Value.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace binform
{
    /**
     * @class Context
     * @brief Name -> Value mapping that grows as a Format decodes.
     *
     * Entries keep their insertion order and are never removed or
     * replaced. A nested Format creates a Context chained to its parent,
     * so lookups fall back to the enclosing Format's fields while the
     * nested result only holds its own.
     */
    class Context
    {
    public:
        using const_iterator = Value::Record::const_iterator;

        Context() = default;

        /**
         * @brief Creates an empty context whose lookups fall back to @p parent.
         */
        explicit Context(const Context* parent) : m_parent(parent) {}

        /**
         * @brief Finds a field here or in any enclosing context.
         * @return nullptr if no such field has been decoded yet.
         */
        const Value* find(std::string_view name) const;

        /**
         * @brief Like find(), but throws if the field is absent.
         * @throws UnresolvedReference
         */
        const Value& at(std::string_view name) const;

        bool contains(std::string_view name) const { return find(name) != nullptr; }

        /**
         * @brief Appends a field.
         * @throws InvalidConfiguration if this context already holds @p name.
         */
        void insert(std::string name, Value value);

        std::size_t size() const { return m_fields.size(); }
        bool empty() const { return m_fields.empty(); }

        const_iterator begin() const { return m_fields.begin(); }
        const_iterator end() const { return m_fields.end(); }

        /// Own fields only, in decode order.
        const Value::Record& fields() const { return m_fields; }

        const Context* parent() const { return m_parent; }

        /// Moves the own fields out as a record value.
        Value toValue() &&;

    private:
        Value::Record m_fields;
        const Context* m_parent = nullptr;
    };

} // namespace binform
