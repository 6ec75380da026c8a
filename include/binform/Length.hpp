/**
 * @file Length.hpp
 * @brief A count or size that may depend on previously decoded fields.
 */

#pragma once

#include "Context.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <variant>

namespace binform
{
    /**
     * @class Length
     * @brief Literal(n) | Reference(name) | Computed(fn(context)).
     *
     * All three forms are resolved through resolve(), so consumers never
     * branch on the form themselves.
     */
    class Length
    {
    public:
        struct Reference
        {
            std::string name;
        };

        using Computed = std::function<std::int64_t(const Context&)>;

        /**
         * @brief A fixed length.
         * @throws InvalidConfiguration if @p literal is negative.
         */
        template <std::integral T>
            requires (!std::same_as<T, bool>)
        Length(T literal)
        {
            if constexpr (std::is_signed_v<T>)
                m_form = checkedLiteral(static_cast<long long>(literal));
            else
                m_form = static_cast<std::size_t>(literal);
        }

        /// The value of a previously decoded field.
        Length(std::string fieldName);
        Length(const char* fieldName);

        /// A function of the current context.
        template <typename F>
            requires std::invocable<const F&, const Context&> &&
                     (!std::convertible_to<F, std::string>) &&
                     (!std::is_arithmetic_v<F>)
        Length(F fn)
            : m_form(Computed([fn = std::move(fn)](const Context& ctx) {
                  return static_cast<std::int64_t>(fn(ctx));
              }))
        {
        }

        static Length literal(long long n) { return Length(n); }
        static Length field(std::string name) { return Length(std::move(name)); }
        static Length computed(Computed fn) { return Length(std::move(fn)); }

        /**
         * @brief Resolves the length against @p context. A referenced Bool
         * counts as 0 or 1.
         * @throws UnresolvedReference if a referenced field is missing.
         * @throws InvalidConfiguration if the result is not a non-negative integer.
         */
        std::size_t resolve(const Context& context) const;

        bool isLiteral() const { return std::holds_alternative<std::size_t>(m_form); }

        /// "5", "field 'length'" or "computed", for messages.
        std::string describe() const;

    private:
        static std::size_t checkedLiteral(long long n);

        std::variant<std::size_t, Reference, Computed> m_form;
    };

} // namespace binform
