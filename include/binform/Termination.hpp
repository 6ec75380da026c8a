/**
 * @file Termination.hpp
 * @brief How a sequence decoder knows where the sequence ends.
 */

#pragma once

#include "Length.hpp"
#include "Value.hpp"
#include <optional>
#include <string>

namespace binform
{
    /**
     * @struct Termination
     * @brief Exactly one of count, byteBudget or sentinel.
     *
     * The fields are public so a schema can be assembled piecewise; the
     * owning descriptor checks at construction that exactly one is set.
     */
    struct Termination
    {
        std::optional<Length> count;      ///< Number of elements.
        std::optional<Length> byteBudget; ///< Number of raw bytes.
        std::optional<Value> sentinel;    ///< Value that ends the sequence.

        static Termination byCount(Length n)
        {
            Termination t;
            t.count = std::move(n);
            return t;
        }

        static Termination byBytes(Length n)
        {
            Termination t;
            t.byteBudget = std::move(n);
            return t;
        }

        static Termination bySentinel(Value v)
        {
            Termination t;
            t.sentinel = std::move(v);
            return t;
        }

        /**
         * @throws InvalidConfiguration unless exactly one strategy is set.
         * @param owner Descriptor name used in the message.
         */
        void validate(const std::string& owner) const;

        /// "count 5", "byte budget field 'size'", "sentinel 0", for messages.
        std::string describe() const;
    };

} // namespace binform
