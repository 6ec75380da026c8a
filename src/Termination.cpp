/**
 * @file Termination.cpp
 * @brief Validation of sequence termination strategies.
 */

#include "binform/Termination.hpp"
#include "binform/Errors.hpp"

namespace binform
{

void Termination::validate(const std::string& owner) const
{
    const int configured = static_cast<int>(count.has_value()) +
                           static_cast<int>(byteBudget.has_value()) +
                           static_cast<int>(sentinel.has_value());
    if (configured == 0)
    {
        throw InvalidConfiguration(owner + " must either have a count, a byte budget or a sentinel");
    }
    if (configured > 1)
    {
        throw InvalidConfiguration(
            owner + " has " + std::to_string(configured) +
            " termination strategies configured, only one is allowed"
        );
    }
}

std::string Termination::describe() const
{
    if (count) return "count " + count->describe();
    if (byteBudget) return "byte budget " + byteBudget->describe();
    if (sentinel) return "sentinel " + sentinel->toString();
    return "no termination";
}

} // namespace binform
