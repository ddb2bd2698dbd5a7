#ifndef SYLVA_MODEL_ERRORS_HPP
#define SYLVA_MODEL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sylva
{
    // Raised while building a tree that would be malformed.
    class ConstructionError : public std::runtime_error
    {
    public:
        explicit ConstructionError(const std::string &message) : std::runtime_error(message) {}
    };

    class DivisionByZeroError : public std::runtime_error
    {
    public:
        explicit DivisionByZeroError(const std::string &expression)
            : std::runtime_error("Division by zero in '" + expression + "'."), expression_(expression) {}

        // Infix rendering of the Divide node that failed.
        const std::string &getExpression() const { return expression_; }

    private:
        std::string expression_;
    };
} // namespace sylva

#endif // SYLVA_MODEL_ERRORS_HPP
