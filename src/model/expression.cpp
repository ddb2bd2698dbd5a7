#include <cmath>
#include "model/expression.hpp"
#include "model/number.hpp"

namespace sylva
{
    ExprFloat::ExprFloat(double value) : value_(value)
    {
        if (!std::isfinite(value))
        {
            throw ConstructionError("Float value must be finite, got " + formatFloat(value) + ".");
        }
    }

    ExprNegative::ExprNegative(ExpressionPtr operand) : operand_(std::move(operand))
    {
        if (!operand_)
        {
            throw ConstructionError("Negative needs an operand.");
        }
    }

    ExprNegative::ExprNegative(ExprNegative &&other) noexcept = default;
    ExprNegative &ExprNegative::operator=(ExprNegative &&other) noexcept = default;
    ExprNegative::~ExprNegative() = default;

    ExprBinary::ExprBinary(ExpressionPtr left, ExpressionPtr right)
        : left_(std::move(left)), right_(std::move(right))
    {
        if (!left_ || !right_)
        {
            throw ConstructionError("Binary expression needs both a left and a right operand.");
        }
    }

    ExprBinary::ExprBinary(ExprBinary &&other) noexcept = default;
    ExprBinary &ExprBinary::operator=(ExprBinary &&other) noexcept = default;
    ExprBinary::~ExprBinary() = default;

    bool Expression::isBinary() const
    {
        switch (getType())
        {
        case NodeType::Add:
        case NodeType::Subtract:
        case NodeType::Multiply:
        case NodeType::Divide:
            return true;
        case NodeType::Integer:
        case NodeType::Float:
        case NodeType::Negative:
            return false;
        }
        return false;
    }

    Expression Integer(std::int64_t value)
    {
        return ExprInteger(value);
    }

    Expression Float(double value)
    {
        return ExprFloat(value);
    }

    Expression Negative(Expression operand)
    {
        return ExprNegative(std::make_unique<Expression>(std::move(operand)));
    }

    Expression Add(Expression left, Expression right)
    {
        return ExprAdd(std::make_unique<Expression>(std::move(left)), std::make_unique<Expression>(std::move(right)));
    }

    Expression Subtract(Expression left, Expression right)
    {
        return ExprSubtract(std::make_unique<Expression>(std::move(left)), std::make_unique<Expression>(std::move(right)));
    }

    Expression Multiply(Expression left, Expression right)
    {
        return ExprMultiply(std::make_unique<Expression>(std::move(left)), std::make_unique<Expression>(std::move(right)));
    }

    Expression Divide(Expression left, Expression right)
    {
        return ExprDivide(std::make_unique<Expression>(std::move(left)), std::make_unique<Expression>(std::move(right)));
    }
} // namespace sylva
