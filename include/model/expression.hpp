#ifndef SYLVA_MODEL_EXPRESSION_HPP
#define SYLVA_MODEL_EXPRESSION_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include "errors.hpp"
#include "visitor.hpp"

namespace sylva
{
    class Expression;

    using ExpressionPtr = std::unique_ptr<Expression>;

    class ExprInteger
    {
    public:
        explicit ExprInteger(std::int64_t value) : value_(value) {}
        std::int64_t getValue() const { return value_; }

    private:
        std::int64_t value_;
    };

    class ExprFloat
    {
    public:
        // Throws ConstructionError for NaN and infinities.
        explicit ExprFloat(double value);
        double getValue() const { return value_; }

    private:
        double value_;
    };

    class ExprNegative
    {
    public:
        explicit ExprNegative(ExpressionPtr operand);
        ExprNegative(ExprNegative &&other) noexcept;
        ExprNegative &operator=(ExprNegative &&other) noexcept;
        ~ExprNegative();

        const Expression &getOperand() const { return *operand_; }

    private:
        ExpressionPtr operand_;
    };

    // Shared storage of the four arithmetic operators. Both operands are
    // owned by the node and never null.
    class ExprBinary
    {
    public:
        ExprBinary(ExpressionPtr left, ExpressionPtr right);
        ExprBinary(ExprBinary &&other) noexcept;
        ExprBinary &operator=(ExprBinary &&other) noexcept;
        ~ExprBinary();

        const Expression &getLeft() const { return *left_; }
        const Expression &getRight() const { return *right_; }

    private:
        ExpressionPtr left_;
        ExpressionPtr right_;
    };

    class ExprAdd : public ExprBinary
    {
    public:
        using ExprBinary::ExprBinary;
    };

    class ExprSubtract : public ExprBinary
    {
    public:
        using ExprBinary::ExprBinary;
    };

    class ExprMultiply : public ExprBinary
    {
    public:
        using ExprBinary::ExprBinary;
    };

    class ExprDivide : public ExprBinary
    {
    public:
        using ExprBinary::ExprBinary;
    };

    class Expression
    {
    public:
        enum class NodeType
        {
            Integer,
            Float,
            Negative,
            Add,
            Subtract,
            Multiply,
            Divide
        };

        using Variant = std::variant<ExprInteger, ExprFloat, ExprNegative, ExprAdd, ExprSubtract, ExprMultiply, ExprDivide>;

        Expression(ExprInteger node) : value_(std::move(node)) {}
        Expression(ExprFloat node) : value_(std::move(node)) {}
        Expression(ExprNegative node) : value_(std::move(node)) {}
        Expression(ExprAdd node) : value_(std::move(node)) {}
        Expression(ExprSubtract node) : value_(std::move(node)) {}
        Expression(ExprMultiply node) : value_(std::move(node)) {}
        Expression(ExprDivide node) : value_(std::move(node)) {}

        // Alternatives are declared in the same order as NodeType.
        NodeType getType() const { return static_cast<NodeType>(value_.index()); }
        bool isBinary() const;

        template <typename Visitor, typename... Context>
        decltype(auto) accept(Visitor &&visitor, Context &&...context) const
        {
            return dispatch(std::forward<Visitor>(visitor), value_, std::forward<Context>(context)...);
        }

    private:
        Variant value_;
    };

    Expression Integer(std::int64_t value);
    Expression Float(double value);
    Expression Negative(Expression operand);
    Expression Add(Expression left, Expression right);
    Expression Subtract(Expression left, Expression right);
    Expression Multiply(Expression left, Expression right);
    Expression Divide(Expression left, Expression right);
} // namespace sylva

#endif // SYLVA_MODEL_EXPRESSION_HPP
