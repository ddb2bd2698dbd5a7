#ifndef SYLVA_VISITORS_EVALUATOR_HPP
#define SYLVA_VISITORS_EVALUATOR_HPP

#include "model/expression.hpp"
#include "model/number.hpp"

namespace sylva
{
    /**
     * Reduces an expression tree to a Number.
     *
     * Add, Subtract and Multiply stay integral while both operands are
     * integers and the result fits in int64; otherwise they compute in
     * floating point. Divide always divides in floating point and throws
     * DivisionByZeroError when the right operand evaluates to zero. The
     * left operand is evaluated first.
     */
    class Evaluator
    {
    public:
        Number operator()(const ExprInteger &node) const;
        Number operator()(const ExprFloat &node) const;
        Number operator()(const ExprNegative &node) const;
        Number operator()(const ExprAdd &node) const;
        Number operator()(const ExprSubtract &node) const;
        Number operator()(const ExprMultiply &node) const;
        Number operator()(const ExprDivide &node) const;
    };

    Number evaluate(const Expression &root);
} // namespace sylva

#endif // SYLVA_VISITORS_EVALUATOR_HPP
