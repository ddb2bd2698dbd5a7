#include <cstdint>
#include "visitors/evaluator.hpp"
#include "visitors/expression_printer.hpp"

namespace sylva
{
    Number Evaluator::operator()(const ExprInteger &node) const
    {
        return Number(node.getValue());
    }

    Number Evaluator::operator()(const ExprFloat &node) const
    {
        return Number(node.getValue());
    }

    Number Evaluator::operator()(const ExprNegative &node) const
    {
        return -node.getOperand().accept(*this);
    }

    Number Evaluator::operator()(const ExprAdd &node) const
    {
        Number left = node.getLeft().accept(*this);
        Number right = node.getRight().accept(*this);
        std::int64_t result = 0;
        if (left.isInteger() && right.isInteger() && !__builtin_add_overflow(left.getInteger(), right.getInteger(), &result))
        {
            return Number(result);
        }
        return Number(left.toDouble() + right.toDouble());
    }

    Number Evaluator::operator()(const ExprSubtract &node) const
    {
        Number left = node.getLeft().accept(*this);
        Number right = node.getRight().accept(*this);
        std::int64_t result = 0;
        if (left.isInteger() && right.isInteger() && !__builtin_sub_overflow(left.getInteger(), right.getInteger(), &result))
        {
            return Number(result);
        }
        return Number(left.toDouble() - right.toDouble());
    }

    Number Evaluator::operator()(const ExprMultiply &node) const
    {
        Number left = node.getLeft().accept(*this);
        Number right = node.getRight().accept(*this);
        std::int64_t result = 0;
        if (left.isInteger() && right.isInteger() && !__builtin_mul_overflow(left.getInteger(), right.getInteger(), &result))
        {
            return Number(result);
        }
        return Number(left.toDouble() * right.toDouble());
    }

    Number Evaluator::operator()(const ExprDivide &node) const
    {
        Number left = node.getLeft().accept(*this);
        Number right = node.getRight().accept(*this);
        if (right.isZero())
        {
            throw DivisionByZeroError(ExpressionPrinter()(node));
        }
        return Number(left.toDouble() / right.toDouble());
    }

    Number evaluate(const Expression &root)
    {
        return root.accept(Evaluator());
    }
} // namespace sylva
