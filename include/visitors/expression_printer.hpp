#ifndef SYLVA_VISITORS_EXPRESSION_PRINTER_HPP
#define SYLVA_VISITORS_EXPRESSION_PRINTER_HPP

#include <string>
#include "model/expression.hpp"

namespace sylva
{
    const std::string SYMBOL_ADD = "+";
    const std::string SYMBOL_SUBTRACT = "-";
    const std::string SYMBOL_MULTIPLY = "*";
    const std::string SYMBOL_DIVIDE = "/";
    const std::string SYMBOL_NEGATIVE = "-";

    // Infix renderer. Every operand that is itself a binary operation is
    // wrapped in parentheses; the root is never wrapped.
    class ExpressionPrinter
    {
    public:
        std::string operator()(const ExprInteger &node) const;
        std::string operator()(const ExprFloat &node) const;
        std::string operator()(const ExprNegative &node) const;
        std::string operator()(const ExprAdd &node) const;
        std::string operator()(const ExprSubtract &node) const;
        std::string operator()(const ExprMultiply &node) const;
        std::string operator()(const ExprDivide &node) const;

    private:
        std::string printOperand(const Expression &operand) const;
        std::string printBinary(const ExprBinary &node, const std::string &symbol) const;
    };

    std::string printExpression(const Expression &root);
} // namespace sylva

#endif // SYLVA_VISITORS_EXPRESSION_PRINTER_HPP
