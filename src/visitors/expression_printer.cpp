#include "model/number.hpp"
#include "visitors/expression_printer.hpp"

namespace sylva
{
    std::string ExpressionPrinter::operator()(const ExprInteger &node) const
    {
        return formatInteger(node.getValue());
    }

    std::string ExpressionPrinter::operator()(const ExprFloat &node) const
    {
        return formatFloat(node.getValue());
    }

    std::string ExpressionPrinter::operator()(const ExprNegative &node) const
    {
        return SYMBOL_NEGATIVE + printOperand(node.getOperand());
    }

    std::string ExpressionPrinter::operator()(const ExprAdd &node) const
    {
        return printBinary(node, SYMBOL_ADD);
    }

    std::string ExpressionPrinter::operator()(const ExprSubtract &node) const
    {
        return printBinary(node, SYMBOL_SUBTRACT);
    }

    std::string ExpressionPrinter::operator()(const ExprMultiply &node) const
    {
        return printBinary(node, SYMBOL_MULTIPLY);
    }

    std::string ExpressionPrinter::operator()(const ExprDivide &node) const
    {
        return printBinary(node, SYMBOL_DIVIDE);
    }

    std::string ExpressionPrinter::printOperand(const Expression &operand) const
    {
        std::string text = operand.accept(*this);
        if (operand.isBinary())
        {
            return "(" + text + ")";
        }
        return text;
    }

    std::string ExpressionPrinter::printBinary(const ExprBinary &node, const std::string &symbol) const
    {
        return printOperand(node.getLeft()) + " " + symbol + " " + printOperand(node.getRight());
    }

    std::string printExpression(const Expression &root)
    {
        return root.accept(ExpressionPrinter());
    }
} // namespace sylva
