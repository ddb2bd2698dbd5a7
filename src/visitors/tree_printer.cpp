#include <vector>
#include "model/number.hpp"
#include "visitors/tree_printer.hpp"

namespace sylva
{
    namespace
    {
        std::string labelOf(const TreeElement &element)
        {
            return element.getName();
        }

        std::string labelOf(const Expression &expression)
        {
            return expression.accept(Overloaded{
                [](const ExprInteger &node) { return "Integer(" + formatInteger(node.getValue()) + ")"; },
                [](const ExprFloat &node) { return "Float(" + formatFloat(node.getValue()) + ")"; },
                [](const ExprNegative &) { return std::string("Negative"); },
                [](const ExprAdd &) { return std::string("Add"); },
                [](const ExprSubtract &) { return std::string("Subtract"); },
                [](const ExprMultiply &) { return std::string("Multiply"); },
                [](const ExprDivide &) { return std::string("Divide"); },
            });
        }

        std::string connectorOf(const TreeElement &element, bool isLast)
        {
            return element.accept(Overloaded{
                [](const TreeLeaf &, bool last) { return last ? PREFIX_LAST_SIBLING_NO_CHILDREN : PREFIX_MIDDLE_SIBLING_NO_CHILDREN; },
                [](const TreeNode &, bool last) { return last ? PREFIX_LAST_SIBLING_W_CHILD : PREFIX_MIDDLE_SIBLING_W_CHILD; },
            }, isLast);
        }

        std::string connectorOf(const Expression &expression, bool isLast)
        {
            return expression.accept(Overloaded{
                [](const ExprInteger &, bool last) { return last ? PREFIX_LAST_SIBLING_NO_CHILDREN : PREFIX_MIDDLE_SIBLING_NO_CHILDREN; },
                [](const ExprFloat &, bool last) { return last ? PREFIX_LAST_SIBLING_NO_CHILDREN : PREFIX_MIDDLE_SIBLING_NO_CHILDREN; },
                [](const ExprNegative &, bool last) { return last ? PREFIX_LAST_SIBLING_W_CHILD : PREFIX_MIDDLE_SIBLING_W_CHILD; },
                [](const ExprBinary &, bool last) { return last ? PREFIX_LAST_SIBLING_W_CHILD : PREFIX_MIDDLE_SIBLING_W_CHILD; },
            }, isLast);
        }

        std::vector<const TreeElement *> childrenOf(const TreeElement &element)
        {
            return element.accept(Overloaded{
                [](const TreeLeaf &) { return std::vector<const TreeElement *>{}; },
                [](const TreeNode &node)
                {
                    std::vector<const TreeElement *> children;
                    children.reserve(node.getChildren().size());
                    for (const auto &child : node.getChildren())
                    {
                        children.push_back(&child);
                    }
                    return children;
                },
            });
        }

        std::vector<const Expression *> childrenOf(const Expression &expression)
        {
            return expression.accept(Overloaded{
                [](const ExprInteger &) { return std::vector<const Expression *>{}; },
                [](const ExprFloat &) { return std::vector<const Expression *>{}; },
                [](const ExprNegative &node) { return std::vector<const Expression *>{&node.getOperand()}; },
                [](const ExprBinary &node) { return std::vector<const Expression *>{&node.getLeft(), &node.getRight()}; },
            });
        }

        std::string indentation(int level)
        {
            std::string result;
            for (int i = 0; i < level; ++i)
            {
                result += PREFIX_BLANK_CONTINUATION;
            }
            return result;
        }
    } // namespace

    std::string formatNodeStyle(NodeStyle style)
    {
        switch (style)
        {
        case NodeStyle::Tree:
            return "tree";
        case NodeStyle::Indent:
            return "indent";
        case NodeStyle::Bullet:
            return "bullet";
        }
        return "unknown";
    }

    std::optional<NodeStyle> parseNodeStyle(const std::string &name)
    {
        if (name == "tree")
            return NodeStyle::Tree;
        if (name == "indent")
            return NodeStyle::Indent;
        if (name == "bullet")
            return NodeStyle::Bullet;
        return std::nullopt;
    }

    template <typename Element>
    void TreePrinter::printElement(std::string &out, const Element &element, const std::string &prefix, int level, bool isRoot, bool isLast) const
    {
        if (!isRoot)
        {
            out += '\n';
        }

        switch (style_)
        {
        case NodeStyle::Tree:
            out += prefix;
            out += isRoot ? PREFIX_ROOT : connectorOf(element, isLast);
            break;
        case NodeStyle::Indent:
            out += indentation(level);
            break;
        case NodeStyle::Bullet:
            out += indentation(level) + PREFIX_BULLET;
            break;
        }
        out += labelOf(element);

        // Children of the root start flush left; deeper levels carry a guide
        // for every ancestor that still has siblings below it.
        std::string childPrefix = prefix;
        if (!isRoot)
        {
            childPrefix += isLast ? PREFIX_BLANK_CONTINUATION : PREFIX_VERTICAL_CONTINUATION;
        }

        std::vector<const Element *> children = childrenOf(element);
        for (size_t i = 0; i < children.size(); ++i)
        {
            printElement(out, *children[i], childPrefix, level + 1, false, i == children.size() - 1);
        }
    }

    std::string TreePrinter::print(const TreeElement &root) const
    {
        std::string out;
        printElement(out, root, "", 0, true, true);
        return out;
    }

    std::string TreePrinter::print(const Expression &root) const
    {
        std::string out;
        printElement(out, root, "", 0, true, true);
        return out;
    }

    std::string printTree(const TreeElement &root, NodeStyle style)
    {
        return TreePrinter(style).print(root);
    }

    std::string printTree(const Expression &root, NodeStyle style)
    {
        return TreePrinter(style).print(root);
    }
} // namespace sylva
