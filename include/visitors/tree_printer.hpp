#ifndef SYLVA_VISITORS_TREE_PRINTER_HPP
#define SYLVA_VISITORS_TREE_PRINTER_HPP

#include <optional>
#include <string>
#include "model/expression.hpp"
#include "model/tree.hpp"

namespace sylva
{
    enum class NodeStyle
    {
        Tree,   //  ╿ Scene / ├─┮ Robot / └─╼ Box
        Indent, // two spaces per level
        Bullet, // two spaces per level, then "* "
    };

    const std::string PREFIX_ROOT = " ╿ ";
    const std::string PREFIX_MIDDLE_SIBLING_W_CHILD = " ├─┮ ";
    const std::string PREFIX_LAST_SIBLING_W_CHILD = " └─┮ ";
    const std::string PREFIX_MIDDLE_SIBLING_NO_CHILDREN = " ├─╼ ";
    const std::string PREFIX_LAST_SIBLING_NO_CHILDREN = " └─╼ ";
    const std::string PREFIX_VERTICAL_CONTINUATION = " │";
    const std::string PREFIX_BLANK_CONTINUATION = "  ";
    const std::string PREFIX_BULLET = "* ";

    std::string formatNodeStyle(NodeStyle style);
    std::optional<NodeStyle> parseNodeStyle(const std::string &name);

    /**
     * Structural renderer for both node families.
     *
     * Generic trees are labelled with their names. Expression trees are
     * outlined with one line per node: value leaves as `Integer(2)` or
     * `Float(5.0)`, operators by their type name with the operands as
     * children.
     *
     * Lines are joined with '\n', root first, without a trailing newline.
     */
    class TreePrinter
    {
    public:
        explicit TreePrinter(NodeStyle style = NodeStyle::Tree) : style_(style) {}

        std::string print(const TreeElement &root) const;
        std::string print(const Expression &root) const;

    private:
        NodeStyle style_;

        template <typename Element>
        void printElement(std::string &out, const Element &element, const std::string &prefix, int level, bool isRoot, bool isLast) const;
    };

    std::string printTree(const TreeElement &root, NodeStyle style = NodeStyle::Tree);
    std::string printTree(const Expression &root, NodeStyle style = NodeStyle::Tree);
} // namespace sylva

#endif // SYLVA_VISITORS_TREE_PRINTER_HPP
