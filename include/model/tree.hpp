#ifndef SYLVA_MODEL_TREE_HPP
#define SYLVA_MODEL_TREE_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "errors.hpp"
#include "visitor.hpp"

namespace sylva
{
    class TreeElement;

    class TreeLeaf
    {
    public:
        explicit TreeLeaf(std::string name) : name_(std::move(name)) {}

        const std::string &getName() const { return name_; }

    private:
        std::string name_;
    };

    // Internal node of a generic tree. Always holds at least one child.
    class TreeNode
    {
    public:
        TreeNode(std::string name, std::vector<TreeElement> children);
        TreeNode(const TreeNode &other);
        TreeNode(TreeNode &&other) noexcept;
        TreeNode &operator=(const TreeNode &other);
        TreeNode &operator=(TreeNode &&other) noexcept;
        ~TreeNode();

        const std::string &getName() const { return name_; }
        const std::vector<TreeElement> &getChildren() const { return children_; }

    private:
        std::string name_;
        std::vector<TreeElement> children_;
    };

    class TreeElement
    {
    public:
        enum class NodeType
        {
            Leaf,
            Node
        };

        TreeElement(TreeLeaf leaf) : value_(std::move(leaf)) {}
        TreeElement(TreeNode node) : value_(std::move(node)) {}

        NodeType getType() const { return std::holds_alternative<TreeLeaf>(value_) ? NodeType::Leaf : NodeType::Node; }
        const std::string &getName() const;

        template <typename Visitor, typename... Context>
        decltype(auto) accept(Visitor &&visitor, Context &&...context) const
        {
            return dispatch(std::forward<Visitor>(visitor), value_, std::forward<Context>(context)...);
        }

    private:
        std::variant<TreeLeaf, TreeNode> value_;
    };

    inline TreeElement Leaf(std::string name)
    {
        return TreeElement(TreeLeaf(std::move(name)));
    }

    // Node("Scene", Leaf("Camera"), Node("Table", Leaf("Box")))
    template <typename... Children>
    TreeElement Node(std::string name, Children &&...children)
    {
        std::vector<TreeElement> list;
        list.reserve(sizeof...(children));
        (list.emplace_back(std::forward<Children>(children)), ...);
        return TreeElement(TreeNode(std::move(name), std::move(list)));
    }
} // namespace sylva

#endif // SYLVA_MODEL_TREE_HPP
