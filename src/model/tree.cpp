#include "model/tree.hpp"

namespace sylva
{
    TreeNode::TreeNode(std::string name, std::vector<TreeElement> children)
        : name_(std::move(name)), children_(std::move(children))
    {
        if (children_.empty())
        {
            throw ConstructionError("Node '" + name_ + "' needs at least one child, use a Leaf instead.");
        }
    }

    TreeNode::TreeNode(const TreeNode &other) = default;
    TreeNode::TreeNode(TreeNode &&other) noexcept = default;
    TreeNode &TreeNode::operator=(const TreeNode &other) = default;
    TreeNode &TreeNode::operator=(TreeNode &&other) noexcept = default;
    TreeNode::~TreeNode() = default;

    const std::string &TreeElement::getName() const
    {
        return accept(Overloaded{
            [](const TreeLeaf &leaf) -> const std::string & { return leaf.getName(); },
            [](const TreeNode &node) -> const std::string & { return node.getName(); },
        });
    }
} // namespace sylva
