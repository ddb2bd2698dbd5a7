#ifndef SYLVA_MODEL_VISITOR_HPP
#define SYLVA_MODEL_VISITOR_HPP

#include <utility>
#include <variant>

namespace sylva
{
    /**
     * Builds a visitor out of one lambda per node variant.
     *
     *     element.accept(Overloaded{
     *         [](const TreeLeaf &leaf) { ... },
     *         [](const TreeNode &node) { ... },
     *     });
     *
     * std::visit rejects the overload set at compile time when a variant has
     * no handler, so a new node type cannot be silently skipped.
     */
    template <class... Handlers>
    struct Overloaded : Handlers...
    {
        using Handlers::operator()...;
    };

    template <class... Handlers>
    Overloaded(Handlers...) -> Overloaded<Handlers...>;

    // Forwards the active alternative of `value` to `visitor` together with
    // any traversal context the visitor needs for recursion.
    template <typename Visitor, typename Variant, typename... Context>
    decltype(auto) dispatch(Visitor &&visitor, const Variant &value, Context &&...context)
    {
        return std::visit(
            [&](const auto &node) -> decltype(auto)
            {
                return std::forward<Visitor>(visitor)(node, std::forward<Context>(context)...);
            },
            value);
    }
} // namespace sylva

#endif // SYLVA_MODEL_VISITOR_HPP
