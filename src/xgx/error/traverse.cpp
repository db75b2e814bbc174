#include <xgx/error/traverse.hpp>

#include <span>

#include "visit_guard.hpp"

namespace xgx
{

namespace
{

struct flatten_frame
{
    error node;
    multi_unwrapper const *multi;
    std::span<error const> children;
    std::size_t next;
    std::size_t depth;
};

auto make_frame(error node, std::size_t depth) -> flatten_frame
{
    auto const multi = node.as<multi_unwrapper>();
    auto const children
            = multi ? multi->unwrap_all() : std::span<error const>{};
    return {std::move(node), multi, children, 0u, depth};
}

struct walk_frame
{
    error node;
    std::size_t depth;
};

} // namespace

auto flatten(error const &root) -> std::vector<error>
{
    std::vector<error> leaves;
    if (!root)
    {
        return leaves;
    }
    if (!root.as<multi_unwrapper>() && !root.as<single_unwrapper>())
    {
        leaves.push_back(root);
        return leaves;
    }

    detail::visit_guard guard;
    std::vector<flatten_frame> stack;

    (void)guard.mark(root);
    stack.push_back(make_frame(root, 0u));

    while (!stack.empty() && !guard.exhausted())
    {
        auto &top = stack.back();

        if (top.multi)
        {
            while (top.next < top.children.size() && !top.children[top.next])
            {
                ++top.next;
            }
            if (top.next < top.children.size())
            {
                // copy, push_back() invalidates top
                auto child = top.children[top.next++];
                auto const depth = top.depth + 1u;
                if (depth >= max_traversal_depth)
                {
                    break;
                }
                if (guard.mark(child))
                {
                    stack.push_back(make_frame(std::move(child), depth));
                }
                continue;
            }
            stack.pop_back();
            continue;
        }

        if (auto const single = top.node.as<single_unwrapper>())
        {
            if (auto child = single->unwrap())
            {
                auto const depth = top.depth + 1u;
                if (depth >= max_traversal_depth)
                {
                    break;
                }
                if (guard.mark(child))
                {
                    // descend in place, a chain link is never a leaf
                    top = make_frame(std::move(child), depth);
                    continue;
                }
                stack.pop_back();
                continue;
            }
        }

        leaves.push_back(top.node);
        stack.pop_back();
    }

    return leaves;
}

auto root(error const &e) -> error
{
    auto leaves = flatten(e);
    if (leaves.empty())
    {
        return {};
    }
    return std::move(leaves.front());
}

auto has(error const &e, error const &target) -> bool
{
    if (!e || !target)
    {
        return false;
    }

    bool found = false;
    walk(e,
         [&](error const &node)
         {
             found = node == target;
             return !found;
         });
    return found;
}

namespace detail
{

void walk(error const &root, visit_fn visit, void *state)
{
    if (!root)
    {
        return;
    }

    visit_guard guard;
    std::vector<walk_frame> stack;

    (void)guard.mark(root);
    stack.push_back(walk_frame{root, 0u});

    while (!stack.empty() && !guard.exhausted())
    {
        auto current = std::move(stack.back());
        stack.pop_back();

        if (!visit(state, current.node))
        {
            return;
        }

        auto const depth = current.depth + 1u;
        if (auto const multi = current.node.as<multi_unwrapper>())
        {
            auto const children = multi->unwrap_all();
            // reversed, the leftmost child is visited first
            for (auto it = children.rbegin(); it != children.rend(); ++it)
            {
                if (!*it)
                {
                    continue;
                }
                if (depth >= max_traversal_depth)
                {
                    return;
                }
                if (guard.mark(*it))
                {
                    stack.push_back(walk_frame{*it, depth});
                }
            }
            continue;
        }
        if (auto const single = current.node.as<single_unwrapper>())
        {
            if (auto child = single->unwrap())
            {
                if (depth >= max_traversal_depth)
                {
                    return;
                }
                if (guard.mark(child))
                {
                    stack.push_back(walk_frame{std::move(child), depth});
                }
            }
        }
    }
}

} // namespace detail

} // namespace xgx
