#include <xgx/error/predicates.hpp>

#include <array>

#include <xgx/error/error_value.hpp>
#include <xgx/error/traverse.hpp>

#include "visit_guard.hpp"

namespace xgx
{

namespace
{

auto classification_of_node(error const &e) -> code
{
    if (auto const c = e.as<classified>())
    {
        return c->classification();
    }
    return {};
}

auto is_kind(error const &e, error_kind kind) -> bool
{
    auto const value = e.as<error_value>();
    return value && value->kind() == kind;
}

template <typename Predicate>
auto any_node(error const &e, Predicate &&predicate) -> bool
{
    bool found = false;
    walk(e,
         [&](error const &node)
         {
             found = predicate(node);
             return !found;
         });
    return found;
}

auto primary_path_classification(error const &e) -> code
{
    detail::visit_guard guard;
    (void)guard.mark(e);

    error current = e;
    for (std::size_t depth = 0u;
         current && depth < max_traversal_depth && !guard.exhausted();
         ++depth)
    {
        if (auto c = classification_of_node(current); !c.empty())
        {
            return c;
        }

        error next;
        if (auto const multi = current.as<multi_unwrapper>())
        {
            for (auto const &child : multi->unwrap_all())
            {
                if (child)
                {
                    next = child;
                    break;
                }
            }
        }
        else if (auto const single = current.as<single_unwrapper>())
        {
            next = single->unwrap();
        }

        if (!next || !guard.mark(next))
        {
            break;
        }
        current = std::move(next);
    }
    return {};
}

} // namespace

auto has_code(error const &e, code const &c) -> bool
{
    return any_node(e,
                    [&c](error const &node)
                    {
                        auto const nc = node.as<classified>();
                        return nc && nc->classification() == c;
                    });
}

auto classification_of(error const &e, code_search search) -> code
{
    if (!e)
    {
        return {};
    }
    if (search == code_search::primary_path)
    {
        return primary_path_classification(e);
    }

    code found;
    walk(e,
         [&found](error const &node)
         {
             found = classification_of_node(node);
             return found.empty();
         });
    return found;
}

auto is_retryable(error const &e) -> bool
{
    return any_node(e,
                    [](error const &node)
                    {
                        auto const c = classification_of_node(node);
                        return c == codes::unavailable || c == codes::timeout
                               || c == codes::too_many_requests;
                    });
}

auto is_defect(error const &e) -> bool
{
    return any_node(e,
                    [](error const &node)
                    {
                        return is_kind(node, error_kind::defect)
                               || classification_of_node(node) == codes::defect;
                    });
}

auto is_interrupt(error const &e) -> bool
{
    return any_node(e,
                    [sentinels = std::array{canceled(), deadline_exceeded()}](
                            error const &node)
                    {
                        return node == sentinels[0] || node == sentinels[1]
                               || is_kind(node, error_kind::interrupt)
                               || classification_of_node(node)
                                          == codes::interrupt;
                    });
}

auto is_canceled(error const &e) -> bool
{
    return has(e, canceled());
}

auto is_deadline_exceeded(error const &e) -> bool
{
    return has(e, deadline_exceeded());
}

} // namespace xgx
