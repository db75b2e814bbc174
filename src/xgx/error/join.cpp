#include <xgx/error/join.hpp>

#include <algorithm>
#include <iterator>

#include "error_values.hpp"

namespace xgx
{

joined_error::joined_error(std::vector<error> children) noexcept
    : error_node()
    , multi_unwrapper()
    , mChildren(std::move(children))
{
}

auto joined_error::message() const -> std::string
{
    std::string joined;
    for (auto const &child : mChildren)
    {
        if (!joined.empty())
        {
            joined += '\n';
        }
        joined += child.message();
    }
    return joined;
}

void joined_error::format_verbose(format_buffer &out) const
{
    bool first = true;
    for (auto const &child : mChildren)
    {
        if (!first)
        {
            out.push_back('\n');
        }
        first = false;
        detail::format_verbose(out, child);
    }
}

auto join(std::span<error const> errs) -> error
{
    std::vector<error> children;
    children.reserve(errs.size());
    std::copy_if(errs.begin(), errs.end(), std::back_inserter(children),
                 [](error const &e) { return static_cast<bool>(e); });

    switch (children.size())
    {
    case 0:
        return {};
    case 1:
        return std::move(children.front());
    default:
        return make_node<joined_error>(std::move(children));
    }
}

auto append(error head, std::span<error const> more) -> error
{
    if (!head)
    {
        return join(more);
    }
    if (std::none_of(more.begin(), more.end(),
                     [](error const &e) { return static_cast<bool>(e); }))
    {
        return head;
    }

    std::vector<error> all;
    all.reserve(more.size() + 1u);
    all.push_back(std::move(head));
    all.insert(all.end(), more.begin(), more.end());
    return join(all);
}

} // namespace xgx
