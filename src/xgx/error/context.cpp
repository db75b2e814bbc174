#include <xgx/error/context.hpp>

#include <algorithm>
#include <iterator>

namespace xgx
{

context::context(std::vector<field> fields)
    : mFields()
{
    if (!fields.empty())
    {
        mFields = std::make_shared<std::vector<field>>(std::move(fields));
    }
}

auto context::append(std::span<field const> more) const -> context
{
    if (more.empty())
    {
        return *this;
    }

    auto const current = fields();
    std::vector<field> merged;
    merged.reserve(current.size() + more.size());
    merged.insert(merged.end(), current.begin(), current.end());
    merged.insert(merged.end(), more.begin(), more.end());

    return context{std::move(merged)};
}

auto context::append(field f) const -> context
{
    auto const current = fields();
    std::vector<field> merged;
    merged.reserve(current.size() + 1u);
    merged.insert(merged.end(), current.begin(), current.end());
    merged.push_back(std::move(f));

    return context{std::move(merged)};
}

auto context::keep_newest(std::size_t maxFields) const -> context
{
    auto const current = fields();
    if (maxFields == 0u || current.size() <= maxFields)
    {
        return *this;
    }

    auto const newest = current.last(maxFields);
    return context{std::vector<field>(newest.begin(), newest.end())};
}

auto context::snapshot() const -> snapshot_type
{
    snapshot_type projection;
    for (auto const &f : fields())
    {
        if (f.key.empty())
        {
            continue;
        }
        projection.insert_or_assign(f.key, f.value);
    }
    return projection;
}

auto context::find(std::string_view key) const noexcept -> field_value const *
{
    if (key.empty())
    {
        return nullptr;
    }

    auto const current = fields();
    auto const it = std::find_if(current.rbegin(), current.rend(),
                                 [key](field const &f)
                                 { return f.key == key; });

    return it != current.rend() ? &it->value : nullptr;
}

} // namespace xgx
