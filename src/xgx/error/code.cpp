#include <xgx/error/code.hpp>

#include <array>
#include <new>
#include <unordered_set>

namespace xgx
{

namespace
{

constexpr std::array<std::string_view, 13> builtins{
        codes::bad_request,   codes::unauthorized,
        codes::forbidden,     codes::not_found,
        codes::conflict,      codes::invalid,
        codes::unprocessable, codes::too_many_requests,
        codes::timeout,       codes::unavailable,
        codes::internal,      codes::defect,
        codes::interrupt,
};

auto builtin_set() -> std::unordered_set<std::string_view> const &
{
    static std::unordered_set<std::string_view> const set(builtins.begin(),
                                                          builtins.end());
    return set;
}

} // namespace

auto builtin_codes() -> std::vector<code>
{
    return std::vector<code>(builtins.begin(), builtins.end());
}

auto is_builtin(std::string_view value) noexcept -> bool
{
    // the set is constructed on first use, the first call may allocate
    try
    {
        return builtin_set().contains(value);
    }
    catch (std::bad_alloc const &)
    {
        for (auto builtin : builtins)
        {
            if (builtin == value)
            {
                return true;
            }
        }
        return false;
    }
}

} // namespace xgx
