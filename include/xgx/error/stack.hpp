#pragma once

#include <cstddef>
#include <cstdint>

#include <memory>
#include <span>
#include <string>
#include <vector>

#include <xgx/error/fwd.hpp>

namespace xgx
{

struct stack_frame
{
    std::uintptr_t pc;
    std::string file;
    std::size_t line;
    std::string function;
};

/**
 * An immutable sequence of call frames, most recent call first.
 *
 * Copies share the frame storage. The default constructed trace is empty
 * and owns no allocation.
 */
class stack_trace final
{
public:
    using iterator = std::span<stack_frame const>::iterator;

    stack_trace() noexcept = default;
    explicit stack_trace(std::vector<stack_frame> frames);

    /**
     * Records the frames of the calling thread.
     *
     * \param skip the number of frames to omit above the caller of capture()
     * \param maxDepth the maximum number of recorded frames
     */
    static auto capture(std::size_t skip = 0,
                        std::size_t maxDepth = default_stack_depth)
            -> stack_trace;

    [[nodiscard]] auto frames() const noexcept -> std::span<stack_frame const>
    {
        if (!mFrames)
        {
            return {};
        }
        return {mFrames->data(), mFrames->size()};
    }
    [[nodiscard]] auto begin() const noexcept -> iterator
    {
        return frames().begin();
    }
    [[nodiscard]] auto end() const noexcept -> iterator
    {
        return frames().end();
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mFrames ? mFrames->size() : 0u;
    }
    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return size() == 0u;
    }

private:
    std::shared_ptr<std::vector<stack_frame> const> mFrames;
};

} // namespace xgx
