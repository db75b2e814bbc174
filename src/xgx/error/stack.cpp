#include <xgx/error/stack.hpp>

#include <boost/config.hpp>
#include <boost/stacktrace.hpp>

namespace xgx
{

stack_trace::stack_trace(std::vector<stack_frame> frames)
    : mFrames()
{
    if (!frames.empty())
    {
        mFrames = std::make_shared<std::vector<stack_frame>>(std::move(frames));
    }
}

BOOST_NOINLINE auto stack_trace::capture(std::size_t skip,
                                         std::size_t maxDepth) -> stack_trace
{
    if (maxDepth == 0u)
    {
        return {};
    }

    // +1 hides this function
    boost::stacktrace::stacktrace const trace(skip + 1u, maxDepth);

    std::vector<stack_frame> frames;
    frames.reserve(trace.size());
    for (auto const &frame : trace)
    {
        if (frame.empty())
        {
            continue;
        }
        frames.push_back(stack_frame{
                .pc = reinterpret_cast<std::uintptr_t>(frame.address()),
                .file = frame.source_file(),
                .line = frame.source_line(),
                .function = frame.name(),
        });
    }
    return stack_trace{std::move(frames)};
}

} // namespace xgx
