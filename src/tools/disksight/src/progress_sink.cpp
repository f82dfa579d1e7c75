#include "progress_sink.hpp"

#include <utility>

namespace disksight::scan
{

std::string status::milestone(std::size_t percent)
{
    return "progress_" + std::to_string(percent) + "%";
}

FunctionProgressSink::FunctionProgressSink(std::function<void(const ProgressEvent &)> handler)
    : handler(std::move(handler))
{
}

void FunctionProgressSink::notify(const ProgressEvent &event)
{
    if (handler)
        handler(event);
}

} // namespace disksight::scan
