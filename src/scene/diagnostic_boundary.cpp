#include "diagnostic_boundary.hpp"

#include <exception>
#include <sheetscape/logger.hpp>

namespace sheetscape
{

bool DiagnosticBoundary::run(const std::function<void()>& fn)
{
    if (has_error_)
        return false;

    try
    {
        fn();
        return true;
    }
    catch (const std::exception& e)
    {
        has_error_ = true;
        message_   = e.what();
        SHEETSCAPE_LOG_ERROR("boundary", "frame aborted: {}", message_);
    }
    return false;
}

void DiagnosticBoundary::reset()
{
    has_error_ = false;
    message_.clear();
}

}   // namespace sheetscape
