#pragma once

#include <stdexcept>
#include <string>

namespace common::detail
{

[[noreturn]] inline void enforceFail(const char* expr, const char* file, int line, const char* message)
{
    throw std::logic_error(std::string("invariant violated: ") + message + " [" + expr + "] at " + file + ':'
                           + std::to_string(line));
}

} // namespace common::detail

// Internal invariant check, active in every build. Throws std::logic_error so a worker thread
// reports it through its error signal instead of taking the process down.
#define AXISBEND_ENFORCE(expr, message)                                                            \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
        {                                                                                          \
            ::common::detail::enforceFail(#expr, __FILE__, __LINE__, (message));                   \
        }                                                                                          \
    } while (false)
