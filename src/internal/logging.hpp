#pragma once

#include <plog/Init.h>
#include <plog/Log.h>

namespace nrelay
{
namespace internal
{
/**
 * @brief Initializes the default plog logger with the given appender, unless it already exists.
 * @remark Every component receives the same injected appender.  plog registers an appender each
 * time `plog::init` runs on an existing logger, so only the first call may initialize it.
 */
inline void initLogging(plog::IAppender* appender, plog::Severity severity = plog::debug)
{
    if (plog::get() != nullptr)
    {
        return;
    }

    plog::init(severity, appender);
};
} // namespace internal
} // namespace nrelay
