#pragma once

#include <string>

#include <plog/Log.h>
#include <noscrypt.h>

namespace nrelay
{
namespace internal
{
/**
 * @brief Describes a noscrypt result code, including the position of the offending argument.
 */
std::string describeNoscryptResult(NCResult result);
} // namespace internal
} // namespace nrelay

/*
* @brief Logs a failed noscrypt result with the calling function and line.  Successful results
* are not logged.
*/
#define NC_LOG_ERROR(result) \
    do \
    { \
        if ((result) != NC_SUCCESS) \
        { \
            PLOG_ERROR << "noscrypt - " << nrelay::internal::describeNoscryptResult(result) \
                << " in " << __func__ << " at line " << __LINE__; \
        } \
    } while (0)
