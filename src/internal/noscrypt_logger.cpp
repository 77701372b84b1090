#include <sstream>

#include "noscrypt_logger.hpp"

using namespace std;

namespace nrelay
{
namespace internal
{
string describeNoscryptResult(NCResult result)
{
    if (result == NC_SUCCESS)
    {
        return "success";
    }

    uint8_t argPosition = 0;
    stringstream ss;
    switch (NCParseErrorCode(result, &argPosition))
    {
    case E_NULL_PTR:
        ss << "null pointer";
        break;

    case E_INVALID_ARG:
        ss << "invalid argument";
        break;

    case E_INVALID_CONTEXT:
        ss << "invalid context";
        break;

    case E_ARGUMENT_OUT_OF_RANGE:
        ss << "argument out of range";
        break;

    case E_OPERATION_FAILED:
        ss << "operation failed";
        break;

    default:
        ss << "unknown error " << result;
        break;
    }
    ss << " (argument " << static_cast<int>(argPosition) << ")";

    return ss.str();
};
} // namespace internal
} // namespace nrelay
