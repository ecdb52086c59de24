#include "glove_errors.hpp"

const char* errorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ERR_NONE: return "none";
    case ERR_INVALID_CONFIGURATION: return "invalid configuration";
    case ERR_MALFORMED_CALIBRATION: return "malformed calibration file";
    case ERR_IO_FAILURE: return "io failure";
    case ERR_NO_PORT_AVAILABLE: return "no port available";
    case ERR_SYNC_TIMEOUT: return "sync timeout";
    case ERR_CANCELLED: return "cancelled";
    }
    return "unknown";
}
