#include "command_result.h"

const char *errorCodeName(ErrorCode code) {
    switch (code) {
    case NO_ERROR:
        return "NO_ERROR";
    case HARDWARE_NOT_AVAILABLE:
        return "HARDWARE_NOT_AVAILABLE";
    case COMMAND_EXECUTION_FAILED:
        return "COMMAND_EXECUTION_FAILED";
    case UNREACHABLE_TARGET:
        return "UNREACHABLE_TARGET";
    case PARAMETER_ERROR:
        return "PARAMETER_ERROR";
    case STATE_ERROR:
        return "STATE_ERROR";
    case SENSOR_ERROR:
        return "SENSOR_ERROR";
    }
    return "UNKNOWN_ERROR";
}
