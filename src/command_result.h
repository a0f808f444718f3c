#ifndef COMMAND_RESULT_H
#define COMMAND_RESULT_H

#include <string>

/**
 * @brief Error codes reported by MovementController commands.
 */
enum ErrorCode {
    NO_ERROR = 0,
    HARDWARE_NOT_AVAILABLE = 1,   //< Servo backend missing or not initialized
    COMMAND_EXECUTION_FAILED = 2, //< Actuator write failed mid-command
    UNREACHABLE_TARGET = 3,       //< IK rejected a foot target
    PARAMETER_ERROR = 4,          //< Invalid configuration or argument
    STATE_ERROR = 5,              //< Command not allowed in the current state
    SENSOR_ERROR = 6              //< IMU missing or unreadable
};

/** Short name of an error code for log lines. */
const char *errorCodeName(ErrorCode code);

/**
 * @brief Outcome of a public command.
 *
 * Failures carry the leg and channel involved when one is known.
 */
struct CommandResult {
    bool ok = false;
    ErrorCode code = NO_ERROR;
    std::string message;
    int leg = -1;     //< Leg index, -1 when not leg specific
    int channel = -1; //< Actuator channel, -1 when not channel specific

    static CommandResult success() {
        CommandResult r;
        r.ok = true;
        return r;
    }

    static CommandResult failure(ErrorCode c, const std::string &msg, int leg = -1, int channel = -1) {
        CommandResult r;
        r.ok = false;
        r.code = c;
        r.message = msg;
        r.leg = leg;
        r.channel = channel;
        return r;
    }

    explicit operator bool() const { return ok; }
};

#endif // COMMAND_RESULT_H
