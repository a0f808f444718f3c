#include "robot_config_factory.h"
#include "kinematics_solver.h"
#include "leg_transform.h"
#include "math_utils.h"
#include <sstream>

/**
 * @file robot_config_factory.cpp
 * @brief Default hexapod frame: 33/90/110 mm segments, legs 3-5 mirrored.
 */

namespace {
const double kMountAngles[NUM_LEGS] = {54.0, 0.0, -54.0, -126.0, 180.0, 126.0};
const double kBodyOffsets[NUM_LEGS] = {94.0, 85.0, 94.0, 94.0, 85.0, 94.0};
const uint8_t kChannels[NUM_LEGS][DOF_PER_LEG] = {
    {15, 14, 13}, {12, 11, 10}, {9, 8, 31}, {22, 23, 27}, {19, 20, 21}, {16, 17, 18}};
const double kNeutralX[NUM_LEGS] = {137.1, 225.0, 137.1, -137.1, -225.0, -137.1};
const double kNeutralY[NUM_LEGS] = {189.4, 0.0, -189.4, -189.4, 0.0, 189.4};

void setError(std::string *error, const std::string &message) {
    if (error)
        *error = message;
}
} // namespace

RobotConfiguration createDefaultRobotConfiguration() {
    RobotConfiguration config;
    for (int i = 0; i < NUM_LEGS; ++i) {
        config.geometry[i].mount_angle = kMountAngles[i];
        config.geometry[i].body_offset = kBodyOffsets[i];
        for (int j = 0; j < DOF_PER_LEG; ++j) {
            config.legs[i].channels[j] = kChannels[i][j];
            config.legs[i].offsets[j] = 0;
        }
        config.legs[i].mirrored = (i >= NUM_LEGS / 2);
        config.neutral_x[i] = kNeutralX[i];
        config.neutral_y[i] = kNeutralY[i];
    }
    return config;
}

BodyPose createNeutralPose(const RobotConfiguration &config) {
    BodyPose pose;
    for (int i = 0; i < NUM_LEGS; ++i) {
        pose[i] = Point3D(config.neutral_x[i], config.neutral_y[i], config.timing.body_height);
    }
    return pose;
}

bool validateRobotConfiguration(const RobotConfiguration &config, std::string *error) {
    const SegmentLengths &s = config.segments;
    if (s.coxa <= 0.0 || s.femur <= 0.0 || s.tibia <= 0.0) {
        setError(error, "segment lengths must be positive");
        return false;
    }

    bool used[MAX_SERVO_CHANNEL + 1] = {false};
    for (int i = 0; i < NUM_LEGS; ++i) {
        for (int j = 0; j < DOF_PER_LEG; ++j) {
            uint8_t channel = config.legs[i].channels[j];
            if (channel > MAX_SERVO_CHANNEL) {
                setError(error, "leg " + std::to_string(i) + " uses channel " + std::to_string(channel) +
                                    " beyond " + std::to_string(MAX_SERVO_CHANNEL));
                return false;
            }
            if (used[channel]) {
                setError(error, "channel " + std::to_string(channel) + " assigned twice");
                return false;
            }
            used[channel] = true;

            int offset = config.legs[i].offsets[j];
            if (offset < -SERVO_ANGLE_CENTER || offset > SERVO_ANGLE_CENTER) {
                setError(error, "leg " + std::to_string(i) + " trim offset out of range");
                return false;
            }
        }
    }

    if (config.timing.frame_delay < 0.0 || config.timing.cycle_pause < 0.0) {
        setError(error, "gait timing delays must not be negative");
        return false;
    }
    if (config.timing.step_height < 0.0) {
        setError(error, "step height must not be negative");
        return false;
    }
    if (config.balance.interval <= 0.0) {
        setError(error, "balance interval must be positive");
        return false;
    }
    if (config.limits.min_speed < 1 || config.limits.min_speed > config.limits.max_speed) {
        setError(error, "invalid speed range");
        return false;
    }

    // Every leg must be able to stand
    KinematicsSolver solver(config.segments);
    BodyPose neutral = createNeutralPose(config);
    for (int i = 0; i < NUM_LEGS; ++i) {
        Point3D local = bodyToLegLocal(neutral[i], config.geometry[i], config.mount_height_correction);
        if (!solver.solveLegPoint(local).valid) {
            setError(error, "neutral foot of leg " + std::to_string(i) + " is out of reach");
            return false;
        }
    }
    return true;
}

bool computeCalibrationOffsets(const RobotConfiguration &config, const BodyPose &calibration_points,
                               int offsets[NUM_LEGS][DOF_PER_LEG], int *failed_leg) {
    KinematicsSolver solver(config.segments);
    IKSolution reference = solver.solveLegPoint(
        Point3D(CALIBRATION_REFERENCE_X, CALIBRATION_REFERENCE_Y, CALIBRATION_REFERENCE_Z));
    if (!reference.valid) {
        if (failed_leg)
            *failed_leg = -1;
        return false;
    }
    JointAngles reference_servo = KinematicsSolver::toServoFrame(reference.angles);

    int result[NUM_LEGS][DOF_PER_LEG];
    for (int i = 0; i < NUM_LEGS; ++i) {
        IKSolution cal = solver.solveLegPoint(calibration_points[i]);
        if (!cal.valid) {
            if (failed_leg)
                *failed_leg = i;
            return false;
        }
        JointAngles cal_servo = KinematicsSolver::toServoFrame(cal.angles);
        for (int j = 0; j < DOF_PER_LEG; ++j) {
            result[i][j] = math_utils::roundToInt(cal_servo[j] - reference_servo[j]);
        }
    }

    for (int i = 0; i < NUM_LEGS; ++i)
        for (int j = 0; j < DOF_PER_LEG; ++j)
            offsets[i][j] = result[i][j];
    return true;
}

bool parseCalibrationTable(std::istream &input, BodyPose &points) {
    BodyPose parsed;
    int rows = 0;
    std::string line;
    while (rows < NUM_LEGS && std::getline(input, line)) {
        std::istringstream fields(line);
        int x, y, z;
        if (!(fields >> x))
            continue; // blank or non-numeric line
        if (!(fields >> y >> z))
            return false;
        parsed[rows++] = Point3D(x, y, z);
    }
    if (rows < NUM_LEGS)
        return false;
    points = parsed;
    return true;
}
