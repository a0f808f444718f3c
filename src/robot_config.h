#ifndef ROBOT_CONFIG_H
#define ROBOT_CONFIG_H

#include "robot_model.h"
#include <cstdint>

/**
 * @file robot_config.h
 * @brief Static robot description consumed by MovementController.
 *
 * Supplied once at construction. Only the per-joint trim offsets change
 * afterwards, through MovementController::recalibrate().
 */

/**
 * @brief Mounting of one leg on the body.
 */
struct LegGeometry {
    double mount_angle = 0.0; //< Rotation of the leg base about the body vertical axis (deg)
    double body_offset = 0.0; //< Radial distance from body centre to the coxa joint (mm)
};

/**
 * @brief Actuator wiring and trim of one leg.
 */
struct LegConfig {
    uint8_t channels[DOF_PER_LEG] = {0, 0, 0}; //< Coxa, femur, tibia actuator channels
    int offsets[DOF_PER_LEG] = {0, 0, 0};      //< Mechanical trim per joint (deg, servo frame)
    bool mirrored = false;                     //< Servos mounted reflected on this side
};

/**
 * @brief Gait timing and stance height.
 */
struct GaitTiming {
    double step_height = DEFAULT_STEP_HEIGHT; //< Swing lift (mm)
    double body_height = DEFAULT_BODY_HEIGHT; //< Neutral foot z in body frame (mm)
    double frame_delay = DEFAULT_FRAME_DELAY; //< Pause after each emitted frame (s)
    double cycle_pause = DEFAULT_CYCLE_PAUSE; //< Pause between supervisor cycles (s)
    double attitude_settle = DEFAULT_ATTITUDE_SETTLE; //< Hold after a commanded attitude (s)
};

/**
 * @brief Balance loop gains and rate.
 */
struct BalanceConfig {
    double kp = BALANCE_KP;
    double ki = BALANCE_KI;
    double kd = BALANCE_KD;
    double interval = BALANCE_INTERVAL; //< Loop period (s)
};

/**
 * @brief Safe ranges applied to incoming commands.
 */
struct MotionLimits {
    double step_limit = STEP_LIMIT_MM;
    double turn_limit = TURN_LIMIT_DEG;
    int min_speed = GAIT_SPEED_MIN;
    int max_speed = GAIT_SPEED_MAX;
    double body_shift_xy = BODY_SHIFT_XY_LIMIT_MM;
    double body_shift_z = BODY_SHIFT_Z_LIMIT_MM;
    double attitude_limit = ATTITUDE_LIMIT_DEG;
};

/**
 * @brief Complete static configuration of the robot.
 */
struct RobotConfiguration {
    SegmentLengths segments;
    double mount_height_correction = DEFAULT_MOUNT_HEIGHT_CORRECTION; //< Subtracted from z before IK (mm)

    LegGeometry geometry[NUM_LEGS];
    LegConfig legs[NUM_LEGS];

    // Neutral footprint in the body frame; z is taken from timing.body_height
    double neutral_x[NUM_LEGS] = {0, 0, 0, 0, 0, 0};
    double neutral_y[NUM_LEGS] = {0, 0, 0, 0, 0, 0};

    GaitTiming timing;
    BalanceConfig balance;
    MotionLimits limits;

    bool verbose_logging = false; //< Per-cycle and per-frame console output
};

#endif // ROBOT_CONFIG_H
