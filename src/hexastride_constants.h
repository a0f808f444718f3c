#ifndef HEXASTRIDE_CONSTANTS_H
#define HEXASTRIDE_CONSTANTS_H

/**
 * @file hexastride_constants.h
 * @brief Global constants for the HexaStride locomotion core
 *
 * Robot geometry defaults, gait timing, motion limits and balance gains
 * shared by the configuration factory, the gait executor and the
 * movement controller.
 */

#include <cmath>

#define NUM_LEGS 6
// Degrees of freedom per leg and total DOF
#define DOF_PER_LEG 3
#define TOTAL_DOF (NUM_LEGS * DOF_PER_LEG)

// Highest actuator channel addressable by the servo backend
#define MAX_SERVO_CHANNEL 31

// ========================================================================
// ANGULAR CONVERSION CONSTANTS
// ========================================================================

#define DEGREES_TO_RADIANS_FACTOR (M_PI / 180.0)
#define RADIANS_TO_DEGREES_FACTOR (180.0 / M_PI)

// Servo horn range in degrees
#define SERVO_ANGLE_MIN 0
#define SERVO_ANGLE_MAX 180
#define SERVO_ANGLE_CENTER 90

// ========================================================================
// LEG GEOMETRY DEFAULTS (mm)
// ========================================================================

#define DEFAULT_COXA_LENGTH 33.0
#define DEFAULT_FEMUR_LENGTH 90.0
#define DEFAULT_TIBIA_LENGTH 110.0

// Vertical correction between the body plane and the coxa joint
#define DEFAULT_MOUNT_HEIGHT_CORRECTION 14.0

// Leg-local point used as the calibration reference pose
#define CALIBRATION_REFERENCE_X 140.0
#define CALIBRATION_REFERENCE_Y 0.0
#define CALIBRATION_REFERENCE_Z 0.0

// ========================================================================
// GAIT TIMING DEFAULTS
// ========================================================================

#define DEFAULT_STEP_HEIGHT 70.0   // Foot lift during swing (mm)
#define DEFAULT_BODY_HEIGHT -100.0 // Neutral foot z in body frame (mm)
#define DEFAULT_FRAME_DELAY 0.005  // Pause between emitted frames (s)
#define DEFAULT_CYCLE_PAUSE 0.05   // Pause between supervisor cycles (s)
#define DEFAULT_ATTITUDE_SETTLE 0.3 // Hold after setAttitude() before returning (s)

// Frame count interpolation endpoints, indexed by speed 2..10
#define TRIPOD_FRAMES_AT_MIN_SPEED 126
#define TRIPOD_FRAMES_AT_MAX_SPEED 22
#define WAVE_FRAMES_AT_MIN_SPEED 171
#define WAVE_FRAMES_AT_MAX_SPEED 45

// ========================================================================
// MOTION LIMITS
// ========================================================================

#define GAIT_SPEED_MIN 2
#define GAIT_SPEED_MAX 10
#define GAIT_SPEED_DEFAULT 5

#define STEP_LIMIT_MM 35.0          // Per-cycle x/y translation
#define TURN_LIMIT_DEG 15.0         // Per-cycle rotation
#define MODE_STEP_MM 25.0           // Translation used by named modes
#define MODE_TURN_DEG 15.0          // Rotation used by named turn modes
#define BODY_SHIFT_XY_LIMIT_MM 40.0 // setPosition x/y clamp
#define BODY_SHIFT_Z_LIMIT_MM 20.0  // setPosition z clamp
#define ATTITUDE_LIMIT_DEG 15.0     // setAttitude clamp per axis

// ========================================================================
// BALANCE LOOP DEFAULTS
// ========================================================================

#define BALANCE_KP 0.5
#define BALANCE_KI 0.01
#define BALANCE_KD 0.1
#define BALANCE_INTERVAL 0.02 // 50 Hz

// Smallest dt accepted by the PID when the clock did not advance (s)
#define PID_MIN_DT 0.001

#endif // HEXASTRIDE_CONSTANTS_H
