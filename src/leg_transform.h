#ifndef LEG_TRANSFORM_H
#define LEG_TRANSFORM_H

#include "robot_config.h"

/**
 * @file leg_transform.h
 * @brief Body-frame to leg-local transform and servo calibration.
 */

/**
 * @brief Express a body-frame foot point in the frame of one leg.
 *
 * Rotates by the negative mounting angle, subtracts the radial body offset
 * and subtracts the mounting height correction.
 */
Point3D bodyToLegLocal(const Point3D &body_point, const LegGeometry &geometry, double height_correction);

/** Inverse of bodyToLegLocal(). */
Point3D legLocalToBody(const Point3D &leg_point, const LegGeometry &geometry, double height_correction);

/**
 * @brief Apply trim, mirroring and clamping to one servo-frame angle.
 *
 * Trim is added first; mirrored legs then reflect the result as 180 - angle.
 * The final value is clamped to [0, 180].
 */
int calibrateJointAngle(double servo_angle, int offset, bool mirrored);

/**
 * @brief Convert a raw IK solution into the three angles sent to the actuators.
 * @param raw Solver angles for the leg
 * @param leg Trim and mirroring of the leg
 */
ServoAngles toServoAngles(const JointAngles &raw, const LegConfig &leg);

#endif // LEG_TRANSFORM_H
