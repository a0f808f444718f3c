#ifndef BODY_POSE_H
#define BODY_POSE_H

#include "robot_model.h"

/**
 * @file body_pose.h
 * @brief Builders for one-shot stances derived from the neutral footprint.
 *
 * Both builders start from the canonical pose every time, so repeated
 * commands do not accumulate.
 */

/**
 * @brief Shift the body relative to the feet.
 *
 * Moving the body by (x, y) moves every foot by (-x, -y) in the body frame;
 * raising the body by z lowers every foot to body_height - z.
 * @param neutral Canonical standing pose
 * @param x Forward shift (mm)
 * @param y Lateral shift (mm)
 * @param z Height shift (mm)
 */
BodyPose translatedPose(const BodyPose &neutral, double x, double y, double z);

/**
 * @brief Tilt the body about the footprint centre.
 *
 * Yaw rotates the footprint in the horizontal plane; roll and pitch use the
 * small-angle height offsets fx*sin(pitch) + fy*sin(roll).
 * @param neutral Canonical standing pose, z of leg 0 gives the body height
 * @param roll Roll in degrees
 * @param pitch Pitch in degrees
 * @param yaw Yaw in degrees
 */
BodyPose attitudePose(const BodyPose &neutral, double roll, double pitch, double yaw);

#endif // BODY_POSE_H
