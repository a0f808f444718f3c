#ifndef ROBOT_CONFIG_FACTORY_H
#define ROBOT_CONFIG_FACTORY_H

#include "robot_config.h"
#include <istream>
#include <string>

/**
 * @file robot_config_factory.h
 * @brief Factory, validation and calibration helpers for RobotConfiguration.
 */

/** Configuration of the stock six-legged frame. */
RobotConfiguration createDefaultRobotConfiguration();

/** Canonical standing pose built from the neutral footprint and body height. */
BodyPose createNeutralPose(const RobotConfiguration &config);

/**
 * @brief Check a configuration before it is handed to the controller.
 * @param config Configuration to check
 * @param error Receives a description of the first problem found (optional)
 * @return true when the configuration is usable
 */
bool validateRobotConfiguration(const RobotConfiguration &config, std::string *error = nullptr);

/**
 * @brief Derive per-joint trim offsets from calibration foot positions.
 *
 * Each calibration point is the leg-local position at which the leg was
 * physically found when its servos were commanded to the reference pose.
 * The offset is the servo-frame difference between the angles solving that
 * point and the angles solving the reference point (140, 0, 0).
 *
 * @param config Source of segment lengths
 * @param calibration_points One leg-local point per leg
 * @param offsets Output offsets, written only on success
 * @param failed_leg Receives the first leg that could not be solved (optional)
 * @return false if any point is unreachable
 */
bool computeCalibrationOffsets(const RobotConfiguration &config, const BodyPose &calibration_points,
                               int offsets[NUM_LEGS][DOF_PER_LEG], int *failed_leg = nullptr);

/**
 * @brief Parse a calibration table: six lines of tab separated integers x y z.
 *
 * Blank lines are ignored and extra columns are dropped.
 * @return false if fewer than six complete rows were found
 */
bool parseCalibrationTable(std::istream &input, BodyPose &points);

#endif // ROBOT_CONFIG_FACTORY_H
