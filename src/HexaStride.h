#ifndef HEXASTRIDE_H
#define HEXASTRIDE_H

#include "body_pose.h"
#include "cancellation_token.h"
#include "command_result.h"
#include "gait_executor.h"
#include "hexastride_constants.h"
#include "hexastride_interfaces.h"
#include "kinematics_solver.h"
#include "leg_transform.h"
#include "math_utils.h"
#include "movement_controller.h"
#include "pid_controller.h"
#include "robot_config.h"
#include "robot_config_factory.h"
#include "robot_model.h"

#endif // HEXASTRIDE_H
