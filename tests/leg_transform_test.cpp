#include "../src/kinematics_solver.h"
#include "../src/leg_transform.h"
#include "../src/math_utils.h"
#include "../src/robot_config_factory.h"
#include <cassert>
#include <cmath>
#include <iostream>

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_NEAR(a, b, tolerance) assert(std::abs((a) - (b)) <= (tolerance))

int main() {
    RobotConfiguration config = createDefaultRobotConfiguration();
    BodyPose neutral = createNeutralPose(config);
    KinematicsSolver solver(config.segments);

    std::cout << "Test 1: Body to leg-local transform" << std::endl;
    {
        // Leg 1 points straight ahead with an 85 mm offset
        Point3D local = bodyToLegLocal(neutral[1], config.geometry[1], config.mount_height_correction);
        ASSERT_NEAR(local.x, 140.0, 1e-9);
        ASSERT_NEAR(local.y, 0.0, 1e-9);
        ASSERT_NEAR(local.z, -114.0, 1e-9);

        Point3D local0 = bodyToLegLocal(neutral[0], config.geometry[0], config.mount_height_correction);
        ASSERT_NEAR(local0.x, 139.813, 1e-3);
        ASSERT_NEAR(local0.y, 0.410, 1e-3);

        for (int i = 0; i < NUM_LEGS; ++i) {
            Point3D l = bodyToLegLocal(neutral[i], config.geometry[i], config.mount_height_correction);
            Point3D back = legLocalToBody(l, config.geometry[i], config.mount_height_correction);
            ASSERT_NEAR(math_utils::distance3D(back, neutral[i]), 0.0, 1e-9);
        }
    }

    std::cout << "Test 2: Trim, mirror, clamp" << std::endl;
    {
        ASSERT_EQ(calibrateJointAngle(87, 0, false), 87);
        ASSERT_EQ(calibrateJointAngle(87, 0, true), 93);
        ASSERT_EQ(calibrateJointAngle(87, 4, false), 91);
        // Trim is applied before the reflection
        ASSERT_EQ(calibrateJointAngle(87, 4, true), 89);
        ASSERT_EQ(calibrateJointAngle(178, 5, false), 180);
        ASSERT_EQ(calibrateJointAngle(-3, 0, false), 0);
        ASSERT_EQ(calibrateJointAngle(-3, 0, true), 180);
        ASSERT_EQ(calibrateJointAngle(190, 0, true), 0);
        for (int a = -20; a <= 200; a += 7) {
            for (int o = -10; o <= 10; o += 5) {
                int expected = std::max(0, std::min(180, 180 - (a + o)));
                ASSERT_EQ(calibrateJointAngle(a, o, true), expected);
                ASSERT_EQ(calibrateJointAngle(a, o, false), std::max(0, std::min(180, a + o)));
            }
        }
    }

    std::cout << "Test 3: Neutral stance servo angles" << std::endl;
    {
        for (int i = 0; i < NUM_LEGS; ++i) {
            Point3D local = bodyToLegLocal(neutral[i], config.geometry[i], config.mount_height_correction);
            IKSolution s = solver.solveLegPoint(local);
            assert(s.valid);
            ServoAngles out = toServoAngles(s.angles, config.legs[i]);
            if (config.legs[i].mirrored) {
                ASSERT_EQ(out.coxa, 90);
                ASSERT_EQ(out.femur, 93);
                ASSERT_EQ(out.tibia, 102);
            } else {
                ASSERT_EQ(out.coxa, 90);
                ASSERT_EQ(out.femur, 87);
                ASSERT_EQ(out.tibia, 78);
            }
        }
    }

    std::cout << "leg_transform_test executed successfully" << std::endl;
    return 0;
}
