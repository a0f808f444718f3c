#include "../src/robot_config_factory.h"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#define ASSERT_TRUE(condition) assert(condition)
#define ASSERT_EQ(a, b) assert((a) == (b))

int main() {
    RobotConfiguration config = createDefaultRobotConfiguration();

    std::cout << "Test 1: Defaults" << std::endl;
    {
        std::string error;
        ASSERT_TRUE(validateRobotConfiguration(config, &error));
        ASSERT_TRUE(error.empty());
        ASSERT_EQ(config.legs[2].channels[0], 9);
        ASSERT_EQ(config.legs[2].channels[2], 31);
        ASSERT_EQ(config.legs[3].channels[2], 27);
        for (int i = 0; i < NUM_LEGS; ++i) {
            ASSERT_EQ(config.legs[i].mirrored, i >= 3);
        }
        ASSERT_EQ(config.geometry[4].mount_angle, 180.0);
        ASSERT_EQ(config.geometry[1].body_offset, 85.0);
        ASSERT_EQ(config.timing.step_height, 70.0);

        BodyPose neutral = createNeutralPose(config);
        ASSERT_EQ(neutral[1], Point3D(225.0, 0.0, -100.0));
        ASSERT_EQ(neutral[5], Point3D(-137.1, 189.4, -100.0));
    }

    std::cout << "Test 2: Validation failures" << std::endl;
    {
        std::string error;
        RobotConfiguration dup = config;
        dup.legs[1].channels[0] = dup.legs[0].channels[0];
        ASSERT_TRUE(!validateRobotConfiguration(dup, &error));
        ASSERT_TRUE(error.find("assigned twice") != std::string::npos);

        RobotConfiguration wide = config;
        wide.legs[0].channels[1] = 40;
        ASSERT_TRUE(!validateRobotConfiguration(wide, &error));

        RobotConfiguration far = config;
        far.neutral_x[1] = 600.0;
        ASSERT_TRUE(!validateRobotConfiguration(far, &error));
        ASSERT_TRUE(error.find("leg 1") != std::string::npos);

        RobotConfiguration bad_timing = config;
        bad_timing.timing.frame_delay = -1.0;
        ASSERT_TRUE(!validateRobotConfiguration(bad_timing));

        RobotConfiguration bad_speed = config;
        bad_speed.limits.min_speed = 11;
        ASSERT_TRUE(!validateRobotConfiguration(bad_speed));
    }

    std::cout << "Test 3: Calibration offsets" << std::endl;
    {
        BodyPose points;
        for (int i = 0; i < NUM_LEGS; ++i)
            points[i] = Point3D(140, 0, 0);

        int offsets[NUM_LEGS][DOF_PER_LEG];
        ASSERT_TRUE(computeCalibrationOffsets(config, points, offsets));
        for (int i = 0; i < NUM_LEGS; ++i)
            for (int j = 0; j < DOF_PER_LEG; ++j)
                ASSERT_EQ(offsets[i][j], 0);

        // Leg 0 sat at (140, 10, 5) when commanded to the reference pose
        points[0] = Point3D(140, 10, 5);
        ASSERT_TRUE(computeCalibrationOffsets(config, points, offsets));
        ASSERT_EQ(offsets[0][0], -4);
        ASSERT_EQ(offsets[0][1], 3);
        ASSERT_EQ(offsets[0][2], 0);
        ASSERT_EQ(offsets[1][1], 0);

        int failed = -2;
        points[4] = Point3D(400, 0, 0);
        offsets[0][0] = 99;
        ASSERT_TRUE(!computeCalibrationOffsets(config, points, offsets, &failed));
        ASSERT_EQ(failed, 4);
        // Output untouched on failure
        ASSERT_EQ(offsets[0][0], 99);
    }

    std::cout << "Test 4: Calibration table parsing" << std::endl;
    {
        std::istringstream table("140\t0\t0\n\n141\t2\t-3\n140\t0\t0\t9\n140\t0\t0\n140\t0\t0\n139\t1\t1\n");
        BodyPose points;
        ASSERT_TRUE(parseCalibrationTable(table, points));
        ASSERT_EQ(points[1], Point3D(141, 2, -3));
        ASSERT_EQ(points[5], Point3D(139, 1, 1));

        std::istringstream short_table("140\t0\t0\n140\t0\t0\n");
        ASSERT_TRUE(!parseCalibrationTable(short_table, points));

        std::istringstream broken("140\t0\n140\t0\t0\n140\t0\t0\n140\t0\t0\n140\t0\t0\n140\t0\t0\n");
        ASSERT_TRUE(!parseCalibrationTable(broken, points));
    }

    std::cout << "robot_config_test executed successfully" << std::endl;
    return 0;
}
