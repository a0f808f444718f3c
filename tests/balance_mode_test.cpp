#include "../src/movement_controller.h"
#include "test_stubs.h"
#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <thread>

#define ASSERT_TRUE(condition) assert(condition)
#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_LT(a, b) assert((a) < (b))
#define ASSERT_GT(a, b) assert((a) > (b))

static bool waitFor(const std::function<bool()> &predicate, double timeout_s = 5.0) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(timeout_s);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

int main() {
    const RobotConfiguration config = createTestConfiguration();

    std::cout << "Test 1: Balance requires an IMU" << std::endl;
    {
        RecordingServo servo;
        MovementController controller(&servo, nullptr, config);
        ASSERT_TRUE(controller.initialize().ok);
        CommandResult r = controller.setBalanceMode(true);
        ASSERT_EQ(r.code, SENSOR_ERROR);
        ASSERT_TRUE(!controller.isBalancing());

        StaticIMU imu;
        imu.available = false;
        MovementController offline(&servo, &imu, config);
        ASSERT_TRUE(offline.initialize().ok);
        ASSERT_EQ(offline.setBalanceMode(true).code, SENSOR_ERROR);

        // Disabling when not enabled is a no-op
        ASSERT_TRUE(controller.setBalanceMode(false).ok);
    }

    std::cout << "Test 2: Level robot stays level" << std::endl;
    {
        RecordingServo servo;
        StaticIMU imu;
        MovementController controller(&servo, &imu, config);
        ASSERT_TRUE(controller.initialize().ok);

        ASSERT_TRUE(controller.setBalanceMode(true).ok);
        ASSERT_TRUE(controller.isBalancing());
        ASSERT_TRUE(waitFor([&] { return imu.reads.load() >= 5; }));

        BodyPose pose = controller.getStatus().current_pose;
        for (int i = 0; i < NUM_LEGS; ++i) {
            ASSERT_LT(std::fabs(pose[i].z - config.timing.body_height), 1e-6);
        }

        // Enabling twice keeps the running loop
        ASSERT_TRUE(controller.setBalanceMode(true).ok);
        ASSERT_TRUE(controller.isBalancing());
    }

    std::cout << "Test 3: Tilt produces a corrective attitude" << std::endl;
    {
        RecordingServo servo;
        StaticIMU imu;
        // About 15 degrees of roll
        imu.setAcceleration(0.0, 0.2588, 0.9659);
        MovementController controller(&servo, &imu, config);
        ASSERT_TRUE(controller.initialize().ok);
        ASSERT_TRUE(controller.setBalanceMode(true).ok);

        // Negative roll correction lowers the left front foot
        ASSERT_TRUE(waitFor([&] { return controller.getStatus().current_pose[0].z < config.timing.body_height - 1.0; }));
        ASSERT_TRUE(waitFor([&] { return controller.getStatus().current_pose[2].z > config.timing.body_height + 1.0; }));

        // Balance mode owns the attitude
        ASSERT_EQ(controller.setAttitude(5, 0, 0).code, STATE_ERROR);

        // Disabling stops the loop and returns to the neutral stance
        ASSERT_TRUE(controller.setBalanceMode(false).ok);
        ASSERT_TRUE(!controller.isBalancing());
        int reads = imu.reads.load();
        size_t commands = servo.commandCount();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ASSERT_EQ(imu.reads.load(), reads);
        ASSERT_EQ(servo.commandCount(), commands);

        BodyPose pose = controller.getStatus().current_pose;
        for (int i = 0; i < NUM_LEGS; ++i) {
            ASSERT_TRUE(pose[i] == controller.getNeutralPose()[i]);
        }
        ASSERT_TRUE(controller.setAttitude(5, 0, 0).ok);
    }

    std::cout << "Test 4: Invalid samples are skipped" << std::endl;
    {
        RecordingServo servo;
        StaticIMU imu;
        imu.setAcceleration(0.0, 0.5, 0.5, false);
        MovementController controller(&servo, &imu, config);
        ASSERT_TRUE(controller.initialize().ok);
        size_t commands = servo.commandCount();

        ASSERT_TRUE(controller.setBalanceMode(true).ok);
        ASSERT_TRUE(waitFor([&] { return imu.reads.load() >= 5; }));
        ASSERT_EQ(servo.commandCount(), commands);
        ASSERT_TRUE(controller.setBalanceMode(false).ok);
    }

    std::cout << "Test 5: Walking keeps the actuators" << std::endl;
    {
        RecordingServo servo;
        StaticIMU imu;
        imu.setAcceleration(0.0, 0.2588, 0.9659);
        MovementController controller(&servo, &imu, config);
        ASSERT_TRUE(controller.initialize().ok);
        ASSERT_TRUE(controller.setBalanceMode(true).ok);
        ASSERT_TRUE(controller.move(MovementController::MOVE_FORWARD).ok);
        ASSERT_TRUE(waitFor([&] { return controller.getStatus().cycles_completed >= 1; }));
        ASSERT_TRUE(controller.isBalancing());
        ASSERT_TRUE(controller.stop().ok);

        // Cleanup tears down both loops
        controller.cleanup();
        ASSERT_TRUE(!controller.isBalancing());
        ASSERT_TRUE(!controller.isMoving());
        ASSERT_GT(imu.reads.load(), 0);
    }

    std::cout << "Test 6: First correction after enabling is proportional" << std::endl;
    {
        RobotConfiguration slow = config;
        slow.balance.interval = 0.5;
        RecordingServo servo;
        StaticIMU imu;
        // About 5 degrees of roll
        imu.setAcceleration(0.0, 0.08716, 0.99619);
        MovementController controller(&servo, &imu, slow);
        ASSERT_TRUE(controller.initialize().ok);
        ASSERT_TRUE(controller.setBalanceMode(true).ok);

        // kp * 5 deg = 2.5 deg of correction: 189.4 * sin(2.5 deg) = 8.26 mm below neutral
        ASSERT_TRUE(waitFor([&] { return controller.getStatus().current_pose[0].z < slow.timing.body_height - 1.0; }));
        double z = controller.getStatus().current_pose[0].z;
        ASSERT_LT(std::fabs(z - (slow.timing.body_height - 8.26)), 0.5);
        ASSERT_TRUE(controller.setBalanceMode(false).ok);
    }

    std::cout << "balance_mode_test executed successfully" << std::endl;
    return 0;
}
