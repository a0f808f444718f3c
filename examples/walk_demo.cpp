#include "mock_interfaces.h"
#include <chrono>
#include <iostream>
#include <thread>

/**
 * @file walk_demo.cpp
 * @brief Walk forward, turn, shift the body and balance using in-memory hardware.
 */

static void printLeg(ExampleServo &servo, const RobotConfiguration &config, int leg) {
    const uint8_t *ch = config.legs[leg].channels;
    std::cout << "  leg " << leg << ": coxa=" << servo.angle(ch[0]) << " femur=" << servo.angle(ch[1])
              << " tibia=" << servo.angle(ch[2]) << std::endl;
}

static void printStatus(MovementController &controller, ExampleServo &servo) {
    MovementController::MovementStatus status = controller.getStatus();
    std::cout << "Status: moving=" << status.moving << " balancing=" << status.balancing
              << " gait=" << gaitTypeName(status.parameters.gait) << " cycles=" << status.cycles_completed
              << " frames=" << status.frames_emitted << " writes=" << servo.writes() << std::endl;
    for (int leg = 0; leg < NUM_LEGS; ++leg) {
        printLeg(servo, controller.getConfiguration(), leg);
    }
}

static bool check(const CommandResult &result, const char *what) {
    if (!result.ok) {
        std::cerr << what << " failed: " << errorCodeName(result.code) << " " << result.message << std::endl;
    }
    return result.ok;
}

int main() {
    ExampleServo servo;
    ExampleIMU imu;
    RobotConfiguration config = createDefaultRobotConfiguration();

    MovementController controller(&servo, &imu, config);
    if (!check(controller.initialize(), "initialize"))
        return 1;
    printStatus(controller, servo);

    check(controller.move(MovementController::MOVE_FORWARD), "move forward");
    std::this_thread::sleep_for(std::chrono::seconds(2));
    check(controller.move(MovementController::MOVE_TURN_LEFT, 0, 0, 8, 0, WAVE_GAIT), "turn left");
    std::this_thread::sleep_for(std::chrono::seconds(2));
    check(controller.stop(), "stop");
    printStatus(controller, servo);

    check(controller.setPosition(20, 0, 10), "set position");
    check(controller.setAttitude(0, 8, 0), "set attitude");
    printStatus(controller, servo);

    check(controller.setBalanceMode(true), "enable balance");
    std::this_thread::sleep_for(std::chrono::seconds(1));
    check(controller.setBalanceMode(false), "disable balance");

    // Walk backward for one second, then the controller stands on its own
    check(controller.move(MovementController::MOVE_BACKWARD, 0, 0, 10, 0, TRIPOD_GAIT, 1.0), "timed walk");
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    printStatus(controller, servo);

    controller.cleanup();
    return 0;
}
