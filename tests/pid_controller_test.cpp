#include "../src/pid_controller.h"
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

#define ASSERT_NEAR(a, b, tolerance) assert(std::abs((a) - (b)) <= (tolerance))

int main() {
    PIDController pid(0.5, 0.01, 0.1);

    // First step: e = -10, integral = -1, no derivative without a previous error
    double out = pid.update(10.0, 0.1);
    ASSERT_NEAR(out, -5.01, 1e-9);
    ASSERT_NEAR(pid.getIntegral(), -1.0, 1e-12);
    ASSERT_NEAR(pid.getPreviousError(), -10.0, 1e-12);

    // Constant error: derivative vanishes, integral keeps growing
    out = pid.update(10.0, 0.1);
    ASSERT_NEAR(out, -5.02, 1e-9);

    // Non-positive dt is floored to 1 ms
    pid.reset();
    out = pid.update(1.0, 0.0);
    ASSERT_NEAR(pid.getIntegral(), -0.001, 1e-12);
    ASSERT_NEAR(out, -0.5 - 0.00001, 1e-9);

    // Derivative applies from the second step after a reset
    out = pid.update(3.0, 0.1);
    ASSERT_NEAR(pid.getIntegral(), -0.301, 1e-12);
    ASSERT_NEAR(out, -1.5 - 0.00301 - 2.0, 1e-9);

    pid.reset();
    assert(pid.getIntegral() == 0.0);
    assert(pid.getPreviousError() == 0.0);
    assert(pid.getTarget() == 0.0);

    // Proportional only: output is -kp * measurement
    PIDController p_only(2.0, 0.0, 0.0);
    ASSERT_NEAR(p_only.update(3.0, 0.02), -6.0, 1e-12);

    // Wall clock variant measures a positive dt
    PIDController timed(0.0, 1.0, 0.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    out = timed.update(-1.0);
    assert(out > 0.0);
    assert(timed.getIntegral() >= 0.015);

    pid.setGains(1.0, 0.0, 0.0);
    assert(pid.getKp() == 1.0 && pid.getKi() == 0.0 && pid.getKd() == 0.0);

    std::cout << "pid_controller_test executed successfully" << std::endl;
    return 0;
}
