#include "pid_controller.h"
#include "hexastride_constants.h"

PIDController::PIDController(double kp, double ki, double kd)
    : kp_(kp), ki_(ki), kd_(kd), target_(0.0), prev_error_(0.0), has_previous_(false), error_sum_(0.0),
      last_time_(Clock::now()) {}

double PIDController::update(double measurement) {
    Clock::time_point now = Clock::now();
    double dt = std::chrono::duration<double>(now - last_time_).count();
    last_time_ = now;
    return update(measurement, dt);
}

double PIDController::update(double measurement, double dt) {
    if (dt <= 0.0)
        dt = PID_MIN_DT;

    double error = target_ - measurement;
    error_sum_ += error * dt;
    double derivative = has_previous_ ? (error - prev_error_) / dt : 0.0;

    double output = kp_ * error + ki_ * error_sum_ + kd_ * derivative;

    prev_error_ = error;
    has_previous_ = true;
    return output;
}

void PIDController::reset() {
    prev_error_ = 0.0;
    has_previous_ = false;
    error_sum_ = 0.0;
    last_time_ = Clock::now();
}

void PIDController::setGains(double kp, double ki, double kd) {
    kp_ = kp;
    ki_ = ki;
    kd_ = kd;
}
