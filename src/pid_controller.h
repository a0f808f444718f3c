#ifndef PID_CONTROLLER_H
#define PID_CONTROLLER_H

#include <chrono>

/**
 * @file pid_controller.h
 * @brief Single-axis PID regulator driving a measurement toward zero.
 *
 * Used by the balance loop, one instance for roll and one for pitch.
 * The wall-clock update() measures dt between calls; update(measurement, dt)
 * takes an explicit step for deterministic callers.
 */
class PIDController {
  public:
    PIDController(double kp = 0.5, double ki = 0.0, double kd = 0.0);

    /**
     * @brief Advance the controller using the time elapsed since the last call.
     * @param measurement Current value of the controlled variable
     * @return Corrective output
     */
    double update(double measurement);

    /**
     * @brief Advance the controller by an explicit time step.
     * @param measurement Current value of the controlled variable
     * @param dt Step in seconds; values <= 0 are floored to 1 ms
     */
    double update(double measurement, double dt);

    /**
     * @brief Clear integral and derivative history and restamp the clock.
     *
     * The next update has no previous error and applies no derivative term.
     */
    void reset();

    void setGains(double kp, double ki, double kd);

    double getKp() const { return kp_; }
    double getKi() const { return ki_; }
    double getKd() const { return kd_; }
    double getIntegral() const { return error_sum_; }
    double getPreviousError() const { return prev_error_; }
    double getTarget() const { return target_; }

  private:
    typedef std::chrono::steady_clock Clock;

    double kp_, ki_, kd_;
    double target_;     //< Setpoint, fixed at zero
    double prev_error_; //< Error from the previous update
    bool has_previous_; //< prev_error_ holds a real sample
    double error_sum_;  //< Accumulated error * dt
    Clock::time_point last_time_;
};

#endif // PID_CONTROLLER_H
