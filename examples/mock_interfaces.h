#ifndef HEXASTRIDE_MOCK_INTERFACES_H
#define HEXASTRIDE_MOCK_INTERFACES_H

#include <HexaStride.h>
#include <cmath>
#include <iostream>
#include <mutex>

/**
 * @brief Example IMU interface returning a slowly rocking gravity vector.
 */
class ExampleIMU : public IIMUInterface {
  public:
    bool initialize() override { return true; }
    AccelerationData readAcceleration() override {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_ += 0.05;
        AccelerationData data;
        data.x = 0.05 * std::sin(phase_);
        data.y = 0.08 * std::cos(phase_);
        data.z = 1.0;
        data.is_valid = true;
        return data;
    }
    bool isAvailable() override { return true; }

  private:
    std::mutex mutex_;
    double phase_ = 0.0;
};

/**
 * @brief Example servo interface storing commanded angles in RAM.
 */
class ExampleServo : public IServoInterface {
  public:
    explicit ExampleServo(bool echo = false) : echo_(echo) {
        for (int i = 0; i <= MAX_SERVO_CHANNEL; ++i) {
            angles_[i] = SERVO_ANGLE_CENTER;
        }
    }

    bool initialize() override {
        ready_ = true;
        return true;
    }

    bool setAngle(uint8_t channel, uint8_t angle) override {
        if (channel > MAX_SERVO_CHANNEL || angle > SERVO_ANGLE_MAX)
            return false;
        std::lock_guard<std::mutex> lock(mutex_);
        angles_[channel] = angle;
        writes_++;
        if (echo_)
            std::cout << "[ExampleServo] ch" << static_cast<int>(channel) << " -> " << static_cast<int>(angle)
                      << std::endl;
        return true;
    }

    bool relax() override { return true; }
    void cleanup() override { ready_ = false; }
    bool isAvailable() override { return ready_; }

    int angle(int channel) {
        std::lock_guard<std::mutex> lock(mutex_);
        return angles_[channel];
    }

    unsigned long writes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

  private:
    std::mutex mutex_;
    int angles_[MAX_SERVO_CHANNEL + 1];
    unsigned long writes_ = 0;
    bool echo_;
    bool ready_ = false;
};

#endif // HEXASTRIDE_MOCK_INTERFACES_H
