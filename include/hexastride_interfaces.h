#ifndef HEXASTRIDE_INTERFACES_H
#define HEXASTRIDE_INTERFACES_H

#include <cstdint>

/**
 * @file hexastride_interfaces.h
 * @brief Hardware capability interfaces consumed by the locomotion core.
 *
 * Concrete drivers (PCA9685 boards, I2C accelerometers, simulators) live
 * outside the library and are injected into MovementController.
 */

/**
 * @brief Accelerometer sample in units of g.
 */
struct AccelerationData {
    double x = 0.0, y = 0.0, z = 0.0;
    bool is_valid = false; //< False when the sensor read failed
};

/**
 * @brief Interface for the actuator backend.
 */
class IServoInterface {
  public:
    virtual ~IServoInterface() = default;

    /** Initialize servo communication. */
    virtual bool initialize() = 0;

    /**
     * Command one actuator channel.
     * @param channel Channel number (0-31)
     * @param angle Target angle in degrees (0-180)
     * @return true if the command reached the hardware
     */
    virtual bool setAngle(uint8_t channel, uint8_t angle) = 0;

    /** Release torque on every channel. */
    virtual bool relax() = 0;

    /** Release the backend. */
    virtual void cleanup() = 0;

    /** True once initialized and able to accept commands. */
    virtual bool isAvailable() = 0;
};

/**
 * @brief Interface for the attitude sensor.
 */
class IIMUInterface {
  public:
    virtual ~IIMUInterface() = default;

    /** Initialize the IMU hardware. */
    virtual bool initialize() = 0;

    /** Retrieve the current acceleration vector. */
    virtual AccelerationData readAcceleration() = 0;

    /** Check if the IMU is connected. */
    virtual bool isAvailable() = 0;
};

#endif // HEXASTRIDE_INTERFACES_H
