#ifndef ROBOT_MODEL_H
#define ROBOT_MODEL_H

#include "hexastride_constants.h"
#include "math_utils.h"
#include <array>
#include <cmath>

/**
 * @brief 3D point in millimetres.
 */
struct Point3D {
    double x, y, z;
    explicit Point3D(double x = 0, double y = 0, double z = 0) : x(x), y(y), z(z) {}

    bool operator==(const Point3D &other) const {
        return (x == other.x && y == other.y && z == other.z);
    }

    bool operator!=(const Point3D &other) const {
        return !(*this == other);
    }
};

/**
 * @brief Joint angles of one leg in degrees.
 */
struct JointAngles {
    double coxa, femur, tibia;
    explicit JointAngles(double c = 0, double f = 0, double t = 0) : coxa(c), femur(f), tibia(t) {}

    double &operator[](int joint) { return joint == 0 ? coxa : (joint == 1 ? femur : tibia); }
    double operator[](int joint) const { return joint == 0 ? coxa : (joint == 1 ? femur : tibia); }
};

/**
 * @brief Actuator angles for one leg after calibration, ready for the servo bus.
 */
struct ServoAngles {
    int coxa = SERVO_ANGLE_CENTER;
    int femur = SERVO_ANGLE_CENTER;
    int tibia = SERVO_ANGLE_CENTER;
};

/**
 * @brief Segment lengths shared by every leg (mm).
 */
struct SegmentLengths {
    double coxa = DEFAULT_COXA_LENGTH;
    double femur = DEFAULT_FEMUR_LENGTH;
    double tibia = DEFAULT_TIBIA_LENGTH;
};

/** Six foot positions in the body frame, indexed by leg. */
typedef std::array<Point3D, NUM_LEGS> BodyPose;

/**
 * @brief Supported gait patterns.
 */
enum GaitType {
    TRIPOD_GAIT = 1, //< Two alternating triads {0,2,4} and {1,3,5}
    WAVE_GAIT = 2    //< One leg swings at a time
};

/** Human readable gait name for logs. */
inline const char *gaitTypeName(GaitType type) {
    return type == WAVE_GAIT ? "wave" : "tripod";
}

#endif // ROBOT_MODEL_H
