#ifndef MATH_UTILS_H
#define MATH_UTILS_H

#include <Eigen/Dense>
#include <algorithm>

struct Point3D; // forward declaration

namespace math_utils {
/** Convert degrees to radians. */
double degreesToRadians(double degrees);
/** Convert radians to degrees. */
double radiansToDegrees(double radians);
/** Rotate a point about the vertical axis (angle in radians). */
Point3D rotateAboutZ(const Point3D &point, double angle);
/** Euclidean distance between two points. */
double distance3D(const Point3D &p1, const Point3D &p2);

/** Rotation matrix about Z axis (angle in radians). */
Eigen::Matrix3d rotationMatrixZ(double angle);

/**
 * @brief Clamp a value between min and max
 * @param value The value to clamp
 * @param min_value Minimum value
 * @param max_value Maximum value
 * @return Clamped value
 */
template <class T>
inline T clamped(T value, T min_value, T max_value) {
    return std::max(min_value, std::min(max_value, value));
}

/**
 * @brief Round to nearest integer, halves away from zero
 * @param x The value to round
 * @return Rounded integer
 */
inline int roundToInt(double x) {
    return (x >= 0) ? static_cast<int>(x + 0.5) : -static_cast<int>(0.5 - x);
}

/**
 * @brief Linearly map a value from one range onto another
 * @param value Input value
 * @param in_min Lower bound of the input range
 * @param in_max Upper bound of the input range
 * @param out_min Value returned for in_min
 * @param out_max Value returned for in_max
 */
inline double mapValue(double value, double in_min, double in_max, double out_min, double out_max) {
    if (in_max == in_min)
        return out_min;
    return out_min + (value - in_min) * (out_max - out_min) / (in_max - in_min);
}

} // namespace math_utils

#endif // MATH_UTILS_H
