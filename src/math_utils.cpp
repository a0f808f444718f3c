#include "math_utils.h"
#include "hexastride_constants.h"
#include "robot_model.h"
#include <cmath>

// Utility function implementations
namespace math_utils {
double degreesToRadians(double degrees) {
    return degrees * DEGREES_TO_RADIANS_FACTOR;
}

double radiansToDegrees(double radians) {
    return radians * RADIANS_TO_DEGREES_FACTOR;
}

Point3D rotateAboutZ(const Point3D &point, double angle) {
    Eigen::Vector3d rotated = rotationMatrixZ(angle) * Eigen::Vector3d(point.x, point.y, point.z);
    return Point3D(rotated[0], rotated[1], rotated[2]);
}

double distance3D(const Point3D &p1, const Point3D &p2) {
    return sqrt((p1.x - p2.x) * (p1.x - p2.x) +
                (p1.y - p2.y) * (p1.y - p2.y) +
                (p1.z - p2.z) * (p1.z - p2.z));
}

Eigen::Matrix3d rotationMatrixZ(double angle) {
    Eigen::Matrix3d m;
    double c = cos(angle), s = sin(angle);
    m << c, -s, 0,
        s, c, 0,
        0, 0, 1;
    return m;
}

} // namespace math_utils
