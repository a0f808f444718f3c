#include <cassert>
#include <cmath>
#include <iostream>
#include "../src/math_utils.h"
#include "../src/robot_model.h"

int main() {
    using namespace math_utils;
    double deg = 90.0;
    double rad = degreesToRadians(deg);
    assert(std::fabs(rad - M_PI / 2.0) < 1e-12);
    assert(std::fabs(radiansToDegrees(rad) - 90.0) < 1e-9);

    auto R = rotationMatrixZ(degreesToRadians(45.0));
    Eigen::Matrix3d I = R * R.transpose();
    assert((I - Eigen::Matrix3d::Identity()).norm() < 1e-9);

    // Quarter turn about Z maps +x onto +y
    Point3D p = rotateAboutZ(Point3D(1, 0, 5), degreesToRadians(90.0));
    assert(std::fabs(p.x) < 1e-9 && std::fabs(p.y - 1.0) < 1e-9 && std::fabs(p.z - 5.0) < 1e-9);

    assert(distance3D(p, Point3D(0, 1, 5)) < 1e-9);
    assert(std::fabs(distance3D(Point3D(0, 0, 7), Point3D(3, 4, 7)) - 5.0) < 1e-12);

    // Halves round away from zero
    assert(roundToInt(2.5) == 3);
    assert(roundToInt(-2.5) == -3);
    assert(roundToInt(155.25) == 155);
    assert(roundToInt(139.5) == 140);
    assert(roundToInt(-0.4) == 0);

    assert(clamped(50.0, -35.0, 35.0) == 35.0);
    assert(clamped(-50.0, -35.0, 35.0) == -35.0);
    assert(clamped(1, 2, 10) == 2);

    assert(std::fabs(mapValue(6, 2, 10, 126, 22) - 74.0) < 1e-12);
    assert(mapValue(3, 1, 1, 7, 9) == 7);

    std::cout << "math_utils_test executed successfully" << std::endl;
    return 0;
}
