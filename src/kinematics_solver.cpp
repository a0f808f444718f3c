#include "kinematics_solver.h"
#include "math_utils.h"
#include <cmath>

KinematicsSolver::KinematicsSolver(const SegmentLengths &lengths) : lengths_(lengths) {}

IKSolution KinematicsSolver::solve(double x, double y, double z) const {
    return solveInternal(x, y, z, true);
}

IKSolution KinematicsSolver::solveExact(double x, double y, double z) const {
    return solveInternal(x, y, z, false);
}

IKSolution KinematicsSolver::solveLegPoint(const Point3D &leg_local, bool rounded) const {
    return solveInternal(-leg_local.z, leg_local.x, leg_local.y, rounded);
}

IKSolution KinematicsSolver::solveInternal(double x, double y, double z, bool rounded) const {
    using namespace math_utils;
    IKSolution result;

    const double l1 = lengths_.coxa;
    const double l2 = lengths_.femur;
    const double l3 = lengths_.tibia;

    // Coxa yaw, then the end of the coxa segment in the solver frame
    double alpha = M_PI / 2.0 - atan2(z, y);
    double x4 = l1 * sin(alpha);
    double x5 = l1 * cos(alpha);

    double l23 = sqrt((z - x5) * (z - x5) + (y - x4) * (y - x4) + x * x);
    result.distance = l23;
    if (l23 > l2 + l3 || l23 < std::fabs(l2 - l3) || l23 <= 0.0) {
        return result;
    }

    double w = clamped(x / l23, -1.0, 1.0);
    double v = clamped((l2 * l2 + l23 * l23 - l3 * l3) / (2.0 * l2 * l23), -1.0, 1.0);
    double u = clamped((l2 * l2 + l3 * l3 - l23 * l23) / (2.0 * l3 * l2), -1.0, 1.0);

    double beta = asin(w) - acos(v);
    double gamma = M_PI - acos(u);

    double a = radiansToDegrees(alpha);
    double b = radiansToDegrees(beta);
    double g = radiansToDegrees(gamma);
    if (rounded) {
        a = roundToInt(a);
        b = roundToInt(b);
        g = roundToInt(g);
    }

    result.angles = JointAngles(a, b, g);
    result.valid = true;
    return result;
}

Point3D KinematicsSolver::forward(const JointAngles &angles) const {
    using math_utils::degreesToRadians;
    double a = degreesToRadians(angles.coxa);
    double b = degreesToRadians(angles.femur);
    double g = degreesToRadians(angles.tibia);

    double planar = lengths_.tibia * cos(b + g) + lengths_.femur * cos(b) + lengths_.coxa;
    double x = lengths_.tibia * sin(b + g) + lengths_.femur * sin(b);
    return Point3D(x, sin(a) * planar, cos(a) * planar);
}

Point3D KinematicsSolver::forwardLegPoint(const JointAngles &angles) const {
    Point3D native = forward(angles);
    return Point3D(native.y, native.z, -native.x);
}

bool KinematicsSolver::isReachable(double x, double y, double z) const {
    return solveInternal(x, y, z, false).valid;
}

JointAngles KinematicsSolver::toServoFrame(const JointAngles &raw) {
    return JointAngles(raw.coxa, SERVO_ANGLE_CENTER - raw.femur, raw.tibia);
}
