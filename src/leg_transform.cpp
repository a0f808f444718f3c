#include "leg_transform.h"
#include "kinematics_solver.h"
#include "math_utils.h"

Point3D bodyToLegLocal(const Point3D &body_point, const LegGeometry &geometry, double height_correction) {
    double angle = math_utils::degreesToRadians(geometry.mount_angle);
    Point3D rotated = math_utils::rotateAboutZ(Point3D(body_point.x, body_point.y, 0.0), -angle);
    return Point3D(rotated.x - geometry.body_offset, rotated.y, body_point.z - height_correction);
}

Point3D legLocalToBody(const Point3D &leg_point, const LegGeometry &geometry, double height_correction) {
    double angle = math_utils::degreesToRadians(geometry.mount_angle);
    Point3D shifted(leg_point.x + geometry.body_offset, leg_point.y, 0.0);
    Point3D rotated = math_utils::rotateAboutZ(shifted, angle);
    return Point3D(rotated.x, rotated.y, leg_point.z + height_correction);
}

int calibrateJointAngle(double servo_angle, int offset, bool mirrored) {
    double value = servo_angle + offset;
    if (mirrored)
        value = SERVO_ANGLE_MAX - value;
    value = math_utils::clamped<double>(value, SERVO_ANGLE_MIN, SERVO_ANGLE_MAX);
    return math_utils::roundToInt(value);
}

ServoAngles toServoAngles(const JointAngles &raw, const LegConfig &leg) {
    JointAngles servo = KinematicsSolver::toServoFrame(raw);
    ServoAngles out;
    out.coxa = calibrateJointAngle(servo.coxa, leg.offsets[0], leg.mirrored);
    out.femur = calibrateJointAngle(servo.femur, leg.offsets[1], leg.mirrored);
    out.tibia = calibrateJointAngle(servo.tibia, leg.offsets[2], leg.mirrored);
    return out;
}
