#include "body_pose.h"
#include "math_utils.h"

BodyPose translatedPose(const BodyPose &neutral, double x, double y, double z) {
    BodyPose pose = neutral;
    for (int i = 0; i < NUM_LEGS; ++i) {
        pose[i].x = neutral[i].x - x;
        pose[i].y = neutral[i].y - y;
        pose[i].z = neutral[i].z - z;
    }
    return pose;
}

BodyPose attitudePose(const BodyPose &neutral, double roll, double pitch, double yaw) {
    using namespace math_utils;
    double roll_rad = degreesToRadians(roll);
    double pitch_rad = degreesToRadians(pitch);
    double yaw_rad = degreesToRadians(yaw);
    double height = neutral[0].z;

    BodyPose pose;
    for (int i = 0; i < NUM_LEGS; ++i) {
        const Point3D &foot = neutral[i];
        Point3D turned = rotateAboutZ(Point3D(foot.x, foot.y, 0.0), yaw_rad);
        double z = height + foot.x * sin(pitch_rad) + foot.y * sin(roll_rad);
        pose[i] = Point3D(turned.x, turned.y, z);
    }
    return pose;
}
