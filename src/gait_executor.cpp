#include "gait_executor.h"
#include "math_utils.h"
#include <chrono>
#include <iostream>
#include <thread>

namespace {
// Swing order of the wave gait
const int kWaveLegOrder[NUM_LEGS] = {5, 2, 1, 0, 3, 4};
} // namespace

GaitExecutor::GaitExecutor(const BodyPose &body_points, FrameCallback callback, const GaitTiming &timing,
                           bool verbose)
    : body_points_(body_points), points_(body_points), callback_(callback), timing_(timing),
      verbose_(verbose), frames_emitted_(0) {}

int GaitExecutor::mapSpeedToFrames(int speed, GaitType type) {
    speed = math_utils::clamped(speed, GAIT_SPEED_MIN, GAIT_SPEED_MAX);
    double frames;
    if (type == TRIPOD_GAIT) {
        frames = math_utils::mapValue(speed, GAIT_SPEED_MIN, GAIT_SPEED_MAX,
                                      TRIPOD_FRAMES_AT_MIN_SPEED, TRIPOD_FRAMES_AT_MAX_SPEED);
    } else {
        frames = math_utils::mapValue(speed, GAIT_SPEED_MIN, GAIT_SPEED_MAX,
                                      WAVE_FRAMES_AT_MIN_SPEED, WAVE_FRAMES_AT_MAX_SPEED);
    }
    return math_utils::roundToInt(frames);
}

void GaitExecutor::resetPoints() {
    points_ = body_points_;
}

void GaitExecutor::setBodyPoints(const BodyPose &body_points) {
    body_points_ = body_points;
    points_ = body_points;
}

void GaitExecutor::computeLegDeltas(double x, double y, double angle, int frames,
                                    Point3D deltas[NUM_LEGS]) const {
    double angle_rad = math_utils::degreesToRadians(angle);
    double c = cos(angle_rad);
    double s = sin(angle_rad);
    for (int i = 0; i < NUM_LEGS; ++i) {
        const Point3D &bp = body_points_[i];
        double dx = ((bp.x * c + bp.y * s - bp.x) + x) / frames;
        double dy = ((-bp.x * s + bp.y * c - bp.y) + y) / frames;
        deltas[i] = Point3D(dx, dy, 0.0);
    }
}

bool GaitExecutor::isStationary(double x, double y, double angle) const {
    return x == 0.0 && y == 0.0 && angle == 0.0;
}

GaitExecutor::GaitCycleResult GaitExecutor::emitFrame(CancellationToken *token) {
    if (token && token->isCancelled())
        return CYCLE_CANCELLED;

    if (!callback_ || !callback_(points_)) {
        return CYCLE_ABORTED;
    }
    frames_emitted_++;

    if (token) {
        if (!token->sleepFor(timing_.frame_delay))
            return CYCLE_CANCELLED;
    } else if (timing_.frame_delay > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(timing_.frame_delay));
    }
    return CYCLE_COMPLETED;
}

GaitExecutor::GaitCycleResult GaitExecutor::emitStationary(CancellationToken *token) {
    if (verbose_) {
        std::cout << "[GaitExecutor] No movement requested, holding pose" << std::endl;
    }
    if (token && token->isCancelled())
        return CYCLE_CANCELLED;
    if (!callback_ || !callback_(points_))
        return CYCLE_ABORTED;
    frames_emitted_++;
    return CYCLE_COMPLETED;
}

GaitExecutor::GaitCycleResult GaitExecutor::executeTripodCycle(double x, double y, int speed, double angle,
                                                               CancellationToken *token) {
    if (isStationary(x, y, angle))
        return emitStationary(token);

    const int F = mapSpeedToFrames(speed, TRIPOD_GAIT);
    const double Z = timing_.step_height;
    const double z = Z / F;

    Point3D xy[NUM_LEGS];
    computeLegDeltas(x, y, angle, F, xy);

    if (verbose_) {
        std::cout << "[GaitExecutor] Tripod cycle x=" << x << " y=" << y << " speed=" << speed
                  << " angle=" << angle << " frames=" << F << std::endl;
    }

    for (int j = 0; j < F; ++j) {
        for (int i = 0; i < NUM_LEGS / 2; ++i) {
            const int even = 2 * i;    // legs 0, 2, 4
            const int odd = 2 * i + 1; // legs 1, 3, 5
            Point3D &pe = points_[even];
            Point3D &po = points_[odd];

            if (j < F / 8.0) {
                pe.x -= 4 * xy[even].x;
                pe.y -= 4 * xy[even].y;
                po.x += 8 * xy[odd].x;
                po.y += 8 * xy[odd].y;
                po.z = Z + body_points_[odd].z;
            } else if (j < F / 4.0) {
                pe.x -= 4 * xy[even].x;
                pe.y -= 4 * xy[even].y;
                po.z -= z * 8;
            } else if (j < 3 * F / 8.0) {
                pe.z += z * 8;
                po.x -= 4 * xy[odd].x;
                po.y -= 4 * xy[odd].y;
            } else if (j < 5 * F / 8.0) {
                pe.x += 8 * xy[even].x;
                pe.y += 8 * xy[even].y;
                po.x -= 4 * xy[odd].x;
                po.y -= 4 * xy[odd].y;
            } else if (j < 3 * F / 4.0) {
                pe.z -= z * 8;
                po.x -= 4 * xy[odd].x;
                po.y -= 4 * xy[odd].y;
            } else if (j < 7 * F / 8.0) {
                pe.x -= 4 * xy[even].x;
                pe.y -= 4 * xy[even].y;
                po.z += z * 8;
            } else {
                pe.x -= 4 * xy[even].x;
                pe.y -= 4 * xy[even].y;
                po.x += 8 * xy[odd].x;
                po.y += 8 * xy[odd].y;
            }
        }

        GaitCycleResult result = emitFrame(token);
        if (result != CYCLE_COMPLETED) {
            if (result == CYCLE_ABORTED)
                std::cerr << "[GaitExecutor] Tripod frame " << j << " rejected, aborting cycle" << std::endl;
            return result;
        }
    }
    return CYCLE_COMPLETED;
}

GaitExecutor::GaitCycleResult GaitExecutor::executeWaveCycle(double x, double y, int speed, double angle,
                                                             CancellationToken *token) {
    if (isStationary(x, y, angle))
        return emitStationary(token);

    const int F = mapSpeedToFrames(speed, WAVE_GAIT);
    const double z = timing_.step_height / F;
    const int frames_per_leg = F / NUM_LEGS;
    const int lift_end = frames_per_leg / 3;
    const int shift_end = 2 * frames_per_leg / 3;

    Point3D xy[NUM_LEGS];
    computeLegDeltas(x, y, angle, F, xy);

    if (verbose_) {
        std::cout << "[GaitExecutor] Wave cycle x=" << x << " y=" << y << " speed=" << speed
                  << " angle=" << angle << " frames=" << F << std::endl;
    }

    for (int n = 0; n < NUM_LEGS; ++n) {
        const int current_leg = kWaveLegOrder[n];
        for (int j = 0; j < frames_per_leg; ++j) {
            for (int k = 0; k < NUM_LEGS; ++k) {
                Point3D &p = points_[k];
                if (k == current_leg) {
                    if (j < lift_end) {
                        p.z += 18 * z;
                    } else if (j < shift_end) {
                        p.x += 30 * xy[k].x;
                        p.y += 30 * xy[k].y;
                    } else {
                        p.z -= 18 * z;
                    }
                } else {
                    p.x -= 2 * xy[k].x;
                    p.y -= 2 * xy[k].y;
                }
            }

            GaitCycleResult result = emitFrame(token);
            if (result != CYCLE_COMPLETED) {
                if (result == CYCLE_ABORTED)
                    std::cerr << "[GaitExecutor] Wave frame " << j << " of leg " << current_leg
                              << " rejected, aborting cycle" << std::endl;
                return result;
            }
        }
    }
    return CYCLE_COMPLETED;
}

GaitExecutor::GaitCycleResult GaitExecutor::executeCycle(GaitType type, double x, double y, int speed,
                                                         double angle, CancellationToken *token) {
    if (type == WAVE_GAIT)
        return executeWaveCycle(x, y, speed, angle, token);
    return executeTripodCycle(x, y, speed, angle, token);
}
