#ifndef GAIT_EXECUTOR_H
#define GAIT_EXECUTOR_H

#include "cancellation_token.h"
#include "robot_config.h"
#include "robot_model.h"
#include <functional>

/**
 * @file gait_executor.h
 * @brief Frame-by-frame tripod and wave gait cycles.
 *
 * Each execute call runs ONE complete cycle over a working copy of the six
 * foot positions, handing every frame to a callback and pausing for the
 * configured frame delay. Continuous walking is the caller's loop: reset the
 * working pose, run a cycle, repeat.
 *
 * The phase tables below are empirically tuned constants. Keep them as they
 * are; a "cleaner" phase split changes gait stability on the real robot.
 */
class GaitExecutor {
  public:
    /**
     * @brief Receives every emitted frame.
     * @return false to abort the cycle (actuator failure)
     */
    typedef std::function<bool(const BodyPose &)> FrameCallback;

    enum GaitCycleResult {
        CYCLE_COMPLETED, //< All frames emitted
        CYCLE_CANCELLED, //< Token cancelled between frames
        CYCLE_ABORTED    //< Frame callback reported failure
    };

    GaitExecutor(const BodyPose &body_points, FrameCallback callback,
                 const GaitTiming &timing = GaitTiming(), bool verbose = false);

    /**
     * @brief Run one tripod cycle: legs {0,2,4} and {1,3,5} alternate.
     * @param x Translation per cycle along x (mm)
     * @param y Translation per cycle along y (mm)
     * @param speed Speed 2-10, higher means fewer frames
     * @param angle Rotation per cycle (deg)
     * @param token Optional stop signal checked between frames
     */
    GaitCycleResult executeTripodCycle(double x, double y, int speed, double angle,
                                       CancellationToken *token = nullptr);

    /** Run one wave cycle: legs swing one at a time in the order 5,2,1,0,3,4. */
    GaitCycleResult executeWaveCycle(double x, double y, int speed, double angle,
                                     CancellationToken *token = nullptr);

    /** Dispatch to the cycle matching the gait type. */
    GaitCycleResult executeCycle(GaitType type, double x, double y, int speed, double angle,
                                 CancellationToken *token = nullptr);

    /** Restore the working pose to the reference body points. */
    void resetPoints();

    /** Replace the reference body points and reset the working pose. */
    void setBodyPoints(const BodyPose &body_points);

    void setTiming(const GaitTiming &timing) { timing_ = timing; }

    const BodyPose &getWorkingPose() const { return points_; }
    const BodyPose &getBodyPoints() const { return body_points_; }
    unsigned long getFramesEmitted() const { return frames_emitted_; }

    /**
     * @brief Frame count of one cycle for a speed.
     *
     * Speed is clamped to 2-10 and mapped linearly from 126 down to 22
     * frames (tripod) or 171 down to 45 (wave), rounded half away from zero.
     */
    static int mapSpeedToFrames(int speed, GaitType type);

  private:
    void computeLegDeltas(double x, double y, double angle, int frames, Point3D deltas[NUM_LEGS]) const;
    bool isStationary(double x, double y, double angle) const;
    GaitCycleResult emitFrame(CancellationToken *token);
    GaitCycleResult emitStationary(CancellationToken *token);

    BodyPose body_points_; //< Reference stance the cycle starts from
    BodyPose points_;      //< Working copy mutated frame by frame
    FrameCallback callback_;
    GaitTiming timing_;
    bool verbose_;
    unsigned long frames_emitted_;
};

#endif // GAIT_EXECUTOR_H
