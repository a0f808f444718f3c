#ifndef KINEMATICS_SOLVER_H
#define KINEMATICS_SOLVER_H

#include "robot_model.h"

/**
 * @brief Result of an inverse kinematics query.
 *
 * When @c valid is false the target lies outside the annulus the femur and
 * tibia can span and @c angles is left at zero.
 */
struct IKSolution {
    JointAngles angles;     //< Coxa, femur, tibia in degrees
    bool valid = false;     //< Target reachable
    double distance = 0.0;  //< Distance from the coxa tip to the target (mm)
};

/**
 * @brief Closed-form inverse kinematics for a 3-DOF leg.
 *
 * The solver works in the native frame of the leg hardware: @c x along the
 * gravity direction (positive down), @c y radial away from the body and
 * @c z lateral. Leg-local points expressed as (x forward, y lateral, z up)
 * are converted by solveLegPoint() and forwardLegPoint().
 */
class KinematicsSolver {
  public:
    explicit KinematicsSolver(const SegmentLengths &lengths = SegmentLengths());

    /**
     * @brief Solve the joint angles for a point, rounded to whole degrees.
     * @return Solution with valid=false when the point is out of reach.
     */
    IKSolution solve(double x, double y, double z) const;

    /** Same as solve() without rounding. */
    IKSolution solveExact(double x, double y, double z) const;

    /**
     * @brief Solve for a leg-local point (x forward, y lateral, z up).
     * @param rounded Round the angles to whole degrees.
     */
    IKSolution solveLegPoint(const Point3D &leg_local, bool rounded = true) const;

    /** Forward kinematics in the solver's native frame. */
    Point3D forward(const JointAngles &angles) const;

    /** Forward kinematics returning a leg-local point. */
    Point3D forwardLegPoint(const JointAngles &angles) const;

    /** True when solve() would succeed for the point. */
    bool isReachable(double x, double y, double z) const;

    double getMaxReach() const { return lengths_.femur + lengths_.tibia; }
    double getMinReach() const { return std::fabs(lengths_.femur - lengths_.tibia); }
    const SegmentLengths &getSegmentLengths() const { return lengths_; }

    /**
     * @brief Map raw solver angles onto the servo horn convention.
     *
     * Coxa and tibia are used as-is; the femur horn is centred at 90 so the
     * raw femur elevation is subtracted from it.
     */
    static JointAngles toServoFrame(const JointAngles &raw);

  private:
    IKSolution solveInternal(double x, double y, double z, bool rounded) const;

    SegmentLengths lengths_;
};

#endif // KINEMATICS_SOLVER_H
