#include "../src/kinematics_solver.h"
#include "../src/math_utils.h"
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>

static void expectNear(double a, double b, double eps, const char *msg) {
    if (std::fabs(a - b) > eps) {
        std::cerr << "FAIL: " << msg << " expected " << b << " got " << a << "\n";
        std::exit(1);
    }
}

int main() {
    KinematicsSolver solver;

    std::cout << "Test 1: Reference point" << std::endl;
    {
        IKSolution s = solver.solve(-100, 140, 0);
        assert(s.valid);
        expectNear(s.angles.coxa, 90, 1.0, "coxa");
        expectNear(s.angles.femur, -92, 1.0, "femur");
        expectNear(s.angles.tibia, 87, 1.0, "tibia");
        // Rounded output is whole degrees
        assert(s.angles.femur == std::floor(s.angles.femur));

        IKSolution exact = solver.solveExact(-100, 140, 0);
        expectNear(exact.angles.femur, -91.618, 0.01, "exact femur");
        expectNear(exact.angles.tibia, 86.383, 0.01, "exact tibia");
    }

    std::cout << "Test 2: IK/FK round trip" << std::endl;
    {
        const Point3D targets[] = {Point3D(140, 0, -114), Point3D(120, 30, -90), Point3D(160, -20, -130),
                                   Point3D(100, 0, -60)};
        for (const Point3D &t : targets) {
            IKSolution exact = solver.solveLegPoint(t, false);
            assert(exact.valid);
            Point3D back = solver.forwardLegPoint(exact.angles);
            expectNear(math_utils::distance3D(back, t), 0.0, 1.0, "exact round trip");

            // Whole-degree output still lands within a few millimetres
            IKSolution rounded = solver.solveLegPoint(t);
            assert(rounded.valid);
            expectNear(math_utils::distance3D(solver.forwardLegPoint(rounded.angles), t), 0.0, 3.0,
                       "rounded round trip");
        }

        Point3D native = solver.forward(solver.solveExact(-100, 140, 0).angles);
        expectNear(native.x, -100, 1e-6, "native x");
        expectNear(native.y, 140, 1e-6, "native y");
        expectNear(native.z, 0, 1e-6, "native z");
    }

    std::cout << "Test 3: Unreachable targets" << std::endl;
    {
        assert(!solver.solve(0, 400, 0).valid);
        assert(!solver.isReachable(0, 400, 0));
        // Inside the inner annulus |L2 - L3|
        assert(!solver.solve(0, 34, 0).valid);
        assert(!solver.solve(0, 40, 0).valid);
        assert(solver.isReachable(-100, 140, 0));
        expectNear(solver.getMaxReach(), 200.0, 1e-12, "max reach");
        expectNear(solver.getMinReach(), 20.0, 1e-12, "min reach");
    }

    std::cout << "Test 4: Servo frame" << std::endl;
    {
        JointAngles servo = KinematicsSolver::toServoFrame(JointAngles(90, 3, 78));
        assert(servo.coxa == 90 && servo.femur == 87 && servo.tibia == 78);
    }

    std::cout << "Test 5: Custom segment lengths" << std::endl;
    {
        SegmentLengths lengths;
        lengths.coxa = 40;
        lengths.femur = 100;
        lengths.tibia = 120;
        KinematicsSolver custom(lengths);
        IKSolution s = custom.solveLegPoint(Point3D(150, 20, -100), false);
        assert(s.valid);
        expectNear(math_utils::distance3D(custom.forwardLegPoint(s.angles), Point3D(150, 20, -100)), 0.0, 1e-6,
                   "custom round trip");
    }

    std::cout << "kinematics_solver_test executed successfully" << std::endl;
    return 0;
}
