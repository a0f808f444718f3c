#ifndef MOVEMENT_CONTROLLER_H
#define MOVEMENT_CONTROLLER_H

#include "cancellation_token.h"
#include "command_result.h"
#include "gait_executor.h"
#include "hexastride_interfaces.h"
#include "kinematics_solver.h"
#include "pid_controller.h"
#include "robot_config.h"
#include "robot_config_factory.h"
#include "robot_model.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @file movement_controller.h
 * @brief Orchestrates gait cycling, direct pose commands and the balance loop.
 *
 * move() starts a supervisor thread that repeatedly resets the gait working
 * pose and runs one cycle with the latest parameters. Calling move() again
 * while walking replaces the parameters for the next cycle without starting
 * a second supervisor. stop() cancels and joins the supervisor before the
 * robot returns to its standing pose, so no frame is emitted afterwards.
 *
 * Every frame goes through one actuator lock: the 18 writes of a frame are
 * never interleaved with writes from another thread.
 */
class MovementController {
  public:
    /** Named movement presets. */
    enum MoveMode {
        MOVE_FORWARD,    //< (0, 25, 0)
        MOVE_BACKWARD,   //< (0, -25, 0)
        MOVE_LEFT,       //< (-25, 0, 0)
        MOVE_RIGHT,      //< (25, 0, 0)
        MOVE_TURN_LEFT,  //< (0, 0, 15)
        MOVE_TURN_RIGHT, //< (0, 0, -15)
        MOVE_CUSTOM,     //< (x, y, angle)
        MOVE_MOTION,     //< (x, y, angle)
        MOVE_GAIT        //< (x, 0, angle)
    };

    /**
     * @brief Live motion parameters, replaced as a whole on every move().
     */
    struct MotionParameters {
        GaitType gait = TRIPOD_GAIT;
        double x = 0.0;
        double y = 0.0;
        int speed = GAIT_SPEED_DEFAULT;
        double angle = 0.0;
        double duration = 0.0; //< Seconds of walking, <= 0 walks until stopped
    };

    /**
     * @brief Health and progress snapshot.
     */
    struct MovementStatus {
        bool initialized = false;
        bool available = false;
        bool moving = false;
        bool balancing = false;
        MotionParameters parameters;
        unsigned long cycles_completed = 0;    //< Gait cycles finished since construction
        unsigned long supervisor_launches = 0; //< Supervisor threads started
        unsigned long frames_emitted = 0;      //< Poses written to the actuators
        unsigned long unreachable_legs = 0;    //< Leg targets skipped because IK failed
        ErrorCode last_error = NO_ERROR;
        std::string last_error_message;
        BodyPose current_pose; //< Last target written per leg; skipped legs keep their previous point
    };

    /**
     * @param servo Actuator backend, not owned
     * @param imu Attitude sensor for balance mode, optional and not owned
     * @param config Robot description
     */
    MovementController(IServoInterface *servo, IIMUInterface *imu = nullptr,
                       const RobotConfiguration &config = createDefaultRobotConfiguration());
    ~MovementController();

    MovementController(const MovementController &) = delete;
    MovementController &operator=(const MovementController &) = delete;

    /** Initialize the hardware and move to the standing pose. */
    CommandResult initialize();

    /**
     * @brief Start or update continuous walking.
     *
     * The mode selects a preset (x, y, angle); custom modes use the given
     * values. An all-zero triple stops the robot. x and y are clamped to
     * the step limit, angle to the turn limit and speed to 2-10.
     */
    CommandResult move(MoveMode mode, double x = 0.0, double y = MODE_STEP_MM, int speed = GAIT_SPEED_DEFAULT,
                       double angle = 0.0, GaitType gait = TRIPOD_GAIT, double duration = 0.0);

    /** Stop walking and stand. Returns after the supervisor has exited. */
    CommandResult stop();

    /**
     * @brief Shift the body relative to the neutral stance.
     * @param x Forward shift, clamped to +/-40 mm
     * @param y Lateral shift, clamped to +/-40 mm
     * @param z Height shift, clamped to +/-20 mm
     */
    CommandResult setPosition(double x, double y, double z);

    /** Tilt the body; each angle clamped to +/-15 degrees. */
    CommandResult setAttitude(double roll, double pitch, double yaw);

    /** Enable or disable the IMU balance loop. */
    CommandResult setBalanceMode(bool enabled);

    /** Release torque on all servos. */
    CommandResult relax();

    /** Stop every loop, stand and release the servo backend. */
    void cleanup();

    /**
     * @brief Recompute trim offsets from measured calibration foot positions.
     * @param calibration_points Leg-local positions, one per leg
     */
    CommandResult recalibrate(const BodyPose &calibration_points);

    bool isAvailable() const;
    bool isMoving() const { return moving_.load(); }
    bool isBalancing() const { return balancing_.load(); }

    MovementStatus getStatus() const;
    MotionParameters getMotionParameters() const;
    ErrorCode getLastError() const;
    std::string getLastErrorMessage() const;

    const RobotConfiguration &getConfiguration() const { return config_; }
    const BodyPose &getNeutralPose() const { return neutral_pose_; }

    /** Map a mode name ("forward", "turn_left", ...) to a preset; unknown names are custom. */
    static MoveMode parseMoveMode(const std::string &name);
    /** Map a gait selector ("1"/"tripod", "2"/"wave") to a gait type; defaults to tripod. */
    static GaitType parseGaitType(const std::string &name);

  private:
    bool emitPose(const BodyPose &pose, CommandResult *failure);
    CommandResult standInternal();
    CommandResult applyAttitude(double roll, double pitch, double yaw);
    void supervisorLoop(std::shared_ptr<CancellationToken> token);
    void balanceLoop(std::shared_ptr<CancellationToken> token);
    void stopSupervisor();
    void stopBalance();
    void recordError(const CommandResult &result);
    CommandResult notAvailable(const char *command);

    IServoInterface *servo_;
    IIMUInterface *imu_;
    RobotConfiguration config_;
    KinematicsSolver solver_;
    BodyPose neutral_pose_;
    GaitExecutor gait_; //< Touched only by the supervisor thread while it runs

    PIDController pid_roll_;
    PIDController pid_pitch_;

    std::atomic<bool> initialized_;
    std::atomic<bool> moving_;
    std::atomic<bool> balancing_;

    std::thread supervisor_thread_;
    std::shared_ptr<CancellationToken> supervisor_token_;
    std::thread balance_thread_;
    std::shared_ptr<CancellationToken> balance_token_;

    mutable std::mutex command_mutex_;  //< Serializes public commands
    mutable std::mutex actuator_mutex_; //< Guards frame emission and trim offsets
    mutable std::mutex state_mutex_;    //< Guards parameters, errors, pose snapshot

    MotionParameters params_;
    ErrorCode last_error_;
    std::string last_error_message_;
    BodyPose current_pose_; //< Per leg, the last target actually written

    std::atomic<unsigned long> cycles_completed_;
    std::atomic<unsigned long> supervisor_launches_;
    std::atomic<unsigned long> frames_emitted_;
    std::atomic<unsigned long> unreachable_legs_;
};

#endif // MOVEMENT_CONTROLLER_H
