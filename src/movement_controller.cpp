#include "movement_controller.h"
#include "body_pose.h"
#include "leg_transform.h"
#include "math_utils.h"

#include <chrono>
#include <cmath>
#include <iostream>

MovementController::MovementController(IServoInterface *servo, IIMUInterface *imu, const RobotConfiguration &config)
    : servo_(servo), imu_(imu), config_(config), solver_(config.segments),
      neutral_pose_(createNeutralPose(config)),
      gait_(neutral_pose_, [this](const BodyPose &pose) { return emitPose(pose, nullptr); }, config.timing,
            config.verbose_logging),
      pid_roll_(config.balance.kp, config.balance.ki, config.balance.kd),
      pid_pitch_(config.balance.kp, config.balance.ki, config.balance.kd), initialized_(false), moving_(false),
      balancing_(false), last_error_(NO_ERROR), current_pose_(neutral_pose_), cycles_completed_(0),
      supervisor_launches_(0), frames_emitted_(0), unreachable_legs_(0) {}

MovementController::~MovementController() {
    moving_ = false;
    balancing_ = false;
    stopSupervisor();
    stopBalance();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

CommandResult MovementController::initialize() {
    std::lock_guard<std::mutex> lock(command_mutex_);

    if (!servo_) {
        CommandResult r = CommandResult::failure(HARDWARE_NOT_AVAILABLE, "no servo backend attached");
        recordError(r);
        return r;
    }

    std::string problem;
    if (!validateRobotConfiguration(config_, &problem)) {
        CommandResult r = CommandResult::failure(PARAMETER_ERROR, "invalid configuration: " + problem);
        recordError(r);
        std::cerr << "[MovementController] " << r.message << std::endl;
        return r;
    }

    if (!servo_->initialize()) {
        CommandResult r = CommandResult::failure(HARDWARE_NOT_AVAILABLE, "servo backend failed to initialize");
        recordError(r);
        std::cerr << "[MovementController] " << r.message << std::endl;
        return r;
    }

    if (imu_ && !imu_->initialize()) {
        std::cout << "[MovementController] IMU failed to initialize, balance mode unavailable" << std::endl;
    }

    initialized_ = true;
    std::cout << "[MovementController] Initialized, moving to standing pose" << std::endl;
    return standInternal();
}

bool MovementController::isAvailable() const {
    return initialized_.load() && servo_ != nullptr && servo_->isAvailable();
}

CommandResult MovementController::notAvailable(const char *command) {
    CommandResult r =
        CommandResult::failure(HARDWARE_NOT_AVAILABLE, std::string(command) + ": movement controller not initialized");
    recordError(r);
    return r;
}

void MovementController::cleanup() {
    std::lock_guard<std::mutex> lock(command_mutex_);

    moving_ = false;
    stopSupervisor();
    balancing_ = false;
    stopBalance();

    if (isAvailable()) {
        CommandResult r = standInternal();
        if (!r.ok) {
            std::cerr << "[MovementController] Stand before cleanup failed: " << r.message << std::endl;
        }
    }
    if (servo_) {
        servo_->cleanup();
    }
    initialized_ = false;
    std::cout << "[MovementController] Cleanup complete" << std::endl;
}

CommandResult MovementController::relax() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!isAvailable())
        return notAvailable("relax");
    if (moving_) {
        CommandResult r = CommandResult::failure(STATE_ERROR, "relax: robot is walking");
        recordError(r);
        return r;
    }

    std::lock_guard<std::mutex> actuators(actuator_mutex_);
    if (!servo_->relax()) {
        CommandResult r = CommandResult::failure(COMMAND_EXECUTION_FAILED, "relax: servo backend refused");
        recordError(r);
        return r;
    }
    std::cout << "[MovementController] Servos relaxed" << std::endl;
    return CommandResult::success();
}

// ---------------------------------------------------------------------------
// Frame emission
// ---------------------------------------------------------------------------

bool MovementController::emitPose(const BodyPose &pose, CommandResult *failure) {
    std::lock_guard<std::mutex> actuators(actuator_mutex_);

    bool written[NUM_LEGS] = {false};
    for (int leg = 0; leg < NUM_LEGS; ++leg) {
        Point3D local = bodyToLegLocal(pose[leg], config_.geometry[leg], config_.mount_height_correction);
        IKSolution solution = solver_.solveLegPoint(local);
        if (!solution.valid) {
            // Keep the other legs moving; this one holds its last command
            unreachable_legs_++;
            if (config_.verbose_logging) {
                std::cout << "[MovementController] Leg " << leg << " target (" << local.x << ", " << local.y
                          << ", " << local.z << ") out of reach, skipped" << std::endl;
            }
            continue;
        }

        const LegConfig &lc = config_.legs[leg];
        ServoAngles angles = toServoAngles(solution.angles, lc);
        const int values[DOF_PER_LEG] = {angles.coxa, angles.femur, angles.tibia};

        for (int joint = 0; joint < DOF_PER_LEG; ++joint) {
            uint8_t channel = lc.channels[joint];
            if (!servo_->setAngle(channel, static_cast<uint8_t>(values[joint]))) {
                CommandResult r = CommandResult::failure(COMMAND_EXECUTION_FAILED,
                                                         "servo write failed on leg " + std::to_string(leg) +
                                                             " channel " + std::to_string(channel),
                                                         leg, channel);
                recordError(r);
                std::cerr << "[MovementController] " << r.message << std::endl;
                if (failure)
                    *failure = r;
                return false;
            }
        }
        written[leg] = true;
    }

    frames_emitted_++;
    std::lock_guard<std::mutex> state(state_mutex_);
    for (int leg = 0; leg < NUM_LEGS; ++leg) {
        if (written[leg])
            current_pose_[leg] = pose[leg];
    }
    return true;
}

CommandResult MovementController::standInternal() {
    CommandResult failure;
    if (!emitPose(neutral_pose_, &failure))
        return failure;
    return CommandResult::success();
}

// ---------------------------------------------------------------------------
// Continuous walking
// ---------------------------------------------------------------------------

MovementController::MoveMode MovementController::parseMoveMode(const std::string &name) {
    if (name == "forward")
        return MOVE_FORWARD;
    if (name == "backward")
        return MOVE_BACKWARD;
    if (name == "left")
        return MOVE_LEFT;
    if (name == "right")
        return MOVE_RIGHT;
    if (name == "turn_left")
        return MOVE_TURN_LEFT;
    if (name == "turn_right")
        return MOVE_TURN_RIGHT;
    if (name == "motion")
        return MOVE_MOTION;
    if (name == "gait")
        return MOVE_GAIT;
    return MOVE_CUSTOM;
}

GaitType MovementController::parseGaitType(const std::string &name) {
    if (name == "2" || name == "wave")
        return WAVE_GAIT;
    return TRIPOD_GAIT;
}

CommandResult MovementController::move(MoveMode mode, double x, double y, int speed, double angle, GaitType gait,
                                       double duration) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!isAvailable())
        return notAvailable("move");

    double mx = x, my = y, ma = angle;
    switch (mode) {
    case MOVE_FORWARD:
        mx = 0.0;
        my = MODE_STEP_MM;
        ma = 0.0;
        break;
    case MOVE_BACKWARD:
        mx = 0.0;
        my = -MODE_STEP_MM;
        ma = 0.0;
        break;
    case MOVE_LEFT:
        mx = -MODE_STEP_MM;
        my = 0.0;
        ma = 0.0;
        break;
    case MOVE_RIGHT:
        mx = MODE_STEP_MM;
        my = 0.0;
        ma = 0.0;
        break;
    case MOVE_TURN_LEFT:
        mx = 0.0;
        my = 0.0;
        ma = MODE_TURN_DEG;
        break;
    case MOVE_TURN_RIGHT:
        mx = 0.0;
        my = 0.0;
        ma = -MODE_TURN_DEG;
        break;
    case MOVE_GAIT:
        my = 0.0;
        break;
    case MOVE_CUSTOM:
    case MOVE_MOTION:
        break;
    }

    if (mx == 0.0 && my == 0.0 && ma == 0.0) {
        std::cout << "[MovementController] Zero motion requested, stopping" << std::endl;
        moving_ = false;
        stopSupervisor();
        return standInternal();
    }

    const MotionLimits &lim = config_.limits;
    MotionParameters p;
    p.gait = gait;
    p.x = math_utils::clamped(mx, -lim.step_limit, lim.step_limit);
    p.y = math_utils::clamped(my, -lim.step_limit, lim.step_limit);
    p.angle = math_utils::clamped(ma, -lim.turn_limit, lim.turn_limit);
    p.speed = math_utils::clamped(speed, lim.min_speed, lim.max_speed);
    p.duration = duration;

    {
        std::lock_guard<std::mutex> state(state_mutex_);
        params_ = p;
        if (moving_) {
            std::cout << "[MovementController] Hot reload: " << gaitTypeName(p.gait) << " x=" << p.x
                      << " y=" << p.y << " speed=" << p.speed << " angle=" << p.angle << std::endl;
            return CommandResult::success();
        }
        moving_ = true;
    }

    // A previous supervisor may have ended on its own (duration or failure)
    if (supervisor_thread_.joinable())
        supervisor_thread_.join();

    supervisor_token_ = std::make_shared<CancellationToken>();
    supervisor_launches_++;
    std::cout << "[MovementController] Walking: " << gaitTypeName(p.gait) << " x=" << p.x << " y=" << p.y
              << " speed=" << p.speed << " angle=" << p.angle << std::endl;
    supervisor_thread_ = std::thread(&MovementController::supervisorLoop, this, supervisor_token_);
    return CommandResult::success();
}

void MovementController::supervisorLoop(std::shared_ptr<CancellationToken> token) {
    typedef std::chrono::steady_clock Clock;
    const Clock::time_point start = Clock::now();
    bool expired = false;

    while (moving_ && !token->isCancelled()) {
        MotionParameters p;
        {
            std::lock_guard<std::mutex> state(state_mutex_);
            double elapsed = std::chrono::duration<double>(Clock::now() - start).count();
            if (params_.duration > 0.0 && elapsed >= params_.duration) {
                moving_ = false;
                expired = true;
                break;
            }
            p = params_;
        }

        gait_.resetPoints();
        GaitExecutor::GaitCycleResult result = gait_.executeCycle(p.gait, p.x, p.y, p.speed, p.angle, token.get());
        if (result == GaitExecutor::CYCLE_CANCELLED)
            return;
        if (result == GaitExecutor::CYCLE_ABORTED) {
            {
                std::lock_guard<std::mutex> state(state_mutex_);
                moving_ = false;
            }
            std::cerr << "[MovementController] Gait cycle aborted, walking stopped" << std::endl;
            return;
        }

        cycles_completed_++;
        if (config_.verbose_logging) {
            std::cout << "[MovementController] Cycle " << cycles_completed_.load() << " complete" << std::endl;
        }
        if (!token->sleepFor(config_.timing.cycle_pause))
            return;
    }

    if (expired) {
        std::cout << "[MovementController] Walk duration reached, standing" << std::endl;
        CommandResult r = standInternal();
        if (!r.ok)
            std::cerr << "[MovementController] Stand after walk failed: " << r.message << std::endl;
    }
}

void MovementController::stopSupervisor() {
    if (supervisor_token_)
        supervisor_token_->cancel();
    if (supervisor_thread_.joinable())
        supervisor_thread_.join();
    supervisor_token_.reset();
}

CommandResult MovementController::stop() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!isAvailable())
        return notAvailable("stop");

    moving_ = false;
    stopSupervisor();
    std::cout << "[MovementController] Stopped" << std::endl;
    return standInternal();
}

// ---------------------------------------------------------------------------
// Direct pose commands
// ---------------------------------------------------------------------------

CommandResult MovementController::setPosition(double x, double y, double z) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!isAvailable())
        return notAvailable("setPosition");
    if (moving_) {
        CommandResult r = CommandResult::failure(STATE_ERROR, "setPosition: robot is walking");
        recordError(r);
        return r;
    }

    const MotionLimits &lim = config_.limits;
    x = math_utils::clamped(x, -lim.body_shift_xy, lim.body_shift_xy);
    y = math_utils::clamped(y, -lim.body_shift_xy, lim.body_shift_xy);
    z = math_utils::clamped(z, -lim.body_shift_z, lim.body_shift_z);

    std::cout << "[MovementController] Body position x=" << x << " y=" << y << " z=" << z << std::endl;
    CommandResult failure;
    if (!emitPose(translatedPose(neutral_pose_, x, y, z), &failure))
        return failure;
    return CommandResult::success();
}

CommandResult MovementController::applyAttitude(double roll, double pitch, double yaw) {
    const double limit = config_.limits.attitude_limit;
    roll = math_utils::clamped(roll, -limit, limit);
    pitch = math_utils::clamped(pitch, -limit, limit);
    yaw = math_utils::clamped(yaw, -limit, limit);

    CommandResult failure;
    if (!emitPose(attitudePose(neutral_pose_, roll, pitch, yaw), &failure))
        return failure;
    return CommandResult::success();
}

CommandResult MovementController::setAttitude(double roll, double pitch, double yaw) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!isAvailable())
        return notAvailable("setAttitude");
    if (balancing_) {
        CommandResult r = CommandResult::failure(STATE_ERROR, "setAttitude: balance mode owns the attitude");
        recordError(r);
        return r;
    }
    if (moving_) {
        CommandResult r = CommandResult::failure(STATE_ERROR, "setAttitude: robot is walking");
        recordError(r);
        return r;
    }

    std::cout << "[MovementController] Attitude roll=" << roll << " pitch=" << pitch << " yaw=" << yaw << std::endl;
    CommandResult r = applyAttitude(roll, pitch, yaw);
    if (r.ok && config_.timing.attitude_settle > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(config_.timing.attitude_settle));
    }
    return r;
}

// ---------------------------------------------------------------------------
// Balance
// ---------------------------------------------------------------------------

CommandResult MovementController::setBalanceMode(bool enabled) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!isAvailable())
        return notAvailable("setBalanceMode");

    if (enabled) {
        if (balancing_ && balance_thread_.joinable())
            return CommandResult::success();
        if (!imu_ || !imu_->isAvailable()) {
            CommandResult r = CommandResult::failure(SENSOR_ERROR, "setBalanceMode: no IMU available");
            recordError(r);
            return r;
        }

        // A loop that gave up after a write failure is still joinable
        stopBalance();

        pid_roll_.setGains(config_.balance.kp, config_.balance.ki, config_.balance.kd);
        pid_pitch_.setGains(config_.balance.kp, config_.balance.ki, config_.balance.kd);
        pid_roll_.reset();
        pid_pitch_.reset();

        balancing_ = true;
        balance_token_ = std::make_shared<CancellationToken>();
        balance_thread_ = std::thread(&MovementController::balanceLoop, this, balance_token_);
        std::cout << "[MovementController] Balance mode enabled" << std::endl;
        return CommandResult::success();
    }

    if (!balancing_ && !balance_thread_.joinable())
        return CommandResult::success();

    balancing_ = false;
    stopBalance();
    std::cout << "[MovementController] Balance mode disabled" << std::endl;
    if (moving_)
        return CommandResult::success();
    return standInternal();
}

void MovementController::stopBalance() {
    if (balance_token_)
        balance_token_->cancel();
    if (balance_thread_.joinable())
        balance_thread_.join();
    balance_token_.reset();
}

void MovementController::balanceLoop(std::shared_ptr<CancellationToken> token) {
    using math_utils::radiansToDegrees;

    while (balancing_ && !token->isCancelled()) {
        AccelerationData a = imu_->readAcceleration();
        if (a.is_valid) {
            double roll = radiansToDegrees(atan2(a.y, a.z));
            double pitch = radiansToDegrees(atan2(-a.x, sqrt(a.y * a.y + a.z * a.z)));
            double adj_roll = pid_roll_.update(roll);
            double adj_pitch = pid_pitch_.update(pitch);

            // The gait owns the actuators while walking
            if (!moving_) {
                CommandResult r = applyAttitude(adj_roll, adj_pitch, 0.0);
                if (!r.ok) {
                    std::cerr << "[MovementController] Balance correction failed, balance mode disabled"
                              << std::endl;
                    balancing_ = false;
                    return;
                }
            }
        } else if (config_.verbose_logging) {
            std::cout << "[MovementController] Invalid IMU sample skipped" << std::endl;
        }

        if (!token->sleepFor(config_.balance.interval))
            return;
    }
}

// ---------------------------------------------------------------------------
// Calibration
// ---------------------------------------------------------------------------

CommandResult MovementController::recalibrate(const BodyPose &calibration_points) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (moving_) {
        CommandResult r = CommandResult::failure(STATE_ERROR, "recalibrate: robot is walking");
        recordError(r);
        return r;
    }

    int offsets[NUM_LEGS][DOF_PER_LEG];
    int failed_leg = -1;
    if (!computeCalibrationOffsets(config_, calibration_points, offsets, &failed_leg)) {
        CommandResult r = CommandResult::failure(UNREACHABLE_TARGET,
                                                 "recalibrate: calibration point of leg " +
                                                     std::to_string(failed_leg) + " is out of reach",
                                                 failed_leg);
        recordError(r);
        return r;
    }

    {
        std::lock_guard<std::mutex> actuators(actuator_mutex_);
        for (int i = 0; i < NUM_LEGS; ++i) {
            for (int j = 0; j < DOF_PER_LEG; ++j) {
                config_.legs[i].offsets[j] = offsets[i][j];
            }
        }
    }
    std::cout << "[MovementController] Calibration offsets updated" << std::endl;

    if (isAvailable() && !balancing_)
        return standInternal();
    return CommandResult::success();
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

void MovementController::recordError(const CommandResult &result) {
    std::lock_guard<std::mutex> state(state_mutex_);
    last_error_ = result.code;
    last_error_message_ = result.message;
}

ErrorCode MovementController::getLastError() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return last_error_;
}

std::string MovementController::getLastErrorMessage() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return last_error_message_;
}

MovementController::MotionParameters MovementController::getMotionParameters() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return params_;
}

MovementController::MovementStatus MovementController::getStatus() const {
    MovementStatus status;
    status.initialized = initialized_.load();
    status.available = isAvailable();
    status.moving = moving_.load();
    status.balancing = balancing_.load();
    status.cycles_completed = cycles_completed_.load();
    status.supervisor_launches = supervisor_launches_.load();
    status.frames_emitted = frames_emitted_.load();
    status.unreachable_legs = unreachable_legs_.load();

    std::lock_guard<std::mutex> state(state_mutex_);
    status.parameters = params_;
    status.last_error = last_error_;
    status.last_error_message = last_error_message_;
    status.current_pose = current_pose_;
    return status;
}
