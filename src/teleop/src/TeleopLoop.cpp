#include "teleop/TeleopLoop.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace haptic_toolbox
{
    namespace teleop
    {
        using common::LogSite;
        using common::TeleopMode;

        namespace
        {
            constexpr double kPi = 3.14159265358979323846;

            // Log codes
            constexpr int LOG_INIT_OK        = 100;
            constexpr int LOG_INIT_REJECTED  = 101;
            constexpr int LOG_NOT_INITIALIZED = 102;
            constexpr int LOG_CONTACT        = 110;
            constexpr int LOG_NON_FINITE     = 120;
            constexpr int LOG_RUN_DONE       = 130;
        } // namespace

        //----------------------------------------------------------------------------
        // Constructor / Destructor
        //----------------------------------------------------------------------------
        TeleopLoop::TeleopLoop(const common::ParameterServer &params,
                               common::multi_ring_logger_memory *loggerMem)
            : params_(params),
              loggerMem_(loggerMem)
        {
        }

        TeleopLoop::~TeleopLoop() = default;

        //----------------------------------------------------------------------------
        // Initialization
        //----------------------------------------------------------------------------
        bool TeleopLoop::init()
        {
            initialized_ = false;

            try
            {
                const Vec3 zero = Vec3::Zero();

                positionDeadband_ = std::make_unique<filters::DeadbandDetector<double, 3>>(
                    params_.deadband.position_threshold, zero);
                velocityDeadband_ = std::make_unique<filters::DeadbandDetector<double, 3>>(
                    params_.deadband.velocity_threshold, zero);
                forceDeadband_ = std::make_unique<filters::DeadbandDetector<double, 3>>(
                    params_.deadband.force_threshold, zero);

                tdpa_ = std::make_unique<filters::TDPA<double, 3>>(params_.tdpa.min_velocity_sq);
                iss_  = std::make_unique<filters::ISS<double, 3>>(params_.iss.tau, params_.iss.mu_max);
                wave_ = std::make_unique<filters::WAVE<double, 3>>(params_.wave.impedance);
                pid_  = std::make_unique<filters::PID<double, 3>>(
                    params_.pid.k_p, params_.pid.k_i, params_.pid.k_d);
            }
            catch (const std::invalid_argument &ex)
            {
                common::log_error(loggerMem_, LogSite::SYSTEM, LOG_INIT_REJECTED, ex.what());
                return false;
            }

            if (!(params_.loop.dt > 0.0) || params_.loop.delay_ticks < 0)
            {
                common::log_error(loggerMem_, LogSite::SYSTEM, LOG_INIT_REJECTED,
                                  "[Teleop] dt must be > 0 and delay_ticks >= 0");
                return false;
            }

            const auto delay = static_cast<std::size_t>(params_.loop.delay_ticks);
            forward_  = std::make_unique<DelayLine<ForwardPacket>>(delay, ForwardPacket{});
            backward_ = std::make_unique<DelayLine<BackwardPacket>>(delay, BackwardPacket{});
            heldForward_  = ForwardPacket{};
            heldBackward_ = BackwardPacket{};

            masterPos_.setZero();
            masterVel_.setZero();
            masterForce_.setZero();
            forwardVel_.setZero();
            receivedForce_.setZero();
            receivedWave_.setZero();
            masterWave_.setZero();
            slaveRefPos_.setZero();
            slavePos_.setZero();
            slaveVel_.setZero();
            envForce_.setZero();
            slaveWave_.setZero();
            inContact_ = false;

            tick_  = 0;
            stats_ = TeleopStats{};

            char text[128];
            std::snprintf(text, sizeof(text), "[Teleop] init mode=%s dt=%.4f delay=%d",
                          common::toString(params_.loop.mode), params_.loop.dt,
                          params_.loop.delay_ticks);
            common::log_info(loggerMem_, LogSite::SYSTEM, LOG_INIT_OK, text);

            initialized_ = true;
            return true;
        }

        //----------------------------------------------------------------------------
        // Cycle
        //----------------------------------------------------------------------------
        bool TeleopLoop::step()
        {
            if (!initialized_)
            {
                common::log_error(loggerMem_, LogSite::SYSTEM, LOG_NOT_INITIALIZED,
                                  "[Teleop] step() called before init()");
                return false;
            }

            const double t = static_cast<double>(tick_) * params_.loop.dt;

            // 1) Master site
            moveOperator(t);
            renderMasterForce();

            // 2) Forward channel -> slave
            sendForward();
            const ForwardPacket delivered = forward_->push(heldForward_);
            updateSlave(delivered);

            // 3) Backward channel -> master (rendered next tick)
            sendBackward();

            ++tick_;
            stats_.ticks = tick_;
            stats_.peakMasterForce  = std::max(stats_.peakMasterForce, masterForce_.norm());
            stats_.maxTrackingError = std::max(stats_.maxTrackingError,
                                               (masterPos_ - slavePos_).norm());
            stats_.tdpaEnergy = tdpa_->energy();

            return checkFinite();
        }

        const TeleopStats &TeleopLoop::run()
        {
            const auto ticks = static_cast<std::uint64_t>(std::max(params_.loop.ticks, 0));
            while (tick_ < ticks)
            {
                if (!step())
                {
                    break;
                }
            }

            char text[128];
            std::snprintf(text, sizeof(text), "[Teleop] run done ticks=%llu fwd=%llu bwd=%llu",
                          static_cast<unsigned long long>(stats_.ticks),
                          static_cast<unsigned long long>(stats_.forwardPackets),
                          static_cast<unsigned long long>(stats_.backwardPackets));
            common::log_info(loggerMem_, LogSite::SYSTEM, LOG_RUN_DONE, text);

            return stats_;
        }

        //----------------------------------------------------------------------------
        // Master
        //----------------------------------------------------------------------------
        void TeleopLoop::moveOperator(double t)
        {
            const double w     = 2.0 * kPi * params_.environment.operator_frequency;
            const double speed = params_.environment.operator_amplitude * w * std::cos(w * t);

            masterVel_ = Vec3{speed, 0.5 * speed, 0.0};
            masterPos_ += masterVel_ * params_.loop.dt;
            forwardVel_ = masterVel_;
        }

        void TeleopLoop::renderMasterForce()
        {
            switch (params_.loop.mode)
            {
            case TeleopMode::DIRECT:
                masterForce_ = receivedForce_;
                break;

            case TeleopMode::TDPA:
                // The passivity observer books power flowing into the channel,
                // i.e. the operator's force on the device: -rendered force.
                masterForce_ = -tdpa_->calculateForce(masterVel_, -receivedForce_);
                break;

            case TeleopMode::ISS:
                // calculateVel() needs the force derivative, so it runs before
                // calculateForce() stores the new sample.
                forwardVel_   = iss_->calculateVel(masterVel_, receivedForce_, params_.loop.dt);
                masterForce_  = iss_->calculateForce(receivedForce_, params_.loop.dt);
                break;

            case TeleopMode::WAVE:
            {
                // The operator imposes the velocity: the incoming wave v_m and
                // x_m' fix the force f_m the device puts into the channel,
                // and u_m = v_m + sqrt(2b)·x_m'.
                const double b = wave_->b();
                const Vec3 channelForce = receivedWave_ * std::sqrt(2.0 * b) + masterVel_ * b;
                masterWave_  = wave_->calculateUM(channelForce, masterVel_);
                masterForce_ = -channelForce;
                break;
            }
            }
        }

        void TeleopLoop::sendForward()
        {
            if (params_.loop.mode == TeleopMode::WAVE)
            {
                if (!velocityDeadband_->isInDeadband(masterWave_))
                {
                    heldForward_.wave = masterWave_;
                    ++stats_.forwardPackets;
                }
                return;
            }

            // Both detectors must see the sample, no short-circuit.
            const bool positionMoved = !positionDeadband_->isInDeadband(masterPos_);
            const bool velocityMoved = !velocityDeadband_->isInDeadband(forwardVel_);
            if (!positionMoved && !velocityMoved)
            {
                return; // zero-order hold: keep re-sending the last packet
            }

            // One packet carries both, so both references follow it.
            positionDeadband_->setPrevVals(masterPos_);
            velocityDeadband_->setPrevVals(forwardVel_);

            heldForward_.position = masterPos_;
            heldForward_.velocity = forwardVel_;
            ++stats_.forwardPackets;
        }

        //----------------------------------------------------------------------------
        // Slave
        //----------------------------------------------------------------------------
        void TeleopLoop::updateSlave(const ForwardPacket &delivered)
        {
            const double dt = params_.loop.dt;

            Vec3 refPos = delivered.position;
            Vec3 refVel = delivered.velocity;
            if (params_.loop.mode == TeleopMode::WAVE)
            {
                // Waves carry no position; the slave integrates its own reference.
                refVel = waveVelocityReference(delivered.wave);
                slaveRefPos_ += refVel * dt;
                refPos = slaveRefPos_;
            }

            const Vec3 command = pid_->calculateForce(refPos, slavePos_, refVel, slaveVel_, dt);
            if (params_.loop.mode == TeleopMode::WAVE)
            {
                slaveWave_ = wave_->calculateUS(command, refVel);
            }

            envForce_.setZero();
            const double penetration = slavePos_[0] - params_.environment.wall_position;
            const bool contact = penetration > 0.0;
            if (contact)
            {
                envForce_[0] = -params_.environment.wall_stiffness * penetration;
            }
            if (contact != inContact_)
            {
                common::log_debug(loggerMem_, LogSite::SLAVE, LOG_CONTACT,
                                  contact ? "[Slave] wall contact" : "[Slave] wall released");
                inContact_ = contact;
            }

            // Unit mass, semi-implicit Euler.
            slaveVel_ += (command + envForce_) * dt;
            slavePos_ += slaveVel_ * dt;
        }

        void TeleopLoop::sendBackward()
        {
            if (params_.loop.mode == TeleopMode::WAVE)
            {
                if (!forceDeadband_->isInDeadband(slaveWave_))
                {
                    heldBackward_.wave = slaveWave_;
                    ++stats_.backwardPackets;
                }
                receivedWave_ = backward_->push(heldBackward_).wave;
                return;
            }

            if (!forceDeadband_->isInDeadband(envForce_))
            {
                heldBackward_.force = envForce_;
                ++stats_.backwardPackets;
            }
            receivedForce_ = backward_->push(heldBackward_).force;
        }

        Vec3 TeleopLoop::waveVelocityReference(const Vec3 &waveIn) const
        {
            // The incoming wave fixes v_s = (f_s + b·x_sd') / sqrt(2b), and the
            // coupling force f_s is the PID output for that same reference.
            // Both are linear in x_sd', so solve for it before stepping the PID.
            const double dt   = params_.loop.dt;
            const double b    = wave_->b();
            const double kP   = pid_->kP() + pid_->kI() * dt;
            const double kD   = pid_->kD();

            const Vec3 freeVel = waveIn * (std::sqrt(2.0 * b) / b);
            const Vec3 error   = slaveRefPos_ - slavePos_ + freeVel * dt;
            const Vec3 force   = (error * kP + pid_->integralError() * pid_->kI() +
                                  (freeVel - slaveVel_) * kD) /
                               (1.0 + (kP * dt + kD) / b);
            return freeVel - force / b;
        }

        bool TeleopLoop::checkFinite()
        {
            if (masterForce_.allFinite() && slavePos_.allFinite() && slaveVel_.allFinite())
            {
                return true;
            }

            stats_.nonFinite = true;
            char text[128];
            std::snprintf(text, sizeof(text), "[Teleop] non-finite state at tick %llu",
                          static_cast<unsigned long long>(tick_));
            common::log_error(loggerMem_, LogSite::MASTER, LOG_NON_FINITE, text);
            return false;
        }

    } // namespace teleop
} // namespace haptic_toolbox
