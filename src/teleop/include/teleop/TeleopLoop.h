#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "math_lib/Vector.h"

#include "common/ParameterServer.h"
#include "common/SharedLogger.h"

#include "filters/DeadbandDetector.h"
#include "filters/ISS.h"
#include "filters/PID.h"
#include "filters/TDPA.h"
#include "filters/WAVE.h"

#include "teleop/DelayLine.h"

namespace haptic_toolbox
{
    namespace teleop
    {
        using Vec3 = math::Vector<double, 3>;

        /// Master -> slave sample. WAVE mode only sends the master wave u_m.
        struct ForwardPacket
        {
            Vec3 position;
            Vec3 velocity;
            Vec3 wave;
        };

        /// Slave -> master sample. WAVE mode only sends the slave wave u_s.
        struct BackwardPacket
        {
            Vec3 force;
            Vec3 wave;
        };

        struct TeleopStats
        {
            std::uint64_t ticks           = 0;
            std::uint64_t forwardPackets  = 0; // samples that left the master deadband
            std::uint64_t backwardPackets = 0; // samples that left the slave deadband
            double        peakMasterForce = 0.0;
            double        maxTrackingError = 0.0;
            double        tdpaEnergy      = 0.0;
            bool          nonFinite       = false;
        };

        /**
         * @brief Simulated bilateral teleoperation loop.
         *
         * Wires the filters the way a master/slave application does:
         *
         *  - master: scripted operator motion on axes 0/1, renders the force
         *    returned by the slave (raw, TDPA-, ISS- or WAVE-processed)
         *  - forward channel: position/velocity deadband with zero-order hold,
         *    constant delay
         *  - slave: unit mass driven by a PID tracker, virtual wall on axis 0
         *  - backward channel: force deadband with zero-order hold, constant delay
         *
         * In WAVE mode the channel carries a single wave per direction. Each
         * site builds its outgoing wave from the wave it receives: the master
         * from its velocity, the slave from its coupling force and velocity
         * reference. Wave reflections make the rendered force depend on the
         * delay. The deadbands act on the waves.
         *
         * Each site logs to its own ring; nothing is printed here.
         */
        class TeleopLoop
        {
        public:
            TeleopLoop(const common::ParameterServer &params,
                       common::multi_ring_logger_memory *loggerMem);

            ~TeleopLoop();

            TeleopLoop(const TeleopLoop &)            = delete;
            TeleopLoop &operator=(const TeleopLoop &) = delete;

            /**
             * @brief Build the filters from the parameters.
             *
             * @return false (and an error on the system ring) if a gain is
             *         rejected by its filter.
             */
            bool init();

            /**
             * @brief Advance one sample tick.
             *
             * @return false if not initialized or if a non-finite value appeared.
             */
            bool step();

            /// Run the configured number of ticks, stopping at the first failure.
            const TeleopStats &run();

            const TeleopStats &stats() const noexcept { return stats_; }
            common::TeleopMode mode() const noexcept { return params_.loop.mode; }

            const Vec3 &masterPosition() const noexcept { return masterPos_; }
            const Vec3 &masterVelocity() const noexcept { return masterVel_; }
            const Vec3 &masterForce() const noexcept { return masterForce_; }
            const Vec3 &slavePosition() const noexcept { return slavePos_; }
            const Vec3 &slaveVelocity() const noexcept { return slaveVel_; }
            const Vec3 &environmentForce() const noexcept { return envForce_; }

        private:
            void moveOperator(double t);
            void renderMasterForce();
            void sendForward();
            void updateSlave(const ForwardPacket &delivered);
            Vec3 waveVelocityReference(const Vec3 &waveIn) const;
            void sendBackward();
            bool checkFinite();

            common::ParameterServer params_;
            common::multi_ring_logger_memory *loggerMem_ = nullptr;

            bool initialized_ = false;
            std::uint64_t tick_ = 0;

            // Filters
            std::unique_ptr<filters::DeadbandDetector<double, 3>> positionDeadband_;
            std::unique_ptr<filters::DeadbandDetector<double, 3>> velocityDeadband_;
            std::unique_ptr<filters::DeadbandDetector<double, 3>> forceDeadband_;
            std::unique_ptr<filters::TDPA<double, 3>> tdpa_;
            std::unique_ptr<filters::ISS<double, 3>>  iss_;
            std::unique_ptr<filters::WAVE<double, 3>> wave_;
            std::unique_ptr<filters::PID<double, 3>>  pid_;

            // Channel
            std::unique_ptr<DelayLine<ForwardPacket>>  forward_;
            std::unique_ptr<DelayLine<BackwardPacket>> backward_;
            ForwardPacket  heldForward_{};
            BackwardPacket heldBackward_{};

            // Master site
            Vec3 masterPos_;
            Vec3 masterVel_;
            Vec3 masterForce_;
            Vec3 forwardVel_;     // velocity put on the channel (ISS-shaped in ISS mode)
            Vec3 receivedForce_;  // force from the backward channel
            Vec3 receivedWave_;   // u_s as it arrives at the master (WAVE)
            Vec3 masterWave_;     // u_m

            // Slave site
            Vec3 slaveRefPos_;
            Vec3 slavePos_;
            Vec3 slaveVel_;
            Vec3 envForce_;
            Vec3 slaveWave_;      // u_s
            bool inContact_ = false;

            TeleopStats stats_{};
        };

    } // namespace teleop
} // namespace haptic_toolbox
