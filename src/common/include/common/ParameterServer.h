#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

#include "common/Enums.h"

namespace haptic_toolbox
{
    namespace common
    {
        constexpr std::uint32_t PARAM_SERVER_MAGIC   = 0x48545053; // 'HTPS'
        constexpr std::uint32_t PARAM_SERVER_VERSION = 1;

        // -------------------------------------------------------------------------
        // 1) Control loop
        // -------------------------------------------------------------------------
        struct LoopConfig
        {
            double     dt          = 0.001;  // s
            int        ticks       = 5000;
            int        delay_ticks = 20;     // one-way channel delay in samples
            TeleopMode mode        = TeleopMode::TDPA;
        };

        // -------------------------------------------------------------------------
        // 2) Filter / compensator gains
        // -------------------------------------------------------------------------
        struct DeadbandConfig
        {
            double force_threshold    = 0.1;
            double velocity_threshold = 0.1;
            double position_threshold = 0.1;
        };

        struct IssConfig
        {
            double tau    = 0.005;
            double mu_max = 2500.0; // keep >= environment stiffness
        };

        struct WaveConfig
        {
            double impedance = 10.0;
        };

        struct TdpaConfig
        {
            double min_velocity_sq = 1e-12;
        };

        struct PidConfig
        {
            double k_p = 400.0;
            double k_i = 0.0;
            double k_d = 40.0;
        };

        // -------------------------------------------------------------------------
        // 3) Simulated operator and environment
        // -------------------------------------------------------------------------
        struct EnvironmentConfig
        {
            double wall_position      = 0.02;   // m, on axis 0
            double wall_stiffness     = 2000.0; // N/m
            double operator_amplitude = 0.05;   // m
            double operator_frequency = 0.5;    // Hz
        };

        // -------------------------------------------------------------------------
        // 4) Aggregated Parameter Server
        // -------------------------------------------------------------------------
        struct ParameterServer
        {
            std::uint32_t magic   = PARAM_SERVER_MAGIC;
            std::uint32_t version = PARAM_SERVER_VERSION;

            LoopConfig        loop{};
            DeadbandConfig    deadband{};
            IssConfig         iss{};
            WaveConfig        wave{};
            TdpaConfig        tdpa{};
            PidConfig         pid{};
            EnvironmentConfig environment{};
        };

        /**
         * @brief Load a ParameterServer from a JSON file.
         *
         * Missing sections/keys keep their defaults.
         *
         * @throws std::runtime_error if the file cannot be opened or parsed, or
         *         a value is out of its domain.
         */
        ParameterServer parseParameterServer(const std::string& configFile);

        /// Same as parseParameterServer() but from an in-memory JSON document.
        ParameterServer parseParameterServerFromString(const std::string& jsonText);

        /// @throws std::runtime_error for an unknown mode name.
        TeleopMode parseTeleopMode(const std::string& modeStr);

        static_assert(std::is_trivially_copyable<ParameterServer>::value,
                      "ParameterServer must stay a plain value type");

    } // namespace common
} // namespace haptic_toolbox
