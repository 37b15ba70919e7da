#pragma once

#include <cstdint>

namespace haptic_toolbox
{
    namespace common
    {
        // ===========================================
        // How the master renders the returned force
        // ===========================================
        enum class TeleopMode : int
        {
            DIRECT = 0, ///< Delayed slave force rendered as-is
            TDPA,       ///< Force passed through the passivity controller
            ISS,        ///< Force/velocity passed through the ISS compensator
            WAVE        ///< Wave variables exchanged instead of raw samples
        };

        // ===========================================
        // Site owning a log ring
        // ===========================================
        enum class LogSite : std::uint8_t
        {
            MASTER = 0,
            SLAVE,
            SYSTEM
        };

        const char *toString(TeleopMode mode) noexcept;
        const char *toString(LogSite site) noexcept;

    } // namespace common
} // namespace haptic_toolbox
