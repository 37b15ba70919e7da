#include "common/Enums.h"

namespace haptic_toolbox
{
    namespace common
    {
        const char *toString(TeleopMode mode) noexcept
        {
            switch (mode)
            {
            case TeleopMode::DIRECT: return "direct";
            case TeleopMode::TDPA:   return "tdpa";
            case TeleopMode::ISS:    return "iss";
            case TeleopMode::WAVE:   return "wave";
            }
            return "unknown";
        }

        const char *toString(LogSite site) noexcept
        {
            switch (site)
            {
            case LogSite::MASTER: return "Master";
            case LogSite::SLAVE:  return "Slave";
            case LogSite::SYSTEM: return "System";
            }
            return "Unknown";
        }

    } // namespace common
} // namespace haptic_toolbox
