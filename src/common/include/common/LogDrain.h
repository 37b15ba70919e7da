#pragma once

#include <cstddef>
#include <ostream>

#include "common/SharedLogger.h"

namespace haptic_toolbox
{
    namespace common
    {
        /**
         * @brief Emit one message.
         *
         * Goes to the systemd journal when built with
         * HAPTIC_TOOLBOX_USE_SYSTEMD_JOURNAL, otherwise to @p out as
         * "[Site] <ms> ms level=<n> code=<n> msg=<text>".
         */
        void emit_log(LogSite site, const shared_log_message& msg, std::ostream& out);

        /**
         * @brief Pop every ring (master, slave, system) and emit the messages.
         *
         * @return Number of messages emitted.
         */
        std::size_t drain_logs(multi_ring_logger_memory* multi, std::ostream& out);

        /// Total messages overwritten across all rings.
        std::uint64_t dropped_logs(const multi_ring_logger_memory* multi) noexcept;

    } // namespace common
} // namespace haptic_toolbox
