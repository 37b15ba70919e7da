#include "common/LogDrain.h"

#ifdef HAPTIC_TOOLBOX_USE_SYSTEMD_JOURNAL
#include <systemd/sd-journal.h>
#endif

namespace haptic_toolbox
{
    namespace common
    {
        namespace
        {
#ifdef HAPTIC_TOOLBOX_USE_SYSTEMD_JOURNAL
            int to_journal_priority(shared_log_level level)
            {
                // syslog/journald priorities:
                // 0=emerg, 1=alert, 2=crit, 3=err, 4=warning, 5=notice, 6=info, 7=debug
                switch (level)
                {
                case shared_log_level::debug: return 7;
                case shared_log_level::info:  return 6;
                case shared_log_level::warn:  return 4;
                case shared_log_level::error: return 3;
                default:                      return 6;
                }
            }
#endif

            constexpr LogSite kSites[] = {LogSite::MASTER, LogSite::SLAVE, LogSite::SYSTEM};
        } // namespace

        void emit_log(LogSite site, const shared_log_message& msg, std::ostream& out)
        {
            double ts_ms = static_cast<double>(msg.timestamp) / 1e6;

#ifdef HAPTIC_TOOLBOX_USE_SYSTEMD_JOURNAL
            (void)out;
            const int pri = to_journal_priority(msg.level);

            sd_journal_send("MESSAGE=%s",        msg.text,
                            "PRIORITY=%d",       pri,
                            "CODE=%d",           msg.code,
                            "SITE=%s",           toString(site),
                            "TIMESTAMP_MS=%.3f", ts_ms,
                            nullptr);
#else
            out << "[" << toString(site) << "] "
                << ts_ms << " ms "
                << "level=" << static_cast<int>(msg.level)
                << " code=" << msg.code
                << " msg=" << msg.text
                << '\n';
#endif
        }

        std::size_t drain_logs(multi_ring_logger_memory* multi, std::ostream& out)
        {
            if (multi == nullptr)
            {
                return 0;
            }

            std::size_t emitted = 0;
            shared_log_message msg{};
            for (LogSite site : kSites)
            {
                while (pop_site_log(multi, site, msg))
                {
                    emit_log(site, msg, out);
                    ++emitted;
                }
            }
            out.flush();
            return emitted;
        }

        std::uint64_t dropped_logs(const multi_ring_logger_memory* multi) noexcept
        {
            if (multi == nullptr)
            {
                return 0;
            }
            return multi->master_ring.dropped.load(std::memory_order_relaxed) +
                   multi->slave_ring.dropped.load(std::memory_order_relaxed) +
                   multi->system_ring.dropped.load(std::memory_order_relaxed);
        }

    } // namespace common
} // namespace haptic_toolbox
