#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "common/Enums.h"

namespace haptic_toolbox
{
    namespace common
    {
        // =============================
        // 1) Basic Log Definitions
        // =============================
        enum class shared_log_level : int
        {
            debug = 0,
            info,
            warn,
            error
        };

        struct shared_log_message
        {
            uint64_t         timestamp;  // nanoseconds since steady_clock epoch
            shared_log_level level;
            int              code;
            uint32_t         text_length = 0; // bytes valid in text
            char             text[128];   // short text, truncated if longer
        };

        // =============================
        // 2) Single Ring Buffer (SPSC)
        // =============================
        constexpr std::size_t log_buffer_size = 1024;

        struct logger_ring
        {
            shared_log_message buffer[log_buffer_size];
            std::atomic<size_t> head {0}; // producer
            std::atomic<size_t> tail {0}; // consumer
            std::atomic<uint64_t> dropped {0}; // number of messages overwritten
        };

        // A full ring overwrites its oldest entry and counts a drop.
        inline void push_log_message(logger_ring* ring, const shared_log_message& msg)
        {
            size_t head      = ring->head.load(std::memory_order_relaxed);
            size_t next_head = (head + 1) % log_buffer_size;

            ring->buffer[head] = msg;
            ring->head.store(next_head, std::memory_order_release);

            if (next_head == ring->tail.load(std::memory_order_acquire))
            {
                size_t old_tail = (ring->tail.load(std::memory_order_relaxed) + 1) % log_buffer_size;
                ring->tail.store(old_tail, std::memory_order_release);
                ring->dropped.fetch_add(1, std::memory_order_relaxed);
            }
        }

        inline bool pop_log_message(logger_ring* ring, shared_log_message& out_msg)
        {
            size_t tail = ring->tail.load(std::memory_order_relaxed);
            size_t head = ring->head.load(std::memory_order_acquire);
            if (tail == head)
            {
                return false;
            }
            out_msg = ring->buffer[tail];
            size_t next_tail = (tail + 1) % log_buffer_size;
            ring->tail.store(next_tail, std::memory_order_release);
            return true;
        }

        // =============================
        // 3) Multi-Ring Layout, one ring per site
        // =============================
        struct multi_ring_logger_memory
        {
            static constexpr uint32_t MAGIC = 0x48544C47; // 'HTLG'
            static constexpr uint32_t VERSION = 1;

            uint32_t magic = MAGIC;
            uint32_t version = VERSION;
            logger_ring master_ring;
            logger_ring slave_ring;
            logger_ring system_ring;
        };

        inline logger_ring* ring_for_site(multi_ring_logger_memory* multi, LogSite site) noexcept
        {
            switch (site)
            {
            case LogSite::MASTER: return &multi->master_ring;
            case LogSite::SLAVE:  return &multi->slave_ring;
            case LogSite::SYSTEM: return &multi->system_ring;
            }
            return &multi->system_ring;
        }

        inline void push_site_log(multi_ring_logger_memory* multi, LogSite site, const shared_log_message& msg)
        {
            push_log_message(ring_for_site(multi, site), msg);
        }

        inline bool pop_site_log(multi_ring_logger_memory* multi, LogSite site, shared_log_message& out_msg)
        {
            return pop_log_message(ring_for_site(multi, site), out_msg);
        }

        // =============================
        // 4) Generic Logging Helpers
        // =============================

        // A null logger is accepted and ignored, so components can run unlogged.
        inline void log_message(multi_ring_logger_memory* multi,
                                LogSite site,
                                shared_log_level level,
                                int code,
                                const char* text)
        {
            if (multi == nullptr)
            {
                return;
            }

            shared_log_message msg{};
            auto now = std::chrono::steady_clock::now().time_since_epoch();
            msg.timestamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
            msg.level     = level;
            msg.code      = code;
            std::strncpy(msg.text, text, sizeof(msg.text) - 1);
            msg.text[sizeof(msg.text) - 1] = '\0';
            msg.text_length = static_cast<uint32_t>(std::strlen(msg.text));

            push_site_log(multi, site, msg);
        }

        inline void log_debug(multi_ring_logger_memory* multi, LogSite site, int code, const char* text)
        {
            log_message(multi, site, shared_log_level::debug, code, text);
        }

        inline void log_info(multi_ring_logger_memory* multi, LogSite site, int code, const char* text)
        {
            log_message(multi, site, shared_log_level::info, code, text);
        }

        inline void log_warn(multi_ring_logger_memory* multi, LogSite site, int code, const char* text)
        {
            log_message(multi, site, shared_log_level::warn, code, text);
        }

        inline void log_error(multi_ring_logger_memory* multi, LogSite site, int code, const char* text)
        {
            log_message(multi, site, shared_log_level::error, code, text);
        }

        static_assert(std::is_trivially_copyable<shared_log_message>::value,
                      "shared_log_message must be trivially copyable");

    } // namespace common
} // namespace haptic_toolbox
