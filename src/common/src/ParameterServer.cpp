#include "common/ParameterServer.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <string>

namespace haptic_toolbox
{
    namespace common
    {
        using json = nlohmann::json;

        namespace
        {
            // ------------------------------------------------------------
            // Small helpers
            // ------------------------------------------------------------

            std::string toLowerCopy(const std::string& s)
            {
                std::string out = s;
                std::transform(out.begin(), out.end(), out.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return out;
            }

            void requirePositive(double value, const char* key)
            {
                if (!(value > 0.0) || !std::isfinite(value))
                {
                    throw std::runtime_error(std::string("Config value '") + key +
                                             "' must be a finite value > 0.");
                }
            }

            void requireNonNegative(double value, const char* key)
            {
                if (!(value >= 0.0) || !std::isfinite(value))
                {
                    throw std::runtime_error(std::string("Config value '") + key +
                                             "' must be a finite value >= 0.");
                }
            }

            // Whole counts only: fractional or out-of-range numbers are rejected
            // instead of being truncated or wrapped.
            int readCount(const json& section, const char* key, int fallback, const char* fullKey)
            {
                if (!section.contains(key))
                {
                    return fallback;
                }
                const json& value = section[key];

                constexpr std::int64_t lo = std::numeric_limits<int>::min();
                constexpr std::int64_t hi = std::numeric_limits<int>::max();
                const std::string what = std::string("Config value '") + fullKey + "'";

                if (value.is_number_unsigned())
                {
                    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(hi))
                    {
                        throw std::runtime_error(what + " is out of range.");
                    }
                    return static_cast<int>(value.get<std::uint64_t>());
                }
                if (value.is_number_integer())
                {
                    const std::int64_t n = value.get<std::int64_t>();
                    if (n < lo || n > hi)
                    {
                        throw std::runtime_error(what + " is out of range.");
                    }
                    return static_cast<int>(n);
                }
                if (value.is_number_float())
                {
                    const double d = value.get<double>();
                    if (!std::isfinite(d) || d != std::floor(d))
                    {
                        throw std::runtime_error(what + " must be a whole number.");
                    }
                    if (d < static_cast<double>(lo) || d > static_cast<double>(hi))
                    {
                        throw std::runtime_error(what + " is out of range.");
                    }
                    return static_cast<int>(d);
                }
                throw std::runtime_error(what + " must be an integer.");
            }

            // ---------------------------------------------------------------------
            // Section parsers
            // ---------------------------------------------------------------------

            void parseLoop(ParameterServer& ps, const json& j)
            {
                if (!j.contains("loop"))
                {
                    return;
                }
                const auto& loop = j["loop"];

                ps.loop.dt          = loop.value("dt", ps.loop.dt);
                ps.loop.ticks       = readCount(loop, "ticks", ps.loop.ticks, "loop.ticks");
                ps.loop.delay_ticks = readCount(loop, "delay_ticks", ps.loop.delay_ticks, "loop.delay_ticks");
                if (loop.contains("mode"))
                {
                    ps.loop.mode = parseTeleopMode(loop["mode"].get<std::string>());
                }

                requirePositive(ps.loop.dt, "loop.dt");
                if (ps.loop.ticks < 0)
                {
                    throw std::runtime_error("Config value 'loop.ticks' must be >= 0.");
                }
                if (ps.loop.delay_ticks < 0)
                {
                    throw std::runtime_error("Config value 'loop.delay_ticks' must be >= 0.");
                }
            }

            void parseGains(ParameterServer& ps, const json& j)
            {
                if (j.contains("deadband"))
                {
                    const auto& db = j["deadband"];
                    ps.deadband.force_threshold    = db.value("force_threshold", ps.deadband.force_threshold);
                    ps.deadband.velocity_threshold = db.value("velocity_threshold", ps.deadband.velocity_threshold);
                    ps.deadband.position_threshold = db.value("position_threshold", ps.deadband.position_threshold);
                }
                requireNonNegative(ps.deadband.force_threshold, "deadband.force_threshold");
                requireNonNegative(ps.deadband.velocity_threshold, "deadband.velocity_threshold");
                requireNonNegative(ps.deadband.position_threshold, "deadband.position_threshold");

                if (j.contains("iss"))
                {
                    const auto& iss = j["iss"];
                    ps.iss.tau    = iss.value("tau", ps.iss.tau);
                    ps.iss.mu_max = iss.value("mu_max", ps.iss.mu_max);
                }
                requireNonNegative(ps.iss.tau, "iss.tau");
                requirePositive(ps.iss.mu_max, "iss.mu_max");

                if (j.contains("wave"))
                {
                    ps.wave.impedance = j["wave"].value("impedance", ps.wave.impedance);
                }
                requirePositive(ps.wave.impedance, "wave.impedance");

                if (j.contains("tdpa"))
                {
                    ps.tdpa.min_velocity_sq = j["tdpa"].value("min_velocity_sq", ps.tdpa.min_velocity_sq);
                }
                requireNonNegative(ps.tdpa.min_velocity_sq, "tdpa.min_velocity_sq");

                if (j.contains("pid"))
                {
                    const auto& pid = j["pid"];
                    ps.pid.k_p = pid.value("k_p", ps.pid.k_p);
                    ps.pid.k_i = pid.value("k_i", ps.pid.k_i);
                    ps.pid.k_d = pid.value("k_d", ps.pid.k_d);
                }
            }

            void parseEnvironment(ParameterServer& ps, const json& j)
            {
                if (!j.contains("environment"))
                {
                    return;
                }
                const auto& env = j["environment"];
                ps.environment.wall_position      = env.value("wall_position", ps.environment.wall_position);
                ps.environment.wall_stiffness     = env.value("wall_stiffness", ps.environment.wall_stiffness);
                ps.environment.operator_amplitude = env.value("operator_amplitude", ps.environment.operator_amplitude);
                ps.environment.operator_frequency = env.value("operator_frequency", ps.environment.operator_frequency);

                requireNonNegative(ps.environment.wall_stiffness, "environment.wall_stiffness");
                requireNonNegative(ps.environment.operator_frequency, "environment.operator_frequency");
            }

            ParameterServer parseDocument(const json& j)
            {
                if (!j.is_object())
                {
                    throw std::runtime_error("Config root must be a JSON object.");
                }

                ParameterServer paramServer{};
                paramServer.magic   = PARAM_SERVER_MAGIC;
                paramServer.version = PARAM_SERVER_VERSION;

                try
                {
                    parseLoop(paramServer, j);
                    parseGains(paramServer, j);
                    parseEnvironment(paramServer, j);
                }
                catch (const json::exception& ex)
                {
                    // type_error / out_of_range from value()/get()
                    throw std::runtime_error(std::string("Config type error: ") + ex.what());
                }

                if (paramServer.loop.delay_ticks > paramServer.loop.ticks && paramServer.loop.ticks > 0)
                {
                    std::cerr << "Warning: loop.delay_ticks (" << paramServer.loop.delay_ticks
                              << ") exceeds loop.ticks (" << paramServer.loop.ticks
                              << "); no sample will cross the channel.\n";
                }

                return paramServer;
            }
        } // namespace

        TeleopMode parseTeleopMode(const std::string& modeStr)
        {
            const auto m = toLowerCopy(modeStr);
            if (m == "direct") return TeleopMode::DIRECT;
            if (m == "tdpa")   return TeleopMode::TDPA;
            if (m == "iss")    return TeleopMode::ISS;
            if (m == "wave")   return TeleopMode::WAVE;
            throw std::runtime_error("Unknown teleop mode: '" + modeStr + "'");
        }

        ParameterServer parseParameterServer(const std::string& configFile)
        {
            std::ifstream ifs(configFile);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Could not open teleop config: " + configFile);
            }

            json j;
            try
            {
                ifs >> j;
            }
            catch (const json::parse_error& ex)
            {
                throw std::runtime_error("Malformed teleop config " + configFile + ": " + ex.what());
            }

            return parseDocument(j);
        }

        ParameterServer parseParameterServerFromString(const std::string& jsonText)
        {
            json j;
            try
            {
                j = json::parse(jsonText);
            }
            catch (const json::parse_error& ex)
            {
                throw std::runtime_error(std::string("Malformed teleop config: ") + ex.what());
            }

            return parseDocument(j);
        }

    } // namespace common
} // namespace haptic_toolbox
