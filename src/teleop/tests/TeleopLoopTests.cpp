#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>

#include "common/ParameterServer.h"
#include "common/SharedLogger.h"
#include "teleop/DelayLine.h"
#include "teleop/TeleopLoop.h"

using namespace haptic_toolbox;
using common::TeleopMode;

namespace
{
    constexpr TeleopMode kModes[] = {TeleopMode::DIRECT, TeleopMode::TDPA,
                                     TeleopMode::ISS, TeleopMode::WAVE};

    common::ParameterServer shortRun(TeleopMode mode)
    {
        common::ParameterServer ps{};
        ps.loop.mode  = mode;
        ps.loop.ticks = 2000;
        return ps;
    }

    bool systemRingHasError(common::multi_ring_logger_memory* mem)
    {
        common::shared_log_message msg{};
        while (common::pop_site_log(mem, common::LogSite::SYSTEM, msg))
        {
            if (msg.level == common::shared_log_level::error)
            {
                return true;
            }
        }
        return false;
    }

    int delayLine()
    {
        teleop::DelayLine<int> line(3, -1);
        const int expected[] = {-1, -1, -1, 10, 11, 12};
        for (int i = 0; i < 6; ++i)
        {
            if (line.push(10 + i) != expected[i])
            {
                std::cerr << "DelayLine output mismatch at " << i << "\n";
                return 1;
            }
        }

        teleop::DelayLine<int> passthrough(0, -1);
        if (passthrough.push(5) != 5 || passthrough.delay() != 0)
        {
            std::cerr << "Zero delay must pass through\n";
            return 1;
        }
        return 0;
    }

    int shippedConfigRuns(common::multi_ring_logger_memory* mem)
    {
        const std::filesystem::path cfg = CONFIG_DIR;
        const common::ParameterServer ps =
            common::parseParameterServer((cfg / "teleop_parameters.json").string());

        for (TeleopMode mode : kModes)
        {
            common::ParameterServer params = ps;
            params.loop.mode = mode;

            teleop::TeleopLoop loop(params, mem);
            if (!loop.init())
            {
                std::cerr << "init failed for mode " << common::toString(mode) << "\n";
                return 1;
            }

            const teleop::TeleopStats& stats = loop.run();
            if (stats.nonFinite || stats.ticks != static_cast<std::uint64_t>(params.loop.ticks))
            {
                std::cerr << "Run did not complete for mode " << common::toString(mode) << "\n";
                return 1;
            }
            if (stats.forwardPackets == 0 || stats.forwardPackets > stats.ticks ||
                stats.backwardPackets == 0 || stats.backwardPackets > stats.ticks)
            {
                std::cerr << "Packet counts out of range for mode " << common::toString(mode) << "\n";
                return 1;
            }
            // The wall is inside the operator's stroke, so some force must come back
            if (!(stats.peakMasterForce > 0.0))
            {
                std::cerr << "No contact force for mode " << common::toString(mode) << "\n";
                return 1;
            }
        }
        return 0;
    }

    int deadbandReducesTraffic(common::multi_ring_logger_memory* mem)
    {
        common::ParameterServer lossless = shortRun(TeleopMode::DIRECT);
        lossless.deadband.position_threshold = 0.0;
        lossless.deadband.velocity_threshold = 0.0;

        teleop::TeleopLoop every(lossless, mem);
        if (!every.init())
        {
            return 1;
        }
        const teleop::TeleopStats allStats = every.run();

        // Zero threshold: every changed sample leaves the deadband
        if (allStats.forwardPackets != allStats.ticks)
        {
            std::cerr << "Zero threshold suppressed samples: " << allStats.forwardPackets << "\n";
            return 1;
        }

        teleop::TeleopLoop reduced(shortRun(TeleopMode::DIRECT), mem);
        if (!reduced.init())
        {
            return 1;
        }
        const teleop::TeleopStats reducedStats = reduced.run();
        if (!(reducedStats.forwardPackets < allStats.forwardPackets))
        {
            std::cerr << "Deadband did not reduce forward traffic\n";
            return 1;
        }
        return 0;
    }

    int freeSpaceHasNoForce(common::multi_ring_logger_memory* mem)
    {
        // WAVE renders the wave impedance even in free space, see waveChannelReflects()
        for (TeleopMode mode : {TeleopMode::DIRECT, TeleopMode::TDPA, TeleopMode::ISS})
        {
            common::ParameterServer ps = shortRun(mode);
            ps.environment.wall_position = 10.0;

            teleop::TeleopLoop loop(ps, mem);
            if (!loop.init())
            {
                return 1;
            }
            const teleop::TeleopStats& stats = loop.run();
            if (stats.peakMasterForce != 0.0 || stats.backwardPackets != 0 || stats.nonFinite)
            {
                std::cerr << "Force rendered in free space for mode " << common::toString(mode) << "\n";
                return 1;
            }
        }
        return 0;
    }

    int waveChannelReflects(common::multi_ring_logger_memory* mem)
    {
        double peak[2] = {0.0, 0.0};
        const int delays[2] = {0, 100};
        for (int i = 0; i < 2; ++i)
        {
            common::ParameterServer ps = shortRun(TeleopMode::WAVE);
            ps.environment.wall_position = 10.0;
            ps.loop.delay_ticks = delays[i];

            teleop::TeleopLoop loop(ps, mem);
            if (!loop.init())
            {
                return 1;
            }
            const teleop::TeleopStats& stats = loop.run();
            if (stats.nonFinite || stats.ticks != 2000)
            {
                std::cerr << "Wave run failed at delay " << delays[i] << "\n";
                return 1;
            }
            // Only one wave per direction travels, so the slave answers and the
            // operator feels the channel impedance with nothing to touch
            if (!(stats.peakMasterForce > 0.0) || stats.peakMasterForce > 50.0 ||
                stats.backwardPackets == 0)
            {
                std::cerr << "Unexpected free-space wave force " << stats.peakMasterForce
                          << " at delay " << delays[i] << "\n";
                return 1;
            }
            peak[i] = stats.peakMasterForce;
        }
        if (std::fabs(peak[0] - peak[1]) < 1e-6)
        {
            std::cerr << "Wave force does not depend on the channel delay\n";
            return 1;
        }

        // Long delay against the wall stays bounded
        common::ParameterServer ps = shortRun(TeleopMode::WAVE);
        ps.loop.ticks       = 5000;
        ps.loop.delay_ticks = 400;
        teleop::TeleopLoop loop(ps, mem);
        if (!loop.init())
        {
            return 1;
        }
        const teleop::TeleopStats& stats = loop.run();
        if (stats.nonFinite || !(stats.peakMasterForce > 0.0) || stats.peakMasterForce > 50.0)
        {
            std::cerr << "Wave channel unstable with long delay: " << stats.peakMasterForce << "\n";
            return 1;
        }
        return 0;
    }

    int idleOperatorStaysAtRest(common::multi_ring_logger_memory* mem)
    {
        common::ParameterServer ps = shortRun(TeleopMode::TDPA);
        ps.environment.operator_amplitude = 0.0;

        teleop::TeleopLoop loop(ps, mem);
        if (!loop.init())
        {
            return 1;
        }
        const teleop::TeleopStats& stats = loop.run();
        if (stats.tdpaEnergy != 0.0 || stats.peakMasterForce != 0.0 ||
            stats.forwardPackets != 0 || stats.backwardPackets != 0 ||
            loop.slavePosition() != teleop::Vec3::Zero())
        {
            std::cerr << "Idle operator produced motion or energy\n";
            return 1;
        }
        return 0;
    }

    int rejectedGainsFailInit(common::multi_ring_logger_memory* mem)
    {
        common::ParameterServer badIss = shortRun(TeleopMode::ISS);
        badIss.iss.mu_max = 0.0;

        common::ParameterServer badWave = shortRun(TeleopMode::WAVE);
        badWave.wave.impedance = -1.0;

        common::ParameterServer badDeadband = shortRun(TeleopMode::DIRECT);
        badDeadband.deadband.force_threshold = -0.1;

        for (const common::ParameterServer& ps : {badIss, badWave, badDeadband})
        {
            teleop::TeleopLoop loop(ps, mem);
            if (loop.init())
            {
                std::cerr << "init accepted an invalid gain\n";
                return 1;
            }
            if (!systemRingHasError(mem))
            {
                std::cerr << "Rejected gain not logged\n";
                return 1;
            }
            if (loop.step())
            {
                std::cerr << "step() ran on an uninitialized loop\n";
                return 1;
            }
        }
        return 0;
    }

    int stepAdvancesOneTick(common::multi_ring_logger_memory* mem)
    {
        teleop::TeleopLoop loop(shortRun(TeleopMode::DIRECT), mem);
        if (loop.step())
        {
            std::cerr << "step() before init() succeeded\n";
            return 1;
        }
        if (!loop.init() || !loop.step() || loop.stats().ticks != 1)
        {
            std::cerr << "Single step mismatch\n";
            return 1;
        }
        // First tick: operator moves forward at full speed
        if (!(loop.masterVelocity()[0] > 0.0) || loop.masterVelocity()[2] != 0.0 ||
            !(loop.masterPosition()[0] > 0.0))
        {
            std::cerr << "Operator motion mismatch\n";
            return 1;
        }
        return 0;
    }
}

int main()
{
    // Rings are large; keep them off the stack.
    auto mem = std::make_unique<common::multi_ring_logger_memory>();

    try
    {
        if (delayLine() != 0) return 1;
        if (shippedConfigRuns(mem.get()) != 0) return 1;
        if (deadbandReducesTraffic(mem.get()) != 0) return 1;
        if (freeSpaceHasNoForce(mem.get()) != 0) return 1;
        if (waveChannelReflects(mem.get()) != 0) return 1;
        if (idleOperatorStaysAtRest(mem.get()) != 0) return 1;
        if (rejectedGainsFailInit(mem.get()) != 0) return 1;
        if (stepAdvancesOneTick(mem.get()) != 0) return 1;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
