#include <cstdlib>  // for EXIT_SUCCESS, EXIT_FAILURE
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/LogDrain.h"
#include "common/ParameterServer.h"
#include "common/SharedLogger.h"
#include "teleop/TeleopLoop.h"

#ifndef CONFIG_DIR
#define CONFIG_DIR "config"
#endif

int main(int argc, char* argv[])
{
    using namespace haptic_toolbox;

    // Rings are large; keep them off the stack.
    auto loggerMem = std::make_unique<common::multi_ring_logger_memory>();

    try
    {
        // 1) Configuration
        const std::string configFile =
            (argc > 1) ? std::string(argv[1])
                       : std::string(CONFIG_DIR) + "/teleop_parameters.json";

        const common::ParameterServer params = common::parseParameterServer(configFile);

        // 2) Build the loop
        teleop::TeleopLoop loop(params, loggerMem.get());
        if (!loop.init())
        {
            common::drain_logs(loggerMem.get(), std::cerr);
            std::cerr << "[Teleop Main] TeleopLoop init failed.\n";
            return EXIT_FAILURE;
        }

        // 3) Run the simulated ticks
        const teleop::TeleopStats& stats = loop.run();
        common::drain_logs(loggerMem.get(), std::cout);

        std::cout << "[Teleop Main] mode=" << common::toString(loop.mode())
                  << " ticks=" << stats.ticks
                  << " forward_packets=" << stats.forwardPackets
                  << " backward_packets=" << stats.backwardPackets
                  << " peak_force=" << stats.peakMasterForce
                  << " max_tracking_error=" << stats.maxTrackingError
                  << " tdpa_energy=" << stats.tdpaEnergy
                  << " dropped_logs=" << common::dropped_logs(loggerMem.get())
                  << "\n";

        if (stats.nonFinite)
        {
            std::cerr << "[Teleop Main] Simulation diverged.\n";
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
    catch (const std::exception& e)
    {
        common::log_error(loggerMem.get(), common::LogSite::SYSTEM, 1, e.what());
        common::drain_logs(loggerMem.get(), std::cerr);
        std::cerr << "[Teleop Main] Exception: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
