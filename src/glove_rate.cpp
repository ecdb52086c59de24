// Glove sampling rate
// Reads the glove as fast as it answers and shows the sampling rate estimated
// from the most recent readings (display.rate_window, 200 by default).
//
// usage: glove_rate [port]
#include <csignal>
#include <iomanip>
#include <iostream>
#include "cyber_glove.hpp"
#include "glove_config.hpp"
#include "glove_errors.hpp"
#include "rate_meter.hpp"

static CancelToken gCancel;

static void onSignal(int)
{
    gCancel.cancel();
}

int main(int argc, char *argv[])
{
    std::cout << "========================================\n";
    std::cout << "CYBERGLOVE SAMPLING RATE\n";
    std::cout << "========================================\n\n";

    GloveConfig cfg = gloveConfigFrom(loadConfig(kDefaultConfigPaths));
    if (argc > 1)
        cfg.glove.port = argv[1];

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try
    {
        CyberGlove glove(cfg.glove);
        ScopedGlove session(glove);
        std::cout << "✓ Glove connected: " << glove.port() << " @" << cfg.glove.baudRate
                  << " (" << glove.channels() << "-DOF"
                  << (glove.isCalibrated() ? ", calibrated" : "") << ")\n";

        SampleRateMeter meter(static_cast<size_t>(cfg.display.rateWindow));
        while (!gCancel.cancelled())
        {
            glove.read(&gCancel);
            meter.tick();
            std::cout << "\rGlove rate: " << std::fixed << std::setprecision(1) << meter.rate()
                      << " Hz   " << std::flush;
        }
    }
    catch (const CancelledError &)
    {
        // Ctrl+C while waiting for a frame
    }
    catch (const GloveException &e)
    {
        std::cerr << "\nERROR (" << errorCodeName(e.code()) << "): " << e.what() << "\n";
        return 1;
    }
    std::cout << "\nStopped.\n";
    return 0;
}
