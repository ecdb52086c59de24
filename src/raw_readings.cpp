// Sensor reading
// Takes a reading from the glove every display.interval_ms (500 ms by default)
// and prints the raw, uncalibrated measurements until Ctrl+C.
//
// usage: raw_readings [port]
#include <csignal>
#include <iostream>
#include <thread>
#include "cyber_glove.hpp"
#include "glove_config.hpp"
#include "glove_errors.hpp"
#include "repeated_timer.hpp"

static CancelToken gCancel;

static void onSignal(int)
{
    gCancel.cancel();
}

static void displaySensorReadings(CyberGlove &glove)
{
    std::vector<double> raw;
    try
    {
        raw = glove.readSample(&gCancel);
    }
    catch (const CancelledError &)
    {
        return;
    }
    std::cout << "\nData glove raw measurements:\n[";
    for (size_t i = 0; i < raw.size(); ++i)
        std::cout << (i ? ", " : "") << raw[i];
    std::cout << "]\n";
}

int main(int argc, char *argv[])
{
    std::cout << "========================================\n";
    std::cout << "CYBERGLOVE RAW READINGS\n";
    std::cout << "========================================\n\n";

    GloveConfig cfg = gloveConfigFrom(loadConfig(kDefaultConfigPaths));
    if (argc > 1)
        cfg.glove.port = argv[1];
    cfg.glove.calibrationPath.clear(); // raw readings only

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try
    {
        CyberGlove glove(cfg.glove);
        ScopedGlove session(glove);
        std::cout << "✓ Glove connected: " << glove.port() << " @" << cfg.glove.baudRate << "\n";

        RepeatedTimer timer([&glove]()
                            { displaySensorReadings(glove); },
                            std::chrono::milliseconds(cfg.display.intervalMs));
        timer.start();
        while (!gCancel.cancelled() && timer.isRunning())
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        timer.stop();
        if (!gCancel.cancelled())
        {
            std::cerr << "ERROR: reading stopped on a glove error\n";
            return 1;
        }
    }
    catch (const GloveException &e)
    {
        std::cerr << "ERROR (" << errorCodeName(e.code()) << "): " << e.what() << "\n";
        return 1;
    }
    std::cout << "\nStopped.\n";
    return 0;
}
