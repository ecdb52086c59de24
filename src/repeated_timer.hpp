#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Calls target every interval on a worker thread without drifting: each
// deadline is the previous deadline + interval, not "now + interval", so a
// slow target does not push later calls back.
class RepeatedTimer
{
public:
    RepeatedTimer(std::function<void()> target, std::chrono::milliseconds interval);
    ~RepeatedTimer();

    RepeatedTimer(const RepeatedTimer &) = delete;
    RepeatedTimer &operator=(const RepeatedTimer &) = delete;

    void start();
    void stop();
    bool isRunning() const;

private:
    std::function<void()> target;
    std::chrono::milliseconds interval;
    std::thread worker;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool running;
    unsigned generation; // bumped by each start(), stale workers exit

    void run(unsigned gen, std::chrono::steady_clock::time_point nextCall);
    void haltAfterError(unsigned gen);
};
