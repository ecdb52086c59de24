#include "repeated_timer.hpp"
#include "glove_errors.hpp"
#include <iostream>

RepeatedTimer::RepeatedTimer(std::function<void()> target, std::chrono::milliseconds interval)
    : target(std::move(target)), interval(interval), running(false), generation(0)
{
    if (interval.count() <= 0)
        throw InvalidConfigurationError("timer interval must be positive");
}

RepeatedTimer::~RepeatedTimer()
{
    stop();
}

void RepeatedTimer::start()
{
    // Join a finished worker outside the lock: it may still need mtx to exit.
    std::thread old;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (running)
            return;
        if (worker.get_id() == std::this_thread::get_id())
            worker.detach(); // restarted from inside the target
        else
            old = std::move(worker);
    }
    if (old.joinable())
        old.join();

    std::lock_guard<std::mutex> lock(mtx);
    if (running)
        return;
    running = true;
    ++generation;
    worker = std::thread(&RepeatedTimer::run, this, generation,
                         std::chrono::steady_clock::now() + interval);
}

void RepeatedTimer::stop()
{
    std::thread old;
    {
        std::lock_guard<std::mutex> lock(mtx);
        running = false;
        if (worker.get_id() != std::this_thread::get_id())
            old = std::move(worker);
    }
    cv.notify_all();
    if (old.joinable())
        old.join();
}

bool RepeatedTimer::isRunning() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}

void RepeatedTimer::run(unsigned gen, std::chrono::steady_clock::time_point nextCall)
{
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock(mtx);
            if (cv.wait_until(lock, nextCall, [this, gen]
                              { return !running || generation != gen; }))
                return;
        }
        nextCall += interval;
        try
        {
            target();
        }
        catch (const GloveException &e)
        {
            std::cerr << "ERROR: timer target failed: " << e.what() << "\n";
            haltAfterError(gen);
            return;
        }
        catch (const std::exception &e)
        {
            std::cerr << "ERROR: timer target threw: " << e.what() << "\n";
            haltAfterError(gen);
            return;
        }
    }
}

void RepeatedTimer::haltAfterError(unsigned gen)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (generation == gen)
        running = false;
}
