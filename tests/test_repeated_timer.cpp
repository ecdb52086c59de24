#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "glove_errors.hpp"
#include "repeated_timer.hpp"

using namespace std::chrono;

TEST(RepeatedTimer, RejectsNonPositiveInterval)
{
    EXPECT_THROW(RepeatedTimer([]() {}, milliseconds(0)), InvalidConfigurationError);
}

TEST(RepeatedTimer, CallsTargetRepeatedlyUntilStopped)
{
    std::atomic<int> calls{0};
    RepeatedTimer timer([&calls]()
                        { ++calls; },
                        milliseconds(20));
    EXPECT_FALSE(timer.isRunning());
    timer.start();
    EXPECT_TRUE(timer.isRunning());
    std::this_thread::sleep_for(milliseconds(210));
    timer.stop();
    EXPECT_FALSE(timer.isRunning());

    int seen = calls.load();
    EXPECT_GE(seen, 5);
    EXPECT_LE(seen, 11);

    std::this_thread::sleep_for(milliseconds(60));
    EXPECT_EQ(calls.load(), seen);
}

TEST(RepeatedTimer, SlowTargetDoesNotDrift)
{
    std::mutex mtx;
    std::vector<steady_clock::time_point> stamps;
    RepeatedTimer timer([&]()
                        {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stamps.push_back(steady_clock::now());
        }
        std::this_thread::sleep_for(milliseconds(15)); },
                        milliseconds(40));
    auto started = steady_clock::now();
    timer.start();
    std::this_thread::sleep_for(milliseconds(430));
    timer.stop();

    std::lock_guard<std::mutex> lock(mtx);
    ASSERT_GE(stamps.size(), 8u);
    // Call k is due at start + (k + 1) * interval regardless of target run time.
    auto last = stamps[7] - started;
    EXPECT_GE(duration_cast<milliseconds>(last).count(), 320);
    EXPECT_LT(duration_cast<milliseconds>(last).count(), 320 + 80);
}

TEST(RepeatedTimer, StartAndStopAreIdempotent)
{
    std::atomic<int> calls{0};
    RepeatedTimer timer([&calls]()
                        { ++calls; },
                        milliseconds(10));
    timer.start();
    timer.start();
    std::this_thread::sleep_for(milliseconds(55));
    timer.stop();
    timer.stop();
    EXPECT_LE(calls.load(), 7);

    timer.start();
    EXPECT_TRUE(timer.isRunning());
    timer.stop();
}

TEST(RepeatedTimer, GloveErrorInTargetStopsTimer)
{
    std::atomic<int> calls{0};
    RepeatedTimer timer([&calls]()
                        {
        ++calls;
        throw IoFailureError("device /dev/ttyUSB0 disconnected"); },
                        milliseconds(10));
    timer.start();
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_FALSE(timer.isRunning());
    EXPECT_EQ(calls.load(), 1);
    timer.stop();
}

TEST(RepeatedTimer, NonGloveErrorInTargetStopsTimer)
{
    std::atomic<int> calls{0};
    RepeatedTimer timer([&calls]()
                        {
        ++calls;
        throw std::runtime_error("bad sample buffer"); },
                        milliseconds(10));
    timer.start();
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_FALSE(timer.isRunning());
    EXPECT_EQ(calls.load(), 1);
    timer.stop();
}

TEST(RepeatedTimer, RestartAfterStopFromInsideTarget)
{
    std::atomic<int> calls{0};
    RepeatedTimer *self = nullptr;
    RepeatedTimer timer([&]()
                        {
        if (++calls == 1)
        {
            self->stop();
            std::this_thread::sleep_for(milliseconds(30));
        } },
                        milliseconds(10));
    self = &timer;
    timer.start();
    std::this_thread::sleep_for(milliseconds(20));

    // The worker is still inside the target when start() comes in.
    auto restarted = std::async(std::launch::async, [&timer]()
                                { timer.start(); });
    ASSERT_EQ(restarted.wait_for(seconds(2)), std::future_status::ready);
    restarted.get();
    EXPECT_TRUE(timer.isRunning());

    std::this_thread::sleep_for(milliseconds(60));
    timer.stop();
    EXPECT_GE(calls.load(), 2);
}

TEST(RepeatedTimer, RestartFromInsideTargetKeepsOneWorker)
{
    std::atomic<int> calls{0};
    RepeatedTimer *self = nullptr;
    RepeatedTimer timer([&]()
                        {
        if (++calls == 1)
        {
            self->stop();
            self->start();
        } },
                        milliseconds(20));
    self = &timer;
    timer.start();
    std::this_thread::sleep_for(milliseconds(210));
    timer.stop();

    // One worker gives about ten calls, two would give about twenty.
    int seen = calls.load();
    EXPECT_GE(seen, 5);
    EXPECT_LE(seen, 12);
}
