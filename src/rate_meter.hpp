#pragma once
#include <chrono>
#include <deque>

// Sampling rate estimated from the most recent inter-sample intervals.
class SampleRateMeter
{
public:
    using Clock = std::chrono::steady_clock;

    explicit SampleRateMeter(size_t window = 200) : window(window == 0 ? 1 : window), hasLast(false) {}

    void tick(Clock::time_point t)
    {
        if (hasLast)
        {
            intervals.push_back(std::chrono::duration<double>(t - last).count());
            if (intervals.size() > window)
                intervals.pop_front();
        }
        last = t;
        hasLast = true;
    }

    void tick() { tick(Clock::now()); }

    // Samples per second, 0 until two ticks are seen.
    double rate() const
    {
        if (intervals.empty())
            return 0.0;
        double sum = 0.0;
        for (double dt : intervals)
            sum += dt;
        if (sum <= 0.0)
            return 0.0;
        return 1.0 / (sum / static_cast<double>(intervals.size()));
    }

    size_t samples() const { return intervals.size(); }

private:
    size_t window;
    std::deque<double> intervals;
    Clock::time_point last;
    bool hasLast;
};
