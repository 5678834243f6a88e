#ifndef TIMER_HPP_
#define TIMER_HPP_

#include <chrono>

namespace Shrimpy {

// Wall-clock stopwatch. Starts on construction; elapsed() reports the time
// up to the most recent stop()
class Timer
{
    typedef std::chrono::steady_clock Clock;

    Clock::time_point _start;
    Clock::time_point _stop;

public:
    Timer()
    : _start(Clock::now()),
      _stop(_start)
    {
    }

    void stop()
    {
        _stop = Clock::now();
    }

    double elapsed() const
    {
        return std::chrono::duration<double>(_stop - _start).count();
    }
};

}

#endif /* TIMER_HPP_ */
