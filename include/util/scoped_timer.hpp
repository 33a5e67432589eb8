#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <ostream>
#include <string>

// Prints how long the enclosing scope took when it is destroyed
class ScopedTimer {
public:
    ScopedTimer(std::ostream& os, const std::string& startMessage, const std::string& endMessage);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double getSecondsElapsed() const;

private:
    std::ostream& m_os;
    std::chrono::steady_clock::time_point m_startTime;
    std::string m_endMessage;
};

#endif // SCOPED_TIMER_HPP
