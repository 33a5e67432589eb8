#include "util/scoped_timer.hpp"

#include "util/string_utils.hpp"

#include <chrono>
#include <ostream>
#include <string>

ScopedTimer::ScopedTimer(std::ostream& os, const std::string& startMessage, const std::string& endMessage) : m_os{ os }, m_endMessage{ endMessage } {
    if (!startMessage.empty()) {
        m_os << startMessage << "\n" << std::flush;
    }

    m_startTime = std::chrono::steady_clock::now();
}

ScopedTimer::~ScopedTimer() {
    m_os << m_endMessage << " in " << formatFixedPoint(getSecondsElapsed(), 3) << "s.\n";
}

double ScopedTimer::getSecondsElapsed() const {
    auto currentTime = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(currentTime - m_startTime).count();
}
