#include "clock.hpp"
#include <chrono>
#include <thread>

double SystemClock::now() const {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

void SystemClock::sleep_for(double seconds) {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}
