#pragma once

// Time source for throttling, backoff and cache expiry.
class Clock {
public:
    virtual ~Clock() = default;

    // Seconds since the Unix epoch
    virtual double now() const = 0;
    virtual void sleep_for(double seconds) = 0;
};

class SystemClock : public Clock {
public:
    double now() const override;
    void sleep_for(double seconds) override;
};
