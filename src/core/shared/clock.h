#pragma once

#include <QtGlobal>

#include <memory>

namespace rw {

// Clock -- wall-clock source for cache timestamps.
//
// Timestamps are milliseconds since the Unix epoch so that entries written
// to a persistent backend keep their meaning across process restarts.
class Clock {
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
};

class SystemClock : public Clock {
public:
    qint64 nowMs() const override;

    // Shared process-wide instance used when no clock is injected.
    static std::shared_ptr<const Clock> instance();
};

} // namespace rw
