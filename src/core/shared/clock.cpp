#include "core/shared/clock.h"

#include <QDateTime>

namespace rw {

qint64 SystemClock::nowMs() const
{
    return QDateTime::currentMSecsSinceEpoch();
}

std::shared_ptr<const Clock> SystemClock::instance()
{
    static const std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace rw
