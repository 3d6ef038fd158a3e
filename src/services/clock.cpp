#include "services/clock.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

namespace ident {
DateTime SystemClock::now()
{
    return boost::posix_time::microsec_clock::universal_time();
}

FrozenClock::FrozenClock(const DateTime &dateTime)
    : dateTime_(dateTime)
{
}

DateTime FrozenClock::now()
{
    return dateTime_;
}
} // namespace ident
