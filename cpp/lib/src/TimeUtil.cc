/** \file   TimeUtil.cc
 *  \brief  Implementation of time-related utility functions.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "TimeUtil.h"
#include <stdexcept>
#include <cerrno>
#include <cstdio>
#include <sys/time.h>
#include "util.h"


namespace TimeUtil {


std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    time_t now;
    std::time(&now);
    return TimeTToString(now, format, time_zone);
}


std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    struct tm tm;
    if (unlikely((time_zone == LOCAL ? ::localtime_r(&the_time, &tm) : ::gmtime_r(&the_time, &tm)) == nullptr))
        throw std::runtime_error("in TimeUtil::TimeTToString: time conversion error! (time = " + std::to_string(the_time) + ")");

    char time_buf[50 + 1];
    errno = 0;
    if (unlikely(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm) == 0 or errno != 0))
        throw std::runtime_error("in TimeUtil::TimeTToString: strftime(3) failed! (format: " + format + ")");
    return time_buf;
}


std::string MillisecondsToZuluString(const uint64_t milliseconds_since_epoch) {
    const time_t seconds(static_cast<time_t>(milliseconds_since_epoch / 1000u));
    char millis_buf[4 + 1];
    std::snprintf(millis_buf, sizeof(millis_buf), ".%03u", static_cast<unsigned>(milliseconds_since_epoch % 1000u));
    return TimeTToString(seconds, ISO_8601_FORMAT, UTC) + millis_buf + "Z";
}


uint64_t GetCurrentTimeInMilliseconds() {
    timeval time_val;
    ::gettimeofday(&time_val, nullptr);
    return 1000ULL * time_val.tv_sec + time_val.tv_usec / 1000ULL;
}


} // namespace TimeUtil
