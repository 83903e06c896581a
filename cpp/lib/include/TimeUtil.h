/** \file   TimeUtil.h
 *  \brief  Declarations of time-related utility functions.
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
#pragma once


#include <string>
#include <cstdint>
#include <ctime>


/** \namespace  TimeUtil
 *  \brief      Utility functions for manipulating dates and times.
 */
namespace TimeUtil {


const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!


/** The default strftime(3) format string for representing dates and times. */
const std::string DEFAULT_FORMAT("%Y-%m-%d %T");


/** \enum   TimeZone
 *  \brief  Differentiate between UTC and the local timezone.
 */
enum TimeZone { UTC, LOCAL };


/** \brief   Get the current date time as a string
 *  \return  A string representing the current date and time.
 */
std::string GetCurrentDateAndTime(const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


inline std::string GetCurrentYear(const TimeZone time_zone = LOCAL) { return GetCurrentDateAndTime("%Y", time_zone); }


/** \brief   Convert a time from a time_t to a string.
 *  \param   the_time   The time to convert.
 *  \param   format     The format of the result, in strftime(3) format.
 *  \param   time_zone  Whether to use local time (the default) or UTC.
 *  \throws  std::runtime_error if the conversion or the formatting failed.
 */
std::string TimeTToString(const time_t &the_time, const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** \brief  Renders milliseconds since the Unix epoch as e.g. "2026-01-11T12:00:00.123Z". */
std::string MillisecondsToZuluString(const uint64_t milliseconds_since_epoch);


// \return Milliseconds since the Unix epoch, truncated.
uint64_t GetCurrentTimeInMilliseconds();


} // namespace TimeUtil
