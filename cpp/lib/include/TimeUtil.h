/** \file    TimeUtil.h
 *  \brief   Declarations of time-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Wagner Truppel
 */

/*
 *  Copyright 2003-2008 Project iVia.
 *  Copyright 2003-2008 The Regents of The University of California.
 *  Copyright 2018-2021 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <string>
#include <ctime>


/** \namespace  TimeUtil
 *  \brief      Utility functions for formatting dates and times.
 */
namespace TimeUtil {


const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!
const std::string DEFAULT_FORMAT("%Y-%m-%d %T");


enum TimeZone { UTC, LOCAL };


/** \brief   Get the current date and time as a string.
 *  \param   format     The format of the date and time string, c.f. strftime(3).
 *  \param   time_zone  Whether to report local time or UTC.
 *  \return  The current date and time in the requested format.
 */
std::string GetCurrentDateAndTime(const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** \brief   Convert a time from a time_t to a string.
 *  \param   the_time   The time to convert.
 *  \param   format     The format of the result, in strftime(3) format.
 *  \param   time_zone  Whether to convert to local time or UTC.
 *  \return  The converted time or an empty string if the conversion failed.
 *  \note    Never logs errors itself since it is used to decorate log messages.
 */
std::string TimeTToString(const time_t &the_time, const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


} // namespace TimeUtil
