/** \file   FileUtil.h
 *  \brief  File-related utility functions.
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
#include <sys/types.h>


namespace FileUtil {


// \return True if "path" can be stat(2)'ed, else false.  On failure "*error_message" is set if it is non-null.
bool Exists(const std::string &path, std::string * const error_message = nullptr);


/** \brief  Reads the entire contents of "path" into "*data".
 *  \return False if the file could not be opened or read, else true.
 */
bool ReadString(const std::string &path, std::string * const data);

// Same as ReadString() but calls LOG_ERROR on failure.
std::string ReadStringOrDie(const std::string &path);


// \return True if "data" was completely written to "path", else false.  An existing file will be overwritten.
bool WriteString(const std::string &path, const std::string &data);


} // namespace FileUtil
