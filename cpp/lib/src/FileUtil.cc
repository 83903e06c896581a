/** \file   FileUtil.cc
 *  \brief  Implementation of file-related utility functions.
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
#include "FileUtil.h"
#include <fstream>
#include <cstring>
#include <sys/stat.h>
#include "util.h"


namespace FileUtil {


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == 0)
        return true;

    if (error_message != nullptr)
        *error_message = "can't stat(2) \"" + path + "\": " + std::string(std::strerror(errno));
    errno = 0;
    return false;
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        return false;

    data->resize(static_cast<size_t>(stat_buf.st_size));
    input.read(&(*data)[0], stat_buf.st_size);
    return not input.bad();
}


std::string ReadStringOrDie(const std::string &path) {
    std::string data;
    if (not FileUtil::ReadString(path, &data))
        LOG_ERROR("failed to read \"" + path + "\"!");
    return data;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    return not output.bad();
}


} // namespace FileUtil
