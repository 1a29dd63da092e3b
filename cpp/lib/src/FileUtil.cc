/** \file   FileUtil.cc
 *  \brief  Implementation of file related utility classes and functions.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *  \author Steven Lolong (steven.lolong@uni-tuebingen.de)
 *
 *  \copyright 2015-2023 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "util.h"


namespace FileUtil {


AutoTempFile::AutoTempFile(const std::string &path_prefix, const std::string &path_suffix, bool automatically_remove)
    : automatically_remove_(automatically_remove) {
    std::string path_template(path_prefix + "XXXXXX" + path_suffix);
    const int fd(::mkstemps(const_cast<char *>(path_template.c_str()), path_suffix.length()));
    if (fd == -1)
        LOG_ERROR("mkstemps(3) for path prefix \"" + path_prefix + "\" failed!");

    ::close(fd);
    path_ = path_template;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    return not output.bad();
}


void WriteStringOrDie(const std::string &path, const std::string &data) {
    if (not FileUtil::WriteString(path, data))
        LOG_ERROR("failed to write data to \"" + path + "\"!");
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    const off_t file_size(GetFileSize(path));
    data->resize(file_size);
    input.read(const_cast<char *>(data->data()), file_size);
    return not input.bad();
}


std::string ReadStringOrDie(const std::string &path) {
    std::string data;
    if (not FileUtil::ReadString(path, &data))
        LOG_ERROR("failed to read \"" + path + "\"!");
    return data;
}


// Returns true if stat(2) succeeded and false otherwise.
static bool Stat(struct stat * const stat_buf, const std::string &path, std::string * const error_message) {
    errno = 0;

    if (::stat(path.c_str(), stat_buf) != 0) {
        if (error_message != nullptr)
            *error_message = "can't stat(2) \"" + path + "\": " + std::string(::strerror(errno));
        errno = 0;
        return false;
    }

    return true;
}


bool IsReadable(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    if (not Stat(&stat_buf, path, error_message))
        return false;

    if (::access(path.c_str(), R_OK) == 0)
        return true;

    errno = 0;
    if (error_message != nullptr)
        *error_message = "\"" + path + "\" exists but is not readable!";
    return false;
}


// IsDirectory -- Is the specified file a directory?
//
bool IsDirectory(const std::string &dir_name) {
    struct stat statbuf;
    if (::stat(dir_name.c_str(), &statbuf) != 0) {
        errno = 0;
        return false;
    }

    return S_ISDIR(statbuf.st_mode);
}


off_t GetFileSize(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        throw std::runtime_error("in FileUtil::GetFileSize: can't stat(2) \"" + path + "\"!");

    return stat_buf.st_size;
}


std::unique_ptr<File> OpenInputFileOrDie(const std::string &filename) {
    std::unique_ptr<File> file(new File(filename, "r"));
    if (file->fail())
        LOG_ERROR("can't open \"" + filename + "\" for reading!");

    return file;
}


std::unique_ptr<File> OpenOutputFileOrDie(const std::string &filename) {
    std::unique_ptr<File> file(new File(filename, "w"));
    if (file->fail())
        LOG_ERROR("can't open \"" + filename + "\" for writing!");

    return file;
}


} // namespace FileUtil
