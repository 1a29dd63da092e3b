/** \file    FileUtil.h
 *  \brief   Declaration of file-related utility functions.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Steven Lolong
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.  All rights reserved.
 *  Copyright 2022 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <memory>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include "File.h"


namespace FileUtil {


/** \class AutoTempFile
 *  \brief Creates a temp file and removes it when going out of scope.
 */
class AutoTempFile {
    std::string path_;
    bool automatically_remove_;

public:
    explicit AutoTempFile(const std::string &path_prefix = "/tmp/ATF", const std::string &path_suffix = "",
                          bool automatically_remove = true);
    AutoTempFile(const AutoTempFile &rhs) = delete;
    ~AutoTempFile() {
        if (not path_.empty() and automatically_remove_)
            ::unlink(path_.c_str());
    }

    const std::string &getFilePath() const { return path_; }
};


bool WriteString(const std::string &path, const std::string &data);
void WriteStringOrDie(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);
std::string ReadStringOrDie(const std::string &path);


/** \brief  Does the named file or directory exist and is it readable?.
 *  \param  path           The path of the file.
 *  \param  error_message  Where to store an error message if an error occurred.
 */
bool IsReadable(const std::string &path, std::string * const error_message = nullptr);


/** \brief  Is the given path the name of a directory?
 *  \param  dir_name  The path to test.
 *  \return True if the path is a directory and can be accessed.
 *
 *  IsDirectory returns false if "dir_name" either doesn't exist, we
 *  don't have sufficient priviledges to stat it or it exists but is
 *  not a directory.
 */
bool IsDirectory(const std::string &dir_name);


/** \return The size of the file named by "path".  Throws on error. */
off_t GetFileSize(const std::string &path);


/** \brief Opens a file for reading or aborts. */
std::unique_ptr<File> OpenInputFileOrDie(const std::string &filename);


/** \brief Opens a file for writing or aborts. */
std::unique_ptr<File> OpenOutputFileOrDie(const std::string &filename);


} // namespace FileUtil
