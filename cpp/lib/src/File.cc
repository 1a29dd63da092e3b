/** \file    File.cc
 *  \brief   Implementation of class File.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2005-2008 Project iVia.
 *  Copyright 2005-2008 The Regents of The University of California.
    Copyright 2015-2016 Library of the University of Tübingen
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
#include "File.h"
#include <cerrno>


File::File(const std::string &filename, const std::string &mode)
    : filename_(filename), buffer_ptr_(buffer_), read_count_(0), file_(nullptr), open_mode_(READING)
{
    if (mode == "w" or mode == "a")
        open_mode_ = WRITING;
    else if (unlikely(mode != "r"))
        throw std::runtime_error("in File::File: open mode \"" + mode + "\" not supported!");

    file_ = std::fopen(filename.c_str(), mode.c_str());
}


bool File::close() {
    if (file_ == nullptr) {
        errno = 0;
        return false;
    }

    const bool retval(std::fclose(file_) == 0);
    file_ = nullptr;
    return retval;
}


void File::fillBuffer() {
    if (unlikely(file_ == nullptr))
        throw std::runtime_error("in File::fillBuffer: can't read from non-open file \"" + filename_ + "\"!");
    if (unlikely(open_mode_ != READING))
        throw std::runtime_error("in File::fillBuffer: \"" + filename_ + "\" was not opened for reading!");

    read_count_ = std::fread(reinterpret_cast<void *>(buffer_), 1, BUFSIZ, file_);
    if (unlikely(std::ferror(file_) != 0))
        throw std::runtime_error("in File:fillBuffer: error while reading \"" + filename_ + "\"!");
    buffer_ptr_ = buffer_;
}


size_t File::write(const void * const buf, const size_t buf_size) {
    if (unlikely(file_ == nullptr))
        throw std::runtime_error("in File::write: can't write to non-open file \"" + filename_ + "\"!");

    return std::fwrite(buf, 1, buf_size, file_);
}


size_t File::getline(std::string * const line, const char terminator) {
    line->clear();

    size_t count(0);
    for (;;) {
        const int ch(get());
        if (unlikely(ch == static_cast<unsigned char>(terminator) or ch == EOF))
            return count;
        *line += static_cast<char>(ch);
        ++count;
    }
}

