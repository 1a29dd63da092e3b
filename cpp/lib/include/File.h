/** \file    File.h
 *  \brief   Declaration of class File.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2005-2008 Project iVia.
 *  Copyright 2005-2008 The Regents of The University of California.
 *  Copyright 2015-2017 Library of the University of Tübingen
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
#ifndef FILE_H
#define FILE_H


#include <stdexcept>
#include <string>
#include <cstdio>
#include "util.h"


/** \class File
 *  \brief A buffered reader and writer for line-oriented text files.
 */
class File {
    enum OpenMode { READING, WRITING };
private:
    std::string filename_;
    char buffer_[BUFSIZ];
    char *buffer_ptr_;
    size_t read_count_;
    FILE *file_;
    OpenMode open_mode_;
public:
    /** \brief  Creates and initalises a File object.
     *  \param  path  The pathname for the file (see fopen(3) for details).
     *  \param  mode  The open mode, either "r", "w" or "a".  Other modes throw a std::runtime_error.
     *  \note   Open failures are not reported here.  Use the fail() member function.
     */
    File(const std::string &filename, const std::string &mode);
    File(const File &rhs) = delete;

    ~File() { if (file_ != nullptr) std::fclose(file_); }

    /** Closes this File.  If this fails you may consult the global "errno" for the reason. */
    bool close();

    inline int get() {
        if (unlikely(buffer_ptr_ == buffer_ + read_count_))
            fillBuffer();
        if (unlikely(read_count_ == 0))
            return EOF;
        return static_cast<unsigned char>(*buffer_ptr_++);
    }

    /** \brief  Write some data to a file.
     *  \param  buf       The data to write.
     *  \param  buf_size  How much data to write.
     *  \return Returns a short count if an error occurred, otherwise returns "buf_size".
     */
    size_t write(const void * const buf, const size_t buf_size);

    /** \brief    Extracts a "line" from an input stream.
     *  \param    line        The extracted "line" after the call.
     *  \param    terminator  The line terminator.  (Will not be included in "line".)
     *  \return   The number of extracted characters not including a possible terminator.
     *  \warning  The caller has to test for EOF separately, for example with the eof() member function!
     */
    size_t getline(std::string * const line, const char terminator = '\n');

    inline std::string getline(const char terminator = '\n') {
        std::string line;
        getline(&line, terminator);
        return line;
    }

    /** \brief  Writes "line" followed by a newline. */
    inline bool writeln(const std::string &line) {
        return write(line.data(), line.size()) == line.size() and std::fputc('\n', file_) != EOF;
    }

    const std::string &getPath() const { return filename_; }

    inline bool eof() const {
        return file_ == nullptr or ((buffer_ptr_ == buffer_ + read_count_) and std::feof(file_) != 0);
    }
    inline bool anErrorOccurred() const { return file_ == nullptr or std::ferror(file_) != 0; }

    /** Will the next I/O operation fail? */
    inline bool fail() const { return file_ == nullptr or eof() or std::ferror(file_) != 0; }
private:
    void fillBuffer();
};


#endif // ifndef FILE_H
