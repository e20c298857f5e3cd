// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_access.h"
#include "crc.h"
#include "guid.h"


namespace zen
{
    const char LINE_BREAK[] = "\n";

/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

    //reposition for partial-transfer resume
    void seek(uint64_t offset); //throw FileError

    uint64_t getFileSize() const { return fileSize_; }
    time_t getModTime() const { return modTime_; }

private:
    FileInputPlain(const std::pair<FileHandle, struct stat>& fileDetails, const Zstring& filePath);

    uint64_t fileSize_ = 0;
    time_t modTime_ = 0;
};


enum class FileOutputMode
{
    createNew, //fail with ErrorTargetExisting; file is deleted unless close() succeeds
    overwrite, //truncate existing file
    append,    //continue partial file
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const Zstring& filePath, FileOutputMode mode); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    void write(const void* buffer, size_t bytesToWrite); //throw FileError

    //createNew: close() when done, or else file is considered incomplete and will be deleted!

private:
    const FileOutputMode mode_;
};

//-----------------------------------------------------------------------------------------------

//stream I/O convenience functions:

inline
Zstring getPathWithTempName(const Zstring& filePath) //generate (hopefully) unique file name
{
    const Zstring shortGuid_ = printNumber<Zstring>(Zstr("%04x"), static_cast<unsigned int>(getCrc16(generateGUID())));
    return filePath + Zstr('.') + shortGuid_ + Zstr(".tmp");
}

[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw FileError

//overwrites if existing + transactional! :)
void setFileContent(const Zstring& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345
