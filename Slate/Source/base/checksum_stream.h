// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CHECKSUM_STREAM_H_4918273645091283746
#define CHECKSUM_STREAM_H_4918273645091283746

#include <functional>
#include <memory>
#include <zen/file_error.h>
#include "structures.h"


namespace slate
{
const size_t COPY_CHUNK_SIZE   = 4 * 1024 * 1024; //read/write/hash block during transfer
const size_t VERIFY_CHUNK_SIZE = 8 * 1024 * 1024; //re-hash block for manifest verification


//incremental hashing: digest is independent from chunk boundaries
class ChecksumStream
{
public:
    virtual ~ChecksumStream() {}

    virtual void update(std::string_view bytes) = 0; //throw SysError

    //lower-case hex digest; stream must not be used afterwards
    virtual std::string finalize() = 0; //throw SysError
};

std::unique_ptr<ChecksumStream> makeChecksumStream(HashAlgorithm algo); //throw SysError


//re-hash a file on disk; "onChunk" is called after each block, e.g. to process pause/cancel
std::string hashFile(const Zstring& filePath, HashAlgorithm algo, size_t chunkSize,
                     const std::function<void(int64_t bytesDelta)>& onChunk /*throw X*/); //throw FileError, X
}

#endif //CHECKSUM_STREAM_H_4918273645091283746
