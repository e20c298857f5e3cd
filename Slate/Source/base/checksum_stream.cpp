// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "checksum_stream.h"
#include <zen/file_io.h>
#include <zen/open_ssl.h>
#include <xxhash.h>

using namespace zen;
using namespace slate;


namespace
{
class XxHash64Stream : public ChecksumStream
{
public:
    XxHash64Stream() //throw SysError
    {
        state_ = ::XXH64_createState();
        if (!state_)
            throw SysError(formatSystemError("XXH64_createState", L"", L"Out of memory."));

        if (::XXH64_reset(state_, 0 /*seed*/) != XXH_OK)
        {
            ::XXH64_freeState(state_);
            throw SysError(formatSystemError("XXH64_reset", L"", L"Unexpected failure."));
        }
    }

    ~XxHash64Stream() { ::XXH64_freeState(state_); }

    void update(std::string_view bytes) override //throw SysError
    {
        if (::XXH64_update(state_, bytes.data(), bytes.size()) != XXH_OK)
            throw SysError(formatSystemError("XXH64_update", L"", L"Unexpected failure."));
    }

    std::string finalize() override
    {
        //canonical representation is big-endian => same digest as "xxhsum"
        XXH64_canonical_t canonical = {};
        ::XXH64_canonicalFromHash(&canonical, ::XXH64_digest(state_));

        return formatAsHexString({reinterpret_cast<const char*>(canonical.digest), sizeof(canonical.digest)});
    }

private:
    XxHash64Stream           (const XxHash64Stream&) = delete;
    XxHash64Stream& operator=(const XxHash64Stream&) = delete;

    XXH64_state_t* state_ = nullptr;
};


class Md5Stream : public ChecksumStream
{
public:
    Md5Stream() : digest_("MD5") {} //throw SysError

    void update(std::string_view bytes) override { digest_.update(bytes); } //throw SysError

    std::string finalize() override { return formatAsHexString(digest_.finalize()); } //throw SysError

private:
    OpenSslDigest digest_;
};
}


std::unique_ptr<ChecksumStream> slate::makeChecksumStream(HashAlgorithm algo) //throw SysError
{
    switch (algo)
    {
        case HashAlgorithm::xxHash64:
            return std::make_unique<XxHash64Stream>(); //throw SysError
        case HashAlgorithm::md5:
            return std::make_unique<Md5Stream>(); //throw SysError
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::string slate::hashFile(const Zstring& filePath, HashAlgorithm algo, size_t chunkSize,
                            const std::function<void(int64_t bytesDelta)>& onChunk /*throw X*/) //throw FileError, X
{
    try
    {
        const std::unique_ptr<ChecksumStream> hashStream = makeChecksumStream(algo); //throw SysError

        FileInputPlain fileIn(filePath); //throw FileError

        std::string buffer(chunkSize, '\0');
        for (;;)
        {
            const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
            if (bytesRead == 0) //end of file
                break;

            hashStream->update({buffer.data(), bytesRead}); //throw SysError

            if (onChunk)
                onChunk(bytesRead); //throw X
        }
        return hashStream->finalize(); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
