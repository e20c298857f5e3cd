// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "test_tools.h"
#include <zen/open_ssl.h>
#include "base/checksum_stream.h"

using namespace zen;
using namespace slate;
using namespace slate::test;


namespace
{
std::string getDigest(HashAlgorithm algo, std::string_view bytes)
{
    std::unique_ptr<ChecksumStream> stream = makeChecksumStream(algo); //throw SysError
    stream->update(bytes);
    return stream->finalize();
}


void testKnownDigests()
{
    assert(getDigest(HashAlgorithm::md5, "")    == "d41d8cd98f00b204e9800998ecf8427e");
    assert(getDigest(HashAlgorithm::md5, "abc") == "900150983cd24fb0d6963f7d28e17f72");

    assert(getDigest(HashAlgorithm::xxHash64, "") == "ef46db3751d8e999");

    assert(getDigest(HashAlgorithm::xxHash64, "abc").size() == 16);
    assert(getDigest(HashAlgorithm::xxHash64, "abc") != getDigest(HashAlgorithm::xxHash64, "abd"));
}


void testIncrementalEqualsOneShot()
{
    const std::string data = makeTestData(1000 * 1000 + 17);

    for (HashAlgorithm algo : {HashAlgorithm::xxHash64, HashAlgorithm::md5})
    {
        const std::string oneShot = getDigest(algo, data);

        for (size_t chunkSize : {1, 7, 4096, 65536, 1000 * 1000})
        {
            std::unique_ptr<ChecksumStream> stream = makeChecksumStream(algo);
            for (size_t pos = 0; pos < data.size(); pos += chunkSize)
                stream->update(std::string_view(data).substr(pos, chunkSize));

            assert(stream->finalize() == oneShot);
        }
    }
}


void testHashFile()
{
    TempFolder tmp;
    const std::string data = makeTestData(300 * 1000);
    writeTestFile(tmp / "clip.mov", data);

    for (HashAlgorithm algo : {HashAlgorithm::xxHash64, HashAlgorithm::md5})
    {
        int64_t bytesTotal = 0;
        int chunkCount = 0;
        const std::string digest = hashFile(tmp / "clip.mov", algo, 64 * 1024, [&](int64_t bytesDelta)
        {
            bytesTotal += bytesDelta;
            ++chunkCount;
        });
        assert(digest == getDigest(algo, data));
        assert(bytesTotal == static_cast<int64_t>(data.size()));
        assert(chunkCount == 5); //300000 / 65536 rounded up
    }

    //empty file
    writeTestFile(tmp / "empty.wav", "");
    assert(hashFile(tmp / "empty.wav", HashAlgorithm::xxHash64, COPY_CHUNK_SIZE, nullptr) == "ef46db3751d8e999");

    bool errorThrown = false;
    try
    {
        hashFile(tmp / "missing.mov", HashAlgorithm::md5, COPY_CHUNK_SIZE, nullptr);
    }
    catch (const FileError& e)
    {
        errorThrown = true;
        assert(contains(e.toString(), L"missing.mov"));
    }
    assert(errorThrown);
}


void testAlgorithmNames()
{
    assert(getHashAlgorithmName(HashAlgorithm::xxHash64) == "xxhash64");
    assert(getHashAlgorithmName(HashAlgorithm::md5) == "md5");

    assert(parseHashAlgorithm("xxhash64") == HashAlgorithm::xxHash64);
    assert(parseHashAlgorithm("MD5") == HashAlgorithm::md5);
    assert(!parseHashAlgorithm("sha1"));
}
}


int main()
{
    openSslInit();
    try
    {
        RUN_TEST(testKnownDigests);
        RUN_TEST(testIncrementalEqualsOneShot);
        RUN_TEST(testHashFile);
        RUN_TEST(testAlgorithmNames);
    }
    catch (const FileError& e) { std::cerr << utfTo<std::string>(e.toString()) << std::endl; return 1; }
    catch (const SysError&  e) { std::cerr << utfTo<std::string>(e.toString()) << std::endl; return 1; }
    return 0;
}
