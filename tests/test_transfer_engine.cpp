// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "test_tools.h"
#include <sys/stat.h>
#include <zen/open_ssl.h>
#include "base/checksum_stream.h"
#include "base/scan.h"
#include "base/transfer_engine.h"

using namespace zen;
using namespace slate;
using namespace slate::test;


namespace
{
class TestCallback : public EngineCallback
{
public:
    void onJobProgress(const std::string& jobId, int64_t processed, double bytesPerSec, std::optional<double> etaSec) override
    {
        jobProgress.push_back(processed);
        if (onProgress)
            onProgress(processed);
    }

    void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) override
    {
        assert(0 <= percent && percent <= 100);
        ++fileProgressCount;
    }

    void onJobFinished(Job&& job) override
    {
        assert(!finishedJob); //exactly once
        finishedJob = std::get<TransferJob>(std::move(job));
    }

    std::vector<int64_t> jobProgress;
    int fileProgressCount = 0;
    std::optional<TransferJob> finishedJob;
    std::function<void(int64_t processed)> onProgress;
};


TransferJob runTransfer(const TransferJob& job)
{
    TestCallback cb;
    TransferEngine engine(job, cb);
    engine.run();

    assert(cb.finishedJob);
    assert(std::is_sorted(cb.jobProgress.begin(), cb.jobProgress.end())); //never decreasing
    return *cb.finishedJob;
}


int countLogEntries(const TransferJob& job, MessageType type, const std::wstring& term)
{
    return static_cast<int>(std::count_if(job.report.log.begin(), job.report.log.end(), [&](const LogEntry& entry)
    {
        return entry.type == type && contains(utfTo<std::wstring>(entry.message), term);
    }));
}


JobOptions makeOptions(VerifyMode verifyMode, HashAlgorithm hashAlgo = HashAlgorithm::xxHash64)
{
    JobOptions options;
    options.verifyMode = verifyMode;
    options.hashAlgo   = hashAlgo;
    return options;
}


void createCard(const TempFolder& tmp)
{
    writeTestFile(tmp / "card/A001.mov",          makeTestData(1000 * 1000, 1));
    writeTestFile(tmp / "card/A002.mov",          makeTestData(123457,      2));
    writeTestFile(tmp / "card/audio/empty.wav",   "");
    writeTestFile(tmp / "card/audio/track1.wav",  makeTestData(9999,        3));
}


void assertSameContent(const Zstring& sourcePath, const Zstring& destPath)
{
    assert(readTestFile(sourcePath) == readTestFile(destPath));
    assert(getFileModTime(sourcePath) == getFileModTime(destPath));
}


//changes on every content, size or timestamp update
std::pair<time_t, long> getChangeTime(const Zstring& filePath)
{
    struct stat fileInfo = {};
    const int rv = ::stat(filePath.c_str(), &fileInfo);
    assert(rv == 0);
    return {fileInfo.st_ctim.tv_sec, fileInfo.st_ctim.tv_nsec};
}


void testRoundTrip()
{
    TempFolder tmp;
    createCard(tmp);

    const TransferJob plan = planTransferJob({tmp / "card"}, {tmp / "ssd1", tmp / "ssd2"}, makeOptions(VerifyMode::full), false);
    assert(plan.fileList.size() == 4);

    TestCallback cb;
    TransferEngine engine(plan, cb);
    engine.run();

    assert(cb.finishedJob);
    const TransferJob& job = *cb.finishedJob;
    assert(job.status == JobStatus::completed);
    assert(job.report.errors.empty());
    assert(job.report.files.size() == 4);
    assert(job.report.startTime <= job.report.endTime);

    for (const FileTransferRecord& rec : job.report.files)
    {
        assert(rec.status == FileStatus::verified);
        assert(rec.sourceChecksum == hashFile(rec.sourcePath, HashAlgorithm::xxHash64, COPY_CHUNK_SIZE, nullptr));
        assert(rec.destinations.size() == 2);

        for (const DestinationOutcome& dest : rec.destinations)
        {
            assert(dest.verified);
            assert(dest.statusText == L"Verified");
            assertSameContent(rec.sourcePath, dest.path);
        }
    }

    assert(cb.jobProgress.size() == 4);
    assert(cb.jobProgress.back() == static_cast<int64_t>(plan.totalBytes));
    assert(cb.fileProgressCount > 0);
}


void testIdempotence()
{
    TempFolder tmp;
    createCard(tmp);

    const TransferJob plan = planTransferJob({tmp / "card"}, {tmp / "ssd1"}, makeOptions(VerifyMode::full), false);

    const TransferJob first = runTransfer(plan);
    assert(first.status == JobStatus::completed);
    assert(countLogEntries(first, MSG_TYPE_INFO, L"Skipped existing") == 0);

    //a rewrite would restore the source's modification time and update the change time
    const time_t sentinelModTime = 1000000000;
    std::vector<std::pair<time_t, long>> changeTimes;
    for (const FileTransferRecord& rec : first.report.files)
    {
        setFileTime(rec.destinations[0].path, sentinelModTime, ProcSymlink::follow);
        changeTimes.push_back(getChangeTime(rec.destinations[0].path));
    }

    const TransferJob second = runTransfer(plan);
    assert(second.status == JobStatus::completed);
    assert(countLogEntries(second, MSG_TYPE_INFO, L"Skipped existing") == 4);

    for (size_t i = 0; i < second.report.files.size(); ++i)
    {
        const FileTransferRecord& rec = second.report.files[i];
        const Zstring& destPath = rec.destinations[0].path;

        assert(rec.status == FileStatus::verified); //skipped files are still verified
        assert(readTestFile(rec.sourcePath) == readTestFile(destPath));
        assert(getFileModTime(destPath) == sentinelModTime);
        assert(getChangeTime(destPath) == changeTimes[i]); //zero writes
    }
}


void testResume()
{
    TempFolder tmp;
    const std::string data = makeTestData(3 * 1024 * 1024 + 11, 4);
    writeTestFile(tmp / "card/B001.mov", data);

    writeTestFile(tmp / "ssd1/B001.mov", data.substr(0, 1024 * 1024 + 3));       //partial copy
    writeTestFile(tmp / "ssd2/B001.mov", makeTestData(data.size() + 500, 5)); //larger than source: restart

    for (VerifyMode verifyMode : {VerifyMode::full, VerifyMode::sizeOnly})
    {
        const TransferJob plan = planTransferJob({tmp / "card"}, {tmp / "ssd1", tmp / "ssd2"}, makeOptions(verifyMode), false);
        const TransferJob job = runTransfer(plan);

        assert(job.status == JobStatus::completed);
        assert(job.report.files.size() == 1);
        assert(job.report.files[0].status == FileStatus::verified);

        assert(readTestFile(tmp / "ssd1/B001.mov") == data);
        assert(readTestFile(tmp / "ssd2/B001.mov") == data);

        if (verifyMode == VerifyMode::full)
            assert(countLogEntries(job, MSG_TYPE_INFO, L"Resuming") == 1);
        else
            assert(countLogEntries(job, MSG_TYPE_INFO, L"Resuming") == 2);

        //prepare next round: partial again
        writeTestFile(tmp / "ssd1/B001.mov", data.substr(0, 77));
        writeTestFile(tmp / "ssd2/B001.mov", data.substr(0, 77));
    }
}


void testResumeAppendsOnly()
{
    TempFolder tmp;
    const std::string data = makeTestData(2 * 1024 * 1024 + 5, 14);
    writeTestFile(tmp / "card/B002.mov", data);

    //prefix differs from the source: must survive since only the tail is written
    const size_t prefixLen = data.size() / 2;
    const std::string marker(prefixLen, 'X');
    writeTestFile(tmp / "ssd/B002.mov", marker);

    const TransferJob job = runTransfer(planTransferJob({tmp / "card"}, {tmp / "ssd"}, makeOptions(VerifyMode::sizeOnly), false));
    assert(job.status == JobStatus::completed);
    assert(countLogEntries(job, MSG_TYPE_INFO, L"Resuming") == 1);

    assert(readTestFile(tmp / "ssd/B002.mov") == marker + data.substr(prefixLen));
}


void testResumeDisabled()
{
    TempFolder tmp;
    const std::string data = makeTestData(200 * 1000, 6);
    writeTestFile(tmp / "card/C001.mov", data);
    writeTestFile(tmp / "ssd/C001.mov", "garbage");

    JobOptions options = makeOptions(VerifyMode::full);
    options.resumePartial = false;

    const TransferJob job = runTransfer(planTransferJob({tmp / "card"}, {tmp / "ssd"}, options, false));
    assert(job.status == JobStatus::completed);
    assert(countLogEntries(job, MSG_TYPE_INFO, L"Resuming") == 0);
    assert(readTestFile(tmp / "ssd/C001.mov") == data);
}


void testFanOutFailure()
{
    TempFolder tmp;
    writeTestFile(tmp / "card/D001.mov", makeTestData(100 * 1000, 7));
    writeTestFile(tmp / "blocked", "not a folder"); //destination root is a file

    const TransferJob job = runTransfer(planTransferJob({tmp / "card"}, {tmp / "ssd", tmp / "blocked"}, makeOptions(VerifyMode::full), false));

    assert(job.status == JobStatus::completedWithErrors);
    assert(!job.report.errors.empty());
    assert(contains(job.report.errors[0], L"D001.mov"));

    const FileTransferRecord& rec = job.report.files[0];
    assert(rec.status == FileStatus::failed);
    assert(rec.destinations.size() == 2);
    assert( rec.destinations[0].verified); //healthy destination is unaffected
    assert(!rec.destinations[1].verified);
    assert(!rec.destinations[1].statusText.empty());

    assertSameContent(rec.sourcePath, tmp / "ssd/D001.mov");
}


void testCancel()
{
    TempFolder tmp;
    writeTestFile(tmp / "card/E001.mov", makeTestData(50 * 1000, 8));
    writeTestFile(tmp / "card/E002.mov", makeTestData(50 * 1000, 9));
    writeTestFile(tmp / "card/E003.mov", makeTestData(50 * 1000, 10));

    const TransferJob plan = planTransferJob({tmp / "card"}, {tmp / "ssd"}, makeOptions(VerifyMode::full), false);

    TestCallback cb;
    TransferEngine engine(plan, cb);
    cb.onProgress = [&](int64_t /*processed*/) { engine.cancel(); }; //after first file
    engine.run();

    assert(cb.finishedJob);
    const TransferJob& job = *cb.finishedJob;
    assert(job.status == JobStatus::cancelled);
    assert(job.report.files.size() == 1);
    assert(job.report.files[0].status == FileStatus::verified);
    assert(countLogEntries(job, MSG_TYPE_WARNING, L"Stopped") == 1);

    assert( itemExists(tmp / "ssd/E001.mov"));
    assert(!itemExists(tmp / "ssd/E003.mov"));
}


void testLargeFileTwoDestinations()
{
    TempFolder tmp;
    const std::string data = makeTestData(10 * 1024 * 1024, 11); //spans several copy chunks
    writeTestFile(tmp / "card/F001.mov", data);

    for (const auto& [hashAlgo, checksumLen] : {std::pair{HashAlgorithm::xxHash64, 16}, std::pair{HashAlgorithm::md5, 32}})
    {
        const Zstring destFolder1 = tmp / ("ssd1_" + getHashAlgorithmName(hashAlgo));
        const Zstring destFolder2 = tmp / ("ssd2_" + getHashAlgorithmName(hashAlgo));

        const TransferJob job = runTransfer(planTransferJob({tmp / "card"}, {destFolder1, destFolder2}, makeOptions(VerifyMode::full, hashAlgo), true));

        assert(job.status == JobStatus::completed);
        const FileTransferRecord& rec = job.report.files[0];
        assert(rec.status == FileStatus::verified);
        assert(rec.size == data.size());
        assert(rec.sourceChecksum.size() == static_cast<size_t>(checksumLen));
        assert(rec.destinations.size() == 2);

        for (const Zstring& destPath : {appendPath(destFolder1, "card/F001.mov"), appendPath(destFolder2, "card/F001.mov")})
        {
            assert(hashFile(destPath, hashAlgo, VERIFY_CHUNK_SIZE, nullptr) == rec.sourceChecksum);
            assert(readTestFile(destPath) == data);
        }
    }
}


void testVerifyModes()
{
    TempFolder tmp;
    createCard(tmp);

    TestCallback cbNone;
    TransferEngine engineNone(planTransferJob({tmp / "card"}, {tmp / "ssdNone"}, makeOptions(VerifyMode::none), false), cbNone);
    engineNone.run();
    const TransferJob& jobNone = *cbNone.finishedJob;

    assert(jobNone.status == JobStatus::completed);
    assert(cbNone.jobProgress.size() == 4);
    assert(cbNone.jobProgress.back() == 0); //only verified bytes count as progress
    for (const FileTransferRecord& rec : jobNone.report.files)
    {
        assert(rec.status == FileStatus::copiedUnverified);
        assert(rec.sourceChecksum.empty());
        assert(rec.destinations[0].statusText == L"Unverified");
        assertSameContent(rec.sourcePath, rec.destinations[0].path);
    }

    const TransferJob jobSize = runTransfer(planTransferJob({tmp / "card"}, {tmp / "ssdSize"}, makeOptions(VerifyMode::sizeOnly), false));
    assert(jobSize.status == JobStatus::completed);
    for (const FileTransferRecord& rec : jobSize.report.files)
    {
        assert(rec.status == FileStatus::verified);
        assert(rec.destinations[0].statusText == L"Verified (Size Only)");
    }
}


void testSourceLost()
{
    TempFolder tmp;
    writeTestFile(tmp / "card/H001.mov", makeTestData(1000, 15));
    writeTestFile(tmp / "card/H002.mov", makeTestData(1000, 16));

    const TransferJob plan = planTransferJob({tmp / "card"}, {tmp / "ssd1", tmp / "ssd2"}, makeOptions(VerifyMode::full), false);
    removeFilePlain(tmp / "card/H001.mov"); //card pulled during the job

    const TransferJob job = runTransfer(plan);
    assert(job.status == JobStatus::completedWithErrors);
    assert(job.report.files.size() == 2);

    const FileTransferRecord& lost = job.report.files[0];
    assert(lost.status == FileStatus::failed);
    assert(lost.destinations.size() == 2); //every destination is accounted for
    for (const DestinationOutcome& dest : lost.destinations)
    {
        assert(!dest.verified);
        assert(!dest.statusText.empty());
    }
    assert(lost.destinations[0].path == tmp / "ssd1/H001.mov");
    assert(lost.destinations[1].path == tmp / "ssd2/H001.mov");

    assert(job.report.files[1].status == FileStatus::verified);
}


void testEjectableSources()
{
    TempFolder tmp;
    writeTestFile(tmp / "cardA/G001.mov", makeTestData(1000, 12));
    writeTestFile(tmp / "cardB/G002.mov", makeTestData(1000, 13));

    JobOptions options = makeOptions(VerifyMode::full);
    options.ejectOnSuccess = true;

    TransferJob plan = planTransferJob({tmp / "cardA", tmp / "cardB"}, {tmp / "ssd"}, options, true);
    plan.fileList[1].destPaths.push_back(tmp / "cardA/G001.mov/blocked"); //second card fails

    const TransferJob job = runTransfer(plan);
    assert(job.status == JobStatus::completedWithErrors);
    assert(job.report.ejectableSources == std::vector<Zstring>{tmp / "cardA"});
}
}


int main()
{
    openSslInit();
    try
    {
        RUN_TEST(testRoundTrip);
        RUN_TEST(testIdempotence);
        RUN_TEST(testResume);
        RUN_TEST(testResumeAppendsOnly);
        RUN_TEST(testResumeDisabled);
        RUN_TEST(testFanOutFailure);
        RUN_TEST(testCancel);
        RUN_TEST(testLargeFileTwoDestinations);
        RUN_TEST(testVerifyModes);
        RUN_TEST(testSourceLost);
        RUN_TEST(testEjectableSources);
    }
    catch (const FileError& e) { std::cerr << utfTo<std::string>(e.toString()) << std::endl; return 1; }
    return 0;
}
