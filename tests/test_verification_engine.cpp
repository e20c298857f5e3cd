// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "test_tools.h"
#include <zen/open_ssl.h>
#include "base/checksum_stream.h"
#include "base/verification_engine.h"

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
        assert(jobProgress.empty() || jobProgress.back() < processed);
        jobProgress.push_back(processed);
        if (onProgress)
            onProgress(processed);
    }

    void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) override
    {
        lastStatusText = statusText;
    }

    void onJobFinished(Job&& job) override
    {
        assert(!finishedJob);
        finishedJob = std::get<VerifyJob>(std::move(job));
    }

    std::vector<int64_t> jobProgress;
    std::wstring lastStatusText;
    std::optional<VerifyJob> finishedJob;
    std::function<void(int64_t processed)> onProgress;
};


ManifestEntry makeEntry(const Zstring& targetDir, const Zstring& relPath, HashAlgorithm algo)
{
    ManifestEntry entry;
    entry.relativePath = relPath;
    entry.hashAlgo     = algo;
    entry.hash         = hashFile(appendPath(targetDir, relPath), algo, VERIFY_CHUNK_SIZE, nullptr);
    entry.size         = getFileSize(appendPath(targetDir, relPath));
    return entry;
}


VerifyJob runVerification(const VerifyJob& job, TestCallback& cb)
{
    VerificationEngine engine(job, cb);
    engine.run();
    assert(cb.finishedJob);
    return *cb.finishedJob;
}


void testAllVerified()
{
    TempFolder tmp;
    writeTestFile(tmp / "ssd/A001.mov",       makeTestData(500 * 1000, 1));
    writeTestFile(tmp / "ssd/sub/A002.mov",   makeTestData(1234, 2));
    writeTestFile(tmp / "ssd/sub/empty.wav",  "");

    VerifyJob job;
    job.id = createJobId();
    job.targetDir = tmp / "ssd";
    job.entries.push_back(makeEntry(job.targetDir, "A001.mov",      HashAlgorithm::xxHash64));
    job.entries.push_back(makeEntry(job.targetDir, "sub/A002.mov",  HashAlgorithm::md5));
    job.entries.push_back(makeEntry(job.targetDir, "sub/empty.wav", HashAlgorithm::xxHash64));

    for (char& c : job.entries[0].hash) //comparison ignores case
        c = asciiToUpper(c);

    TestCallback cb;
    const VerifyJob result = runVerification(job, cb);

    assert(result.status == JobStatus::completed);
    assert(result.report.verified == 3);
    assert(result.report.failed  == 0);
    assert(result.report.missing == 0);
    assert(result.report.errors.empty());
    assert(result.report.files.size() == 3);
    for (const FileVerifyRecord& rec : result.report.files)
    {
        assert(rec.status == EntryStatus::verified);
        assert(rec.actualHash.empty());
    }

    assert((cb.jobProgress == std::vector<int64_t>{1, 2, 3}));
    assert(cb.lastStatusText == L"Verified file 3 of 3");
    assert(getJobProgressTotal(Job(result)) == 3);
}


void testMissingAndMismatch()
{
    TempFolder tmp;
    writeTestFile(tmp / "ssd/B001.mov", makeTestData(1000, 3));
    writeTestFile(tmp / "ssd/B002.mov", makeTestData(1000, 4));
    writeTestFile(tmp / "ssd/B003.mov", makeTestData(1000, 5));

    VerifyJob job;
    job.id = createJobId();
    job.targetDir = tmp / "ssd";
    for (const Zstring& relPath : {"B001.mov", "B002.mov", "B003.mov"})
        job.entries.push_back(makeEntry(job.targetDir, relPath, HashAlgorithm::xxHash64));

    removeFilePlain(tmp / "ssd/B002.mov");

    {
        TestCallback cb;
        const VerifyJob result = runVerification(job, cb);

        assert(result.status == JobStatus::completedWithErrors);
        assert(result.report.verified == 2);
        assert(result.report.missing  == 1);
        assert(result.report.failed   == 0);
        assert(result.report.files[1].status == EntryStatus::missing);
        assert(result.report.files[1].relativePath == "B002.mov");
        assert(cb.jobProgress.size() == 3);
        assert(getStats(result.report.log).error == 1);
    }

    writeTestFile(tmp / "ssd/B002.mov", makeTestData(1000, 4));
    writeTestFile(tmp / "ssd/B003.mov", makeTestData(1000, 6)); //corrupted copy
    {
        TestCallback cb;
        const VerifyJob result = runVerification(job, cb);

        assert(result.status == JobStatus::completedWithErrors);
        assert(result.report.verified == 2);
        assert(result.report.failed   == 1);

        const FileVerifyRecord& rec = result.report.files[2];
        assert(rec.status == EntryStatus::failed);
        assert(rec.expectedHash == job.entries[2].hash);
        assert(rec.actualHash == hashFile(tmp / "ssd/B003.mov", HashAlgorithm::xxHash64, VERIFY_CHUNK_SIZE, nullptr));
    }
}


void testUnreadableManifest()
{
    TempFolder tmp;
    writeTestFile(tmp / "broken.mhl", "<hashlist><hash><file>x</file>");

    VerifyJob job;
    job.id = createJobId();
    job.manifestPath = tmp / "broken.mhl";
    job.targetDir    = tmp.path();

    TestCallback cb;
    const VerifyJob result = runVerification(job, cb);

    assert(result.status == JobStatus::completedWithErrors);
    assert(result.report.errors.size() == 1);
    assert(result.report.files.empty());
}


void testCancel()
{
    TempFolder tmp;
    VerifyJob job;
    job.id = createJobId();
    job.targetDir = tmp.path();
    for (const Zstring& relPath : {"C001.mov", "C002.mov", "C003.mov"})
    {
        writeTestFile(tmp / relPath, makeTestData(100, 7));
        job.entries.push_back(makeEntry(job.targetDir, relPath, HashAlgorithm::md5));
    }

    TestCallback cb;
    VerificationEngine engine(job, cb);
    cb.onProgress = [&](int64_t processed) { if (processed == 2) engine.cancel(); };
    engine.run();

    assert(cb.finishedJob);
    assert(cb.finishedJob->status == JobStatus::cancelled);
    assert(cb.finishedJob->report.files.size() == 2);
}
}


int main()
{
    openSslInit();
    try
    {
        RUN_TEST(testAllVerified);
        RUN_TEST(testMissingAndMismatch);
        RUN_TEST(testUnreadableManifest);
        RUN_TEST(testCancel);
    }
    catch (const FileError& e) { std::cerr << utfTo<std::string>(e.toString()) << std::endl; return 1; }
    return 0;
}
