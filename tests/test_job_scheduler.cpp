// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "test_tools.h"
#include <thread>
#include <zen/open_ssl.h>
#include "base/job_scheduler.h"
#include "base/scan.h"

using namespace zen;
using namespace slate;
using namespace slate::test;


namespace
{
class TestSchedulerCallback : public SchedulerCallback
{
public:
    void onJobProgress(const std::string& jobId, int64_t processed, double bytesPerSec, double etaSec) override
    {
        assert(etaSec >= 0 || etaSec == -1);
        ++jobProgressCount;
    }

    void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) override {}

    void onJobFinished(const Job& job) override
    {
        assert(isTerminal(getJobStatus(job)));
        finishedJobIds.push_back(getJobId(job));
    }

    void onQueueStarted  () override { events.push_back("started"); }
    void onQueuePaused   () override { events.push_back("paused"); }
    void onQueueResumed  () override { events.push_back("resumed"); }
    void onQueueCancelled() override { events.push_back("cancelled"); }
    void onQueueCompleted(bool withErrors) override
    {
        events.push_back("completed");
        queueCompletedWithErrors = withErrors;
    }

    void onQueueProgress(int64_t processedBytes, int64_t totalBytes, double bytesPerSec, double etaSec) override
    {
        assert(processedBytes >= lastProcessedBytes); //monotonic
        lastProcessedBytes = processedBytes;
        lastTotalBytes     = totalBytes;
    }

    void onEjectionRequested(const std::string& jobId, const std::vector<Zstring>& sourceRoots) override
    {
        ejectionRequests.emplace_back(jobId, sourceRoots);
    }

    void onPostProcessFinished(const std::string& jobId, bool success) override
    {
        postProcessed.emplace_back(jobId, success);
    }

    std::vector<std::string> events;
    std::vector<std::string> finishedJobIds;
    int jobProgressCount = 0;
    std::optional<bool> queueCompletedWithErrors;
    int64_t lastProcessedBytes = 0;
    int64_t lastTotalBytes = 0;
    std::vector<std::pair<std::string, std::vector<Zstring>>> ejectionRequests;
    std::vector<std::pair<std::string, bool>> postProcessed;
};


class TestPostProcessor : public PostProcessor
{
public:
    void runPostProcess(const TransferJob& job, PostProcessSink& sink) override //throw FileError
    {
        if (failWith)
            throw FileError(*failWith);

        for (const FileTransferRecord& rec : job.report.files)
            sink.patchFileRecord(rec.sourcePath, {{"thumbnail", utfTo<std::string>(getItemName(rec.sourcePath)) + ".jpg"}});
    }

    std::optional<std::wstring> failWith;
};


JobOptions makeOptions()
{
    JobOptions options;
    options.verifyMode = VerifyMode::full;
    return options;
}


TransferJob planCard(const TempFolder& tmp, const Zstring& cardName, size_t fileSize, unsigned int seed)
{
    writeTestFile(tmp / (cardName + "/clip1.mov"), makeTestData(fileSize, seed));
    writeTestFile(tmp / (cardName + "/clip2.mov"), makeTestData(fileSize / 2, seed + 1));
    createDirectoryIfMissingRecursion(tmp / "ssd");
    return planTransferJob({tmp / cardName}, {tmp / "ssd"}, makeOptions(), true);
}


const Job* findJob(const std::vector<Job>& jobs, const std::string& jobId)
{
    auto it = std::find_if(jobs.begin(), jobs.end(), [&](const Job& job) { return getJobId(job) == jobId; });
    return it != jobs.end() ? &*it : nullptr;
}


void testFifoOrder()
{
    TempFolder tmp;
    std::vector<std::string> jobIds;
    int64_t totalBytes = 0;

    TestSchedulerCallback cb;
    JobScheduler scheduler(cb, nullptr, 1);
    for (unsigned int i = 0; i < 3; ++i)
    {
        TransferJob job = planCard(tmp, "card" + numberTo<Zstring>(i), 100 * 1000, i * 10);
        jobIds.push_back(job.id);
        totalBytes += job.totalBytes;
        scheduler.addJob(std::move(job));
    }
    assert(scheduler.getJobs().size() == 3);
    assert(scheduler.getState() == QueueState::idle);

    scheduler.start();
    assert(scheduler.getState() == QueueState::running);

    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);

    assert(scheduler.getState() == QueueState::idle);
    assert(cb.finishedJobIds == jobIds);
    assert((cb.events == std::vector<std::string>{"started", "completed"}));
    assert(cb.queueCompletedWithErrors == false);
    assert(cb.lastProcessedBytes == totalBytes);
    assert(cb.lastTotalBytes     == totalBytes);
    assert(cb.jobProgressCount > 0);

    const std::vector<Job> jobs = scheduler.getJobs();
    assert(jobs.size() == 3);
    for (const Job& job : jobs)
        assert(getJobStatus(job) == JobStatus::completed);

    for (unsigned int i = 0; i < 3; ++i)
        assert(readTestFile(tmp / ("ssd/card" + numberTo<Zstring>(i) + "/clip1.mov")) == makeTestData(100 * 1000, i * 10));

    scheduler.clearFinishedJobs();
    assert(scheduler.getJobs().empty());
}


void testConcurrentJobsAndVerifyJob()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    JobScheduler scheduler(cb, nullptr, 1);
    scheduler.setMaxConcurrentJobs(0); //clamped
    scheduler.setMaxConcurrentJobs(2);

    int64_t totalBytes = 0;
    for (unsigned int i = 0; i < 3; ++i)
    {
        TransferJob job = planCard(tmp, "card" + numberTo<Zstring>(i), 200 * 1000, i);
        totalBytes += job.totalBytes;
        scheduler.addJob(std::move(job));
    }

    writeTestFile(tmp / "other/X001.mov", "x");
    VerifyJob verifyJob; //no manifest entries: verifies nothing
    verifyJob.id = createJobId();
    verifyJob.targetDir = tmp / "other";
    scheduler.addJob(verifyJob);

    scheduler.start();
    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);

    assert(cb.finishedJobIds.size() == 4);
    assert(cb.lastTotalBytes == totalBytes); //verify jobs don't count towards queue bytes
    assert(cb.lastProcessedBytes == totalBytes);
    assert(cb.queueCompletedWithErrors == false);
}


void testMissingPaths()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    JobScheduler scheduler(cb, nullptr);

    TransferJob job = planCard(tmp, "card", 1000, 1);
    const std::string jobId = job.id;
    scheduler.addJob(std::move(job));

    removeDirectoryPlainRecursion(tmp / "card"); //card pulled before start

    bool errorThrown = false;
    try
    {
        scheduler.start();
    }
    catch (const MissingPathsError& e)
    {
        errorThrown = true;
        const std::vector<Zstring>& missingPaths = e.getMissingPaths();
        assert(missingPaths.size() == 3); //root + 2 files
        assert(missingPaths[0] == tmp / "card");
        assert(contains(e.toString(), L"clip1.mov"));
    }
    assert(errorThrown);
    assert(scheduler.getState() == QueueState::idle);
    assert(cb.events.empty());

    const std::vector<Job> jobs = scheduler.getJobs();
    assert(jobs.size() == 1 && getJobStatus(jobs[0]) == JobStatus::queued);

    assert( scheduler.removeJob(jobId));
    assert(!scheduler.removeJob(jobId));
    assert(scheduler.getJobs().empty());
}


void testCancel()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    JobScheduler scheduler(cb, nullptr, 1);

    for (unsigned int i = 0; i < 3; ++i)
        scheduler.addJob(planCard(tmp, "card" + numberTo<Zstring>(i), 8 * 1024 * 1024, i));

    scheduler.start();
    scheduler.pause();
    assert(scheduler.getState() == QueueState::paused);

    scheduler.cancel();
    assert(scheduler.getState() == QueueState::idle);
    assert((cb.events == std::vector<std::string>{"started", "paused", "cancelled"}));

    const std::vector<Job> jobs = scheduler.getJobs();
    assert(jobs.size() == 3);
    for (const Job& job : jobs)
        assert(getJobStatus(job) == JobStatus::cancelled);

    scheduler.processEvents(); //late reports of the stopped engine are dropped
    assert(cb.finishedJobIds.empty());
    assert(!cb.queueCompletedWithErrors);

    scheduler.cancel(); //no-op when idle
    assert(cb.events.size() == 3);
}


void testPauseResume()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    JobScheduler scheduler(cb, nullptr, 1);

    TransferJob firstJob  = planCard(tmp, "card1", 2 * 1024 * 1024, 3);
    TransferJob secondJob = planCard(tmp, "card2", 1000, 5);
    const std::string secondJobId = secondJob.id;
    scheduler.addJob(std::move(firstJob));
    scheduler.addJob(std::move(secondJob));

    scheduler.start();
    scheduler.pause();
    scheduler.pause(); //no-op
    assert(getJobStatus(scheduler.getJobs()[0]) == JobStatus::paused);

    //while paused: no queued job is started, even if the active one finishes meanwhile
    const auto pauseEnd = std::chrono::steady_clock::now() + std::chrono::milliseconds(600);
    while (std::chrono::steady_clock::now() < pauseEnd)
    {
        scheduler.processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(scheduler.getState() == QueueState::paused);
    assert(getJobStatus(*findJob(scheduler.getJobs(), secondJobId)) == JobStatus::queued);

    //paused time does not count for speed and ETA
    assert(scheduler.getActiveTime() < std::chrono::milliseconds(300));

    scheduler.resume();
    assert(scheduler.getState() == QueueState::running);

    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);
    assert((cb.events == std::vector<std::string>{"started", "paused", "resumed", "completed"}));
    for (const Job& job : scheduler.getJobs())
        assert(getJobStatus(job) == JobStatus::completed);
}


void testCompletedWithErrorsAndEjection()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    JobScheduler scheduler(cb, nullptr);

    JobOptions options = makeOptions();
    options.ejectOnSuccess = true;

    writeTestFile(tmp / "cardA/A001.mov", makeTestData(1000, 1));
    writeTestFile(tmp / "cardB/B001.mov", makeTestData(1000, 2));
    writeTestFile(tmp / "blocked", "file, not a folder");
    createDirectoryIfMissingRecursion(tmp / "ssd");

    TransferJob okJob = planTransferJob({tmp / "cardA"}, {tmp / "ssd"}, options, true);
    TransferJob badJob = planTransferJob({tmp / "cardB"}, {tmp / "ssd"}, options, true);
    badJob.fileList[0].destPaths.push_back(tmp / "blocked/B001.mov");

    const std::string okJobId = okJob.id;
    scheduler.addJob(std::move(okJob));
    scheduler.addJob(std::move(badJob));

    scheduler.start();
    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);

    assert(cb.queueCompletedWithErrors == true);
    assert(cb.ejectionRequests.size() == 1);
    assert(cb.ejectionRequests[0].first == okJobId);
    assert(cb.ejectionRequests[0].second == std::vector<Zstring>{tmp / "cardA"});

    const std::vector<Job> jobs = scheduler.getJobs();
    assert(getJobStatus(jobs[0]) == JobStatus::completed);
    assert(getJobStatus(jobs[1]) == JobStatus::completedWithErrors);
    assert(!getJobErrors(jobs[1]).empty());
}


void testPostProcessing()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    TestPostProcessor postProcessor;
    JobScheduler scheduler(cb, &postProcessor);

    TransferJob job = planCard(tmp, "card", 1000, 1);
    const std::string jobId = job.id;
    scheduler.addJob(std::move(job));

    scheduler.start();
    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);

    assert((cb.postProcessed == std::vector<std::pair<std::string, bool>>{{jobId, true}}));

    const Job* result = findJob(scheduler.getJobs(), jobId);
    assert(result && getJobStatus(*result) == JobStatus::processed);
    for (const FileTransferRecord& rec : std::get<TransferJob>(*result).report.files)
        assert(rec.annotations.at("thumbnail") == utfTo<std::string>(getItemName(rec.sourcePath)) + ".jpg");
}


void testDeferredPostProcessing()
{
    TempFolder tmp;
    TestSchedulerCallback cb;
    TestPostProcessor postProcessor;
    JobScheduler scheduler(cb, &postProcessor, 1, true /*deferPostProcess*/);

    TransferJob job = planCard(tmp, "card", 1000, 1);
    const std::string jobId = job.id;
    scheduler.addJob(std::move(job));

    scheduler.start();
    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);

    assert(cb.postProcessed.empty());
    assert(getJobStatus(*findJob(scheduler.getJobs(), jobId)) == JobStatus::completed);

    assert(!scheduler.runPostProcessing("Job_unknown"));

    //failing post-processing keeps the status
    postProcessor.failWith = L"No thumbnail support.";
    assert(scheduler.runPostProcessing(jobId));
    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);
    assert(cb.postProcessed.size() == 1 && !cb.postProcessed[0].second);
    assert(getJobStatus(*findJob(scheduler.getJobs(), jobId)) == JobStatus::completed);

    postProcessor.failWith.reset();
    assert(scheduler.runPostProcessing(jobId));
    scheduler.waitUntilIdle(std::chrono::milliseconds(50), nullptr);
    assert(cb.postProcessed.size() == 2 && cb.postProcessed[1].second);
    assert(getJobStatus(*findJob(scheduler.getJobs(), jobId)) == JobStatus::processed);
}
}


int main()
{
    openSslInit();
    try
    {
        RUN_TEST(testFifoOrder);
        RUN_TEST(testConcurrentJobsAndVerifyJob);
        RUN_TEST(testMissingPaths);
        RUN_TEST(testCancel);
        RUN_TEST(testPauseResume);
        RUN_TEST(testCompletedWithErrorsAndEjection);
        RUN_TEST(testPostProcessing);
        RUN_TEST(testDeferredPostProcessing);
    }
    catch (const FileError& e) { std::cerr << utfTo<std::string>(e.toString()) << std::endl; return 1; }
    return 0;
}
