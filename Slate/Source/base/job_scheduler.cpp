// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "job_scheduler.h"
#include <algorithm>
#include <zen/file_access.h>
#include <zen/i18n.h>
#include "transfer_engine.h"
#include "verification_engine.h"

using namespace zen;
using namespace slate;


namespace
{
std::wstring formatPathList(const std::vector<Zstring>& paths)
{
    std::wstring output;
    for (const Zstring& path : paths)
        output += fmtPath(path) + L'\n';
    trim(output);
    return output;
}


class PostProcessSinkImpl : public PostProcessSink
{
public:
    explicit PostProcessSinkImpl(const std::function<void(const Zstring& sourcePath, const Annotations& annotations)>& postPatch) : postPatch_(postPatch) {}

    void patchFileRecord(const Zstring& sourcePath, const Annotations& annotations) override { postPatch_(sourcePath, annotations); }

private:
    const std::function<void(const Zstring& sourcePath, const Annotations& annotations)> postPatch_;
};


zen::ErrorLog& getJobLogRef(Job& job)
{
    if (auto transferJob = std::get_if<TransferJob>(&job))
        return transferJob->report.log;
    return std::get<VerifyJob>(job).report.log;
}
}


MissingPathsError::MissingPathsError(const std::vector<Zstring>& missingPaths) :
    FileError(_("The following paths are not available:"), formatPathList(missingPaths)),
    missingPaths_(missingPaths) {}


JobScheduler::JobScheduler(SchedulerCallback& cb, PostProcessor* postProcessor, size_t maxConcurrentJobs, bool deferPostProcess) :
    cb_(cb),
    postProcessor_(postProcessor),
    maxConcurrentJobs_(std::max<size_t>(maxConcurrentJobs, 1)),
    deferPostProcess_(deferPostProcess) {}


JobScheduler::~JobScheduler()
{
    for (const std::unique_ptr<ActiveJob>& aj : active_)
    {
        aj->engine->cancel();
        aj->worker.requestStop();
    }
    active_.clear(); //join before engines go out of scope
}


void JobScheduler::addJob(Job job)
{
    setJobStatus(job, JobStatus::queued);

    if (state_ != QueueState::idle)
        if (const TransferJob* transferJob = std::get_if<TransferJob>(&job))
            totalQueueBytes_ += transferJob->totalBytes;

    queue_.push_back(std::move(job));

    startAvailableJobs();
}


bool JobScheduler::removeJob(const std::string& jobId)
{
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const Job& job) { return getJobId(job) == jobId; });
    if (it == queue_.end())
        return false;

    if (state_ != QueueState::idle)
        if (const TransferJob* transferJob = std::get_if<TransferJob>(&*it))
            totalQueueBytes_ -= transferJob->totalBytes;

    queue_.erase(it);
    checkQueueDrained();
    return true;
}


void JobScheduler::clearFinishedJobs()
{
    //keep jobs waiting for post-processing
    std::erase_if(finished_, [&](const Job& job)
    {
        const std::string& jobId = getJobId(job);
        return jobId != postProcessJobId_ &&
               std::find(postProcessQueue_.begin(), postProcessQueue_.end(), jobId) == postProcessQueue_.end();
    });
}


void JobScheduler::setMaxConcurrentJobs(size_t count)
{
    maxConcurrentJobs_ = std::max<size_t>(count, 1);
    startAvailableJobs();
}


std::vector<Job> JobScheduler::getJobs() const
{
    std::vector<Job> jobs = finished_;

    for (const std::unique_ptr<ActiveJob>& aj : active_)
        jobs.push_back(aj->job);

    jobs.insert(jobs.end(), queue_.begin(), queue_.end());
    return jobs;
}


void JobScheduler::start() //throw MissingPathsError
{
    if (state_ != QueueState::idle)
        return;

    //preflight: fail fast on disconnected cards and drives
    std::vector<Zstring> missingPaths;
    auto checkPath = [&](const Zstring& itemPath)
    {
        if (std::find(missingPaths.begin(), missingPaths.end(), itemPath) != missingPaths.end())
            return;
        bool exists = false;
        try { exists = itemExists(itemPath); /*throw FileError*/ }
        catch (FileError&) {} //not accessible => as good as missing
        if (!exists)
            missingPaths.push_back(itemPath);
    };

    for (const Job& job : queue_)
        if (const TransferJob* transferJob = std::get_if<TransferJob>(&job))
        {
            for (const Zstring& sourceRoot : transferJob->sources)
                checkPath(sourceRoot);
            for (const TransferItem& item : transferJob->fileList)
                checkPath(item.sourcePath);
            for (const Zstring& destRoot : transferJob->destinations)
                checkPath(destRoot);
        }

    if (!missingPaths.empty())
        throw MissingPathsError(missingPaths);

    totalQueueBytes_     = 0;
    processedQueueBytes_ = 0;
    for (const Job& job : queue_)
        if (const TransferJob* transferJob = std::get_if<TransferJob>(&job))
            totalQueueBytes_ += transferJob->totalBytes;

    hadErrors_ = false;
    aggregator_.clear();
    startTime_   = std::chrono::steady_clock::now();
    pausedTotal_ = {};
    aggregator_.addSample(std::chrono::nanoseconds(0), 0);

    state_ = QueueState::running;
    cb_.onQueueStarted();

    startAvailableJobs();
    checkQueueDrained();
}


void JobScheduler::pause()
{
    if (state_ != QueueState::running)
        return;

    state_ = QueueState::paused;
    pauseStart_ = std::chrono::steady_clock::now();

    for (const std::unique_ptr<ActiveJob>& aj : active_)
    {
        aj->engine->pause();
        setJobStatus(aj->job, JobStatus::paused);
    }
    cb_.onQueuePaused();
}


void JobScheduler::resume()
{
    if (state_ != QueueState::paused)
        return;

    state_ = QueueState::running;
    pausedTotal_ += std::chrono::steady_clock::now() - pauseStart_; //paused time does not count for speed and ETA

    for (const std::unique_ptr<ActiveJob>& aj : active_)
    {
        aj->engine->resume();
        setJobStatus(aj->job, JobStatus::running);
    }
    cb_.onQueueResumed();

    startAvailableJobs();
}


void JobScheduler::cancel()
{
    if (state_ == QueueState::idle)
        return;

    for (const std::unique_ptr<ActiveJob>& aj : active_)
    {
        aj->engine->cancel();
        aj->worker.requestStop(); //interrupt a paused engine right away
    }

    for (const std::unique_ptr<ActiveJob>& aj : active_)
    {
        aj->worker.join();

        setJobStatus(aj->job, JobStatus::cancelled);
        finished_.push_back(std::move(aj->job));
    }
    active_.clear();

    for (Job& job : queue_)
    {
        setJobStatus(job, JobStatus::cancelled);
        finished_.push_back(std::move(job));
    }
    queue_.clear();

    state_ = QueueState::idle;
    cb_.onQueueCancelled();
}


bool JobScheduler::runPostProcessing(const std::string& jobId)
{
    Job* job = findFinished(jobId);
    if (!job || !std::holds_alternative<TransferJob>(*job))
        return false;

    const JobStatus status = getJobStatus(*job);
    if (status != JobStatus::completed && status != JobStatus::processed)
        return false;

    if (!postProcessor_ ||
        std::find(postProcessQueue_.begin(), postProcessQueue_.end(), jobId) != postProcessQueue_.end())
        return false;

    postProcessQueue_.push_back(jobId);
    startPostProcessingIfNeeded();
    return true;
}


void JobScheduler::processEvents()
{
    for (Message& msg : mailbox_.fetchAll())
        std::visit([&](auto& m) { dispatch(m); }, msg);
}


void JobScheduler::waitUntilIdle(std::chrono::milliseconds cbInterval, const std::function<void()>& onInterval)
{
    auto nextCallback = std::chrono::steady_clock::now() + cbInterval;
    for (;;)
    {
        processEvents();

        if (state_ == QueueState::idle && !postProcessRunning_ && postProcessQueue_.empty())
            return;

        mailbox_.waitForMessages(nextCallback);

        if (const auto now = std::chrono::steady_clock::now();
            now >= nextCallback)
        {
            nextCallback = now + cbInterval;

            if (state_ == QueueState::running)
                reportQueueProgress();
            if (onInterval)
                onInterval();
        }
    }
}


void JobScheduler::dispatch(JobProgressMsg& msg)
{
    auto it = findActive(msg.jobId);
    if (it == active_.end())
        return; //discarded

    ActiveJob& aj = **it;
    if (msg.processed > aj.progressReported) //monotonic
    {
        const int64_t delta = msg.processed - aj.progressReported;
        aj.progressReported = msg.processed;

        if (std::holds_alternative<TransferJob>(aj.job))
            addQueueProgress(delta);
    }
    cb_.onJobProgress(msg.jobId, aj.progressReported, msg.bytesPerSec, etaToEventValue(msg.etaSec));
}


void JobScheduler::dispatch(FileProgressMsg& msg)
{
    if (findActive(msg.jobId) == active_.end())
        return;

    cb_.onFileProgress(msg.jobId, msg.percent, msg.statusText, msg.currentPath, msg.bytesPerSec);
}


void JobScheduler::dispatch(JobFinishedMsg& msg)
{
    const std::string jobId = getJobId(msg.job);

    auto it = findActive(jobId);
    if (it == active_.end())
        return; //engine was cancelled: report is stale

    (*it)->worker.join(); //engine thread is finishing anyway after posting its report

    //account for bytes of failed or unverified files: queue progress reaches the total
    if (std::holds_alternative<TransferJob>(msg.job))
        addQueueProgress(getJobProgressTotal(msg.job) - (*it)->progressReported);

    active_.erase(it);

    Job& job = finished_.emplace_back(std::move(msg.job));
    if (getJobStatus(job) != JobStatus::completed)
        hadErrors_ = true;

    cb_.onJobFinished(job);

    if (const TransferJob* transferJob = std::get_if<TransferJob>(&job))
    {
        if (transferJob->status == JobStatus::completed && postProcessor_ && !deferPostProcess_)
            postProcessQueue_.push_back(jobId);

        if (transferJob->options.ejectOnSuccess && !transferJob->report.ejectableSources.empty())
            cb_.onEjectionRequested(jobId, transferJob->report.ejectableSources);
    }

    startAvailableJobs();
    checkQueueDrained();
    startPostProcessingIfNeeded();
}


void JobScheduler::dispatch(PatchRecordMsg& msg)
{
    if (Job* job = findFinished(msg.jobId))
        if (TransferJob* transferJob = std::get_if<TransferJob>(job))
            if (!patchFileRecord(*transferJob, msg.sourcePath, msg.annotations))
                logMsg(transferJob->report.log, replaceCpy(_("Cannot find file %x."), L"%x", fmtPath(msg.sourcePath)), MSG_TYPE_WARNING);
}


void JobScheduler::dispatch(PostProcessDoneMsg& msg)
{
    postProcessThread_.join();
    postProcessRunning_ = false;
    postProcessJobId_.clear();

    if (Job* job = findFinished(msg.jobId))
    {
        if (msg.errorMsg)
            logMsg(getJobLogRef(*job), *msg.errorMsg, MSG_TYPE_ERROR);
        else
            setJobStatus(*job, JobStatus::processed);
    }
    cb_.onPostProcessFinished(msg.jobId, !msg.errorMsg);

    startPostProcessingIfNeeded();
}


void JobScheduler::startAvailableJobs()
{
    while (state_ == QueueState::running && active_.size() < maxConcurrentJobs_ && !queue_.empty())
    {
        auto aj = std::make_unique<ActiveJob>();
        aj->job = std::move(queue_.front());
        queue_.pop_front();

        setJobStatus(aj->job, JobStatus::running);

        if (const TransferJob* transferJob = std::get_if<TransferJob>(&aj->job))
            aj->engine = std::make_unique<TransferEngine>(*transferJob, engineCallback_);
        else
            aj->engine = std::make_unique<VerificationEngine>(std::get<VerifyJob>(aj->job), engineCallback_);

        aj->worker = InterruptibleThread([engine = aj->engine.get()]
        {
            setCurrentThreadName(Zstr("Slate Engine"));
            engine->run();
        });

        active_.push_back(std::move(aj));
    }
}


void JobScheduler::checkQueueDrained()
{
    if (state_ != QueueState::idle && queue_.empty() && active_.empty())
    {
        state_ = QueueState::idle;
        reportQueueProgress();
        cb_.onQueueCompleted(hadErrors_);
    }
}


void JobScheduler::startPostProcessingIfNeeded()
{
    if (postProcessRunning_ || !postProcessor_)
        return;

    while (!postProcessQueue_.empty())
    {
        const std::string jobId = postProcessQueue_.front();
        postProcessQueue_.pop_front();

        Job* job = findFinished(jobId);
        if (!job) //removed via clearFinishedJobs() meanwhile
            continue;

        postProcessRunning_ = true;
        postProcessJobId_ = jobId;
        postProcessThread_ = InterruptibleThread([this, jobId, transferJob = std::get<TransferJob>(*job)]
        {
            setCurrentThreadName(Zstr("Slate Post-Processing"));

            PostProcessSinkImpl sink([this, jobId](const Zstring& sourcePath, const Annotations& annotations)
            {
                mailbox_.post(PatchRecordMsg{jobId, sourcePath, annotations});
            });

            std::optional<std::wstring> errorMsg;
            try
            {
                postProcessor_->runPostProcess(transferJob, sink); //throw FileError
            }
            catch (const FileError& e) { errorMsg = e.toString(); }

            mailbox_.post(PostProcessDoneMsg{jobId, errorMsg});
        });
        return;
    }
}


void JobScheduler::addQueueProgress(int64_t bytesDelta)
{
    processedQueueBytes_ += bytesDelta;
    aggregator_.addSample(getActiveTime(), processedQueueBytes_);
    reportQueueProgress();
}


void JobScheduler::reportQueueProgress()
{
    cb_.onQueueProgress(processedQueueBytes_, totalQueueBytes_, aggregator_.getBytesPerSec(),
                        etaToEventValue(aggregator_.getRemainingSec(totalQueueBytes_ - processedQueueBytes_)));
}


std::chrono::nanoseconds JobScheduler::getActiveTime() const
{
    const auto now = std::chrono::steady_clock::now();
    std::chrono::nanoseconds elapsed = now - startTime_ - pausedTotal_;
    if (state_ == QueueState::paused)
        elapsed -= now - pauseStart_;
    return elapsed;
}


std::vector<std::unique_ptr<JobScheduler::ActiveJob>>::iterator JobScheduler::findActive(const std::string& jobId)
{
    return std::find_if(active_.begin(), active_.end(), [&](const std::unique_ptr<ActiveJob>& aj) { return getJobId(aj->job) == jobId; });
}


Job* JobScheduler::findFinished(const std::string& jobId)
{
    auto it = std::find_if(finished_.begin(), finished_.end(), [&](const Job& job) { return getJobId(job) == jobId; });
    return it != finished_.end() ? &*it : nullptr;
}
