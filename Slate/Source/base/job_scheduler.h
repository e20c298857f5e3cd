// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef JOB_SCHEDULER_H_2837465019283746
#define JOB_SCHEDULER_H_2837465019283746

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <zen/file_error.h>
#include <zen/thread.h>
#include "engine.h"
#include "progress_aggregator.h"


namespace slate
{
//notifications: context of the coordinating thread (the one calling processEvents())
class SchedulerCallback
{
public:
    virtual ~SchedulerCallback() {}

    //etaSec < 0: unknown
    virtual void onJobProgress (const std::string& jobId, int64_t processed, double bytesPerSec, double etaSec) = 0;
    virtual void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) = 0;
    virtual void onJobFinished (const Job& job) = 0;

    virtual void onQueueStarted  () = 0;
    virtual void onQueuePaused   () = 0;
    virtual void onQueueResumed  () = 0;
    virtual void onQueueCancelled() = 0;
    virtual void onQueueCompleted(bool withErrors) = 0;
    virtual void onQueueProgress(int64_t processedBytes, int64_t totalBytes, double bytesPerSec, double etaSec) = 0;

    virtual void onEjectionRequested(const std::string& jobId, const std::vector<Zstring>& sourceRoots) = 0;
    virtual void onPostProcessFinished(const std::string& jobId, bool success) = 0;
};


class PostProcessSink
{
public:
    virtual ~PostProcessSink() {}
    virtual void patchFileRecord(const Zstring& sourcePath, const Annotations& annotations) = 0; //thread-safe
};


//e.g. thumbnail and metadata extraction: runs on a worker thread, one job at a time
class PostProcessor
{
public:
    virtual ~PostProcessor() {}
    virtual void runPostProcess(const TransferJob& job, PostProcessSink& sink) = 0; //throw FileError
};


class MissingPathsError : public zen::FileError
{
public:
    explicit MissingPathsError(const std::vector<Zstring>& missingPaths);

    const std::vector<Zstring>& getMissingPaths() const { return missingPaths_; }

private:
    std::vector<Zstring> missingPaths_;
};


//single-owner actor: all member functions must be called from the coordinating thread
class JobScheduler
{
public:
    JobScheduler(SchedulerCallback& cb, PostProcessor* postProcessor /*optional*/, size_t maxConcurrentJobs = 1, bool deferPostProcess = false);
    ~JobScheduler();

    void addJob(Job job);
    bool removeJob(const std::string& jobId); //queued jobs only
    void clearFinishedJobs();
    void setMaxConcurrentJobs(size_t count); //>= 1
    std::vector<Job> getJobs() const; //finished, active, queued

    QueueState getState() const { return state_; }
    std::chrono::nanoseconds getActiveTime() const; //since start(), excluding pauses

    void start(); //throw MissingPathsError
    void pause();
    void resume();
    void cancel();

    bool runPostProcessing(const std::string& jobId); //for deferred jobs; false if not a finished copy job

    void processEvents(); //dispatch pending engine messages
    //returns when queue and post-processing are done; "onInterval" may call pause()/resume()/cancel()
    void waitUntilIdle(std::chrono::milliseconds cbInterval, const std::function<void()>& onInterval /*optional*/);

private:
    JobScheduler           (const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    struct JobProgressMsg
    {
        std::string jobId;
        int64_t processed = 0;
        double bytesPerSec = 0;
        std::optional<double> etaSec;
    };
    struct FileProgressMsg
    {
        std::string jobId;
        double percent = 0;
        std::wstring statusText;
        Zstring currentPath;
        double bytesPerSec = 0;
    };
    struct JobFinishedMsg
    {
        Job job;
    };
    struct PatchRecordMsg
    {
        std::string jobId;
        Zstring sourcePath;
        Annotations annotations;
    };
    struct PostProcessDoneMsg
    {
        std::string jobId;
        std::optional<std::wstring> errorMsg;
    };
    using Message = std::variant<JobProgressMsg, FileProgressMsg, JobFinishedMsg, PatchRecordMsg, PostProcessDoneMsg>;

    class Mailbox //non-blocking for senders
    {
    public:
        void post(Message&& msg) //context of any thread
        {
            {
                std::lock_guard dummy(lockMessages_);
                messages_.push_back(std::move(msg));
            }
            conditionNewMessage_.notify_all();
        }

        std::vector<Message> fetchAll()
        {
            std::lock_guard dummy(lockMessages_);
            return std::exchange(messages_, {});
        }

        void waitForMessages(std::chrono::steady_clock::time_point timeout)
        {
            std::unique_lock dummy(lockMessages_);
            conditionNewMessage_.wait_until(dummy, timeout, [this] { return !messages_.empty(); });
        }

    private:
        std::mutex lockMessages_;
        std::condition_variable conditionNewMessage_;
        std::vector<Message> messages_;
    };

    class EngineCallbackImpl : public EngineCallback
    {
    public:
        explicit EngineCallbackImpl(Mailbox& mailbox) : mailbox_(mailbox) {}

        void onJobProgress(const std::string& jobId, int64_t processed, double bytesPerSec, std::optional<double> etaSec) override
        { mailbox_.post(JobProgressMsg{jobId, processed, bytesPerSec, etaSec}); }

        void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) override
        { mailbox_.post(FileProgressMsg{jobId, percent, statusText, currentPath, bytesPerSec}); }

        void onJobFinished(Job&& job) override { mailbox_.post(JobFinishedMsg{std::move(job)}); }

    private:
        Mailbox& mailbox_;
    };

    struct ActiveJob
    {
        Job job; //snapshot for getJobs()
        int64_t progressReported = 0;
        std::unique_ptr<Engine> engine;
        zen::InterruptibleThread worker; //destroy before engine!
    };

    void dispatch(JobProgressMsg& msg);
    void dispatch(FileProgressMsg& msg);
    void dispatch(JobFinishedMsg& msg);
    void dispatch(PatchRecordMsg& msg);
    void dispatch(PostProcessDoneMsg& msg);

    void startAvailableJobs();
    void checkQueueDrained();
    void startPostProcessingIfNeeded();
    void addQueueProgress(int64_t bytesDelta);
    void reportQueueProgress();

    std::vector<std::unique_ptr<ActiveJob>>::iterator findActive(const std::string& jobId);
    Job* findFinished(const std::string& jobId);

    SchedulerCallback& cb_;
    PostProcessor* const postProcessor_;
    size_t maxConcurrentJobs_;
    const bool deferPostProcess_;

    QueueState state_ = QueueState::idle;
    bool hadErrors_ = false;

    Mailbox mailbox_;
    EngineCallbackImpl engineCallback_{mailbox_};

    std::deque<Job> queue_;
    std::vector<std::unique_ptr<ActiveJob>> active_;
    std::vector<Job> finished_; //in completion order

    int64_t totalQueueBytes_     = 0;
    int64_t processedQueueBytes_ = 0;
    ProgressAggregator aggregator_;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point pauseStart_;
    std::chrono::nanoseconds pausedTotal_{};

    std::deque<std::string> postProcessQueue_;
    bool postProcessRunning_ = false;
    std::string postProcessJobId_;
    zen::InterruptibleThread postProcessThread_; //uses mailbox_ => declare last!
};
}

#endif //JOB_SCHEDULER_H_2837465019283746
