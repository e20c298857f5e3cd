// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <csignal>
#include <iostream>
#include <zen/extra_log.h>
#include <zen/file_access.h>
#include <zen/format_unit.h>
#include <zen/open_ssl.h>
#include "base/job_scheduler.h"
#include "base/manifest.h"
#include "base/scan.h"
#include "version/version.h"
#include "config.h"
#include "log_file.h"
#include "return_codes.h"

using namespace zen;
using namespace slate;


namespace
{
volatile std::sig_atomic_t cancelRequested = 0;

extern "C" void onSigInt(int /*signal*/) { cancelRequested = 1; }


void printLine(const std::wstring& msg) { std::cout << utfTo<std::string>(msg) << std::endl; }

void printError(const std::wstring& msg) { std::cerr << utfTo<std::string>(msg) << std::endl; }


void showSyntaxHelp()
{
    printLine(std::wstring() + L"Slate " + utfTo<std::wstring>(slateVersion) + L"\n\n" +
              _("Syntax:") + L"\n" +
              L"  slate copy --src <dir>... --dst <dir>... [--md5] [--verify full|size|none] [--no-skip] [--no-resume]\n"
              L"             [--source-folder] [--eject] [--jobs N] [--mhl <file>] [--config <file>] [--log <folder>]\n"
              L"  slate verify <manifest.mhl> <targetDir> [--config <file>] [--log <folder>]\n\n" +
              L"--src            " + _("Source folders (memory cards), one copy job each") + L'\n' +
              L"--dst            " + _("Destination folders; every source is copied to all of them") + L'\n' +
              L"--md5            " + _("Use MD5 instead of xxHash64") + L'\n' +
              L"--verify         " + _("Verification after copy") + L'\n' +
              L"--no-skip        " + _("Overwrite complete destination files") + L'\n' +
              L"--no-resume      " + _("Restart partial destination files from the beginning") + L'\n' +
              L"--source-folder  " + _("Create a folder named after the source inside each destination") + L'\n' +
              L"--eject          " + _("Report sources that are safe to eject") + L'\n' +
              L"--jobs           " + _("Maximum number of jobs running in parallel") + L'\n' +
              L"--mhl            " + _("Save a Media Hash List of all verified copies") + L'\n' +
              L"--config         " + _("Global settings file") + L'\n' +
              L"--log            " + _("Folder for log files"));
}


class ConsoleStatusHandler : public SchedulerCallback
{
public:
    explicit ConsoleStatusHandler(const GlobalConfig& cfg) : cfg_(cfg) {}

    void onJobProgress(const std::string& jobId, int64_t processed, double bytesPerSec, double etaSec) override {}

    void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) override
    {
        if (statusText != lastStatusText_ || currentPath != lastPath_) //don't spam the console with chunk updates
        {
            lastStatusText_ = statusText;
            lastPath_ = currentPath;
            printLine(utfTo<std::wstring>(jobId) + L"  " + statusText + L' ' + fmtPath(currentPath));
        }
    }

    void onJobFinished(const Job& job) override
    {
        const JobStatus status = getJobStatus(job);
        printLine(utfTo<std::wstring>(getJobId(job)) + L"  " + getStatusLabel(status));

        for (const std::wstring& errorMsg : getJobErrors(job))
            printError(L"  " + errorMsg);

        raiseExitCode(exitCode_, slate::getExitCode(status));

        if (!cfg_.logFolderPath.empty())
            try
            {
                const Zstring logFilePath = saveLogFile(job, cfg_.logFolderPath, cfg_.logfilesMaxAgeDays); //throw FileError
                printLine(_("Log file:") + L' ' + fmtPath(logFilePath));
            }
            catch (const FileError& e)
            {
                printError(e.toString());
                raiseExitCode(exitCode_, SlateExitCode::warning);
            }
    }

    void onQueueStarted  () override { printLine(_("Starting...")); }
    void onQueuePaused   () override { printLine(_("Paused")); }
    void onQueueResumed  () override {}
    void onQueueCancelled() override
    {
        printLine(_("Stopped"));
        raiseExitCode(exitCode_, SlateExitCode::cancelled);
    }

    void onQueueCompleted(bool withErrors) override
    {
        printLine(withErrors ? _("Completed with issues") : _("Completed successfully"));
    }

    void onQueueProgress(int64_t processedBytes, int64_t totalBytes, double bytesPerSec, double etaSec) override
    {
        std::wstring msg = (totalBytes > 0 ? formatProgressPercent(static_cast<double>(processedBytes) / totalBytes) : L"100%") + L"  " +
                           formatFilesizeShort(processedBytes) + L" / " + formatFilesizeShort(totalBytes);
        if (bytesPerSec > 0)
            msg += L"  " + replaceCpy(_("%x/sec"), L"%x", formatFilesizeShort(static_cast<int64_t>(bytesPerSec)));
        if (etaSec >= 0)
            msg += L"  " + _("Time remaining:") + L' ' + formatRemainingTime(etaSec);

        if (msg != lastQueueProgress_)
        {
            lastQueueProgress_ = msg;
            printLine(msg);
        }
    }

    void onEjectionRequested(const std::string& jobId, const std::vector<Zstring>& sourceRoots) override
    {
        for (const Zstring& sourceRoot : sourceRoots)
            printLine(replaceCpy(_("%x can be safely ejected."), L"%x", fmtPath(sourceRoot)));
    }

    void onPostProcessFinished(const std::string& jobId, bool success) override {}

    SlateExitCode getExitCode() const { return exitCode_; }

private:
    const GlobalConfig cfg_;
    std::wstring lastStatusText_;
    Zstring lastPath_;
    std::wstring lastQueueProgress_;
    SlateExitCode exitCode_ = SlateExitCode::success;
};


SlateExitCode runQueue(JobScheduler& scheduler, ConsoleStatusHandler& statusHandler)
{
    try
    {
        scheduler.start(); //throw MissingPathsError
    }
    catch (const MissingPathsError& e)
    {
        printError(e.toString());
        return SlateExitCode::error;
    }

    scheduler.waitUntilIdle(std::chrono::seconds(1), [&]
    {
        if (cancelRequested)
            scheduler.cancel();
    });
    return statusHandler.getExitCode();
}


//consume option values up to the next "--" argument
std::vector<Zstring> getOptionValues(const std::vector<Zstring>& args, size_t& pos)
{
    std::vector<Zstring> values;
    while (pos + 1 < args.size() && !startsWith(args[pos + 1], Zstr("--")))
        values.push_back(args[++pos]);
    return values;
}


Zstring getOptionValue(const std::vector<Zstring>& args, size_t& pos) //throw FileError
{
    const Zstring& option = args[pos];
    const std::vector<Zstring> values = getOptionValues(args, pos);
    if (values.size() != 1)
        throw FileError(replaceCpy(_("A single value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
    return values[0];
}


SlateExitCode runCopy(const std::vector<Zstring>& args) //throw FileError
{
    std::vector<Zstring> sourcePaths;
    std::vector<Zstring> destPaths;
    Zstring cfgFilePath;
    Zstring logFolderPath;
    Zstring mhlFilePath;
    std::optional<size_t> maxConcurrentJobs;
    bool createSourceFolder = false;

    std::vector<std::function<void(JobOptions& options)>> optionOverrides; //apply after reading config

    for (size_t pos = 1; pos < args.size(); ++pos)
    {
        const Zstring& arg = args[pos];
        if (arg == Zstr("--src"))
            for (const Zstring& path : getOptionValues(args, pos))
                sourcePaths.push_back(getAbsolutePath(path)); //throw FileError
        else if (arg == Zstr("--dst"))
            for (const Zstring& path : getOptionValues(args, pos))
                destPaths.push_back(getAbsolutePath(path)); //throw FileError
        else if (arg == Zstr("--md5"))
            optionOverrides.push_back([](JobOptions& options) { options.hashAlgo = HashAlgorithm::md5; });
        else if (arg == Zstr("--verify"))
        {
            const Zstring modeName = getOptionValue(args, pos); //throw FileError
            const std::optional<VerifyMode> mode = parseVerifyMode(modeName);
            if (!mode)
                throw FileError(replaceCpy(_("Invalid verification mode %x."), L"%x", utfTo<std::wstring>(modeName)));
            optionOverrides.push_back([mode = *mode](JobOptions& options) { options.verifyMode = mode; });
        }
        else if (arg == Zstr("--no-skip"))
            optionOverrides.push_back([](JobOptions& options) { options.skipExisting = false; });
        else if (arg == Zstr("--no-resume"))
            optionOverrides.push_back([](JobOptions& options) { options.resumePartial = false; });
        else if (arg == Zstr("--eject"))
            optionOverrides.push_back([](JobOptions& options) { options.ejectOnSuccess = true; });
        else if (arg == Zstr("--source-folder"))
            createSourceFolder = true;
        else if (arg == Zstr("--jobs"))
        {
            const Zstring count = getOptionValue(args, pos); //throw FileError
            if (stringTo<int>(count) < 1)
                throw FileError(replaceCpy(_("Invalid number of jobs %x."), L"%x", utfTo<std::wstring>(count)));
            maxConcurrentJobs = stringTo<int>(count);
        }
        else if (arg == Zstr("--mhl"))
            mhlFilePath = getAbsolutePath(getOptionValue(args, pos)); //throw FileError
        else if (arg == Zstr("--config"))
            cfgFilePath = getOptionValue(args, pos); //throw FileError
        else if (arg == Zstr("--log"))
            logFolderPath = getAbsolutePath(getOptionValue(args, pos)); //throw FileError
        else
            throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", utfTo<std::wstring>(arg)));
    }

    if (sourcePaths.empty() || destPaths.empty())
        throw FileError(_("At least one source and one destination folder are expected."));

    GlobalConfig cfg;
    if (!cfgFilePath.empty())
        cfg = readConfig(cfgFilePath); //throw FileError
    if (!logFolderPath.empty())
        cfg.logFolderPath = logFolderPath;
    if (maxConcurrentJobs)
        cfg.maxConcurrentJobs = *maxConcurrentJobs;

    JobOptions options = cfg.defaultJobOptions;
    for (const auto& applyOverride : optionOverrides)
        applyOverride(options);

    ConsoleStatusHandler statusHandler(cfg);
    JobScheduler scheduler(statusHandler, nullptr /*postProcessor*/, cfg.maxConcurrentJobs, cfg.deferPostProcess);

    //one job per memory card: avoid name clashes between cards
    for (const Zstring& sourcePath : sourcePaths)
    {
        TransferJob job = planTransferJob({sourcePath}, destPaths, options, createSourceFolder || sourcePaths.size() > 1); //throw FileError

        printLine(replaceCpy(replaceCpy(_("Planned %x: %y"), L"%x", utfTo<std::wstring>(job.id)),
                             L"%y", _P("1 file", "%x files", job.fileList.size()) + L" (" + formatFilesizeShort(job.totalBytes) + L')'));

        scheduler.addJob(std::move(job));
    }

    const SlateExitCode exitCode = runQueue(scheduler, statusHandler);

    if (!mhlFilePath.empty() && exitCode != SlateExitCode::cancelled && exitCode != SlateExitCode::error)
    {
        //merge all sources into a single manifest
        TransferJob mhlJob;
        for (const Job& job : scheduler.getJobs())
            if (const TransferJob* transferJob = std::get_if<TransferJob>(&job))
            {
                mhlJob.report.startTime = mhlJob.report.files.empty() ? transferJob->report.startTime : std::min(mhlJob.report.startTime, transferJob->report.startTime);
                mhlJob.report.endTime   = std::max(mhlJob.report.endTime, transferJob->report.endTime);
                mhlJob.options          = transferJob->options;
                mhlJob.report.files.insert(mhlJob.report.files.end(), transferJob->report.files.begin(), transferJob->report.files.end());
            }

        saveMhlFile(mhlJob, mhlFilePath); //throw FileError
        printLine(_("Media Hash List:") + L' ' + fmtPath(mhlFilePath));
    }
    return exitCode;
}


SlateExitCode runVerify(const std::vector<Zstring>& args) //throw FileError
{
    std::vector<Zstring> positionalArgs;
    Zstring cfgFilePath;
    Zstring logFolderPath;

    for (size_t pos = 1; pos < args.size(); ++pos)
    {
        const Zstring& arg = args[pos];
        if (arg == Zstr("--config"))
            cfgFilePath = getOptionValue(args, pos); //throw FileError
        else if (arg == Zstr("--log"))
            logFolderPath = getAbsolutePath(getOptionValue(args, pos)); //throw FileError
        else if (startsWith(arg, Zstr("--")))
            throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", utfTo<std::wstring>(arg)));
        else
            positionalArgs.push_back(getAbsolutePath(arg)); //throw FileError
    }

    if (positionalArgs.size() != 2)
        throw FileError(_("A manifest file and a target folder are expected."));

    GlobalConfig cfg;
    if (!cfgFilePath.empty())
        cfg = readConfig(cfgFilePath); //throw FileError
    if (!logFolderPath.empty())
        cfg.logFolderPath = logFolderPath;

    VerifyJob job = makeVerifyJob(positionalArgs[0], positionalArgs[1]); //throw FileError
    printLine(replaceCpy(replaceCpy(_("Planned %x: %y"), L"%x", utfTo<std::wstring>(job.id)),
                         L"%y", _P("1 file", "%x files", job.entries.size())));

    ConsoleStatusHandler statusHandler(cfg);
    JobScheduler scheduler(statusHandler, nullptr /*postProcessor*/, cfg.maxConcurrentJobs, cfg.deferPostProcess);
    scheduler.addJob(std::move(job));

    return runQueue(scheduler, statusHandler);
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    std::signal(SIGINT, onSigInt);

    std::vector<Zstring> args;
    for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);

    SlateExitCode exitCode = SlateExitCode::success;
    try
    {
        if (args.empty() || args[0] == Zstr("--help") || args[0] == Zstr("-h"))
            showSyntaxHelp();
        else if (args[0] == Zstr("copy"))
            exitCode = runCopy(args); //throw FileError
        else if (args[0] == Zstr("verify"))
            exitCode = runVerify(args); //throw FileError
        else
            throw FileError(replaceCpy(_("Unknown command %x."), L"%x", utfTo<std::wstring>(args[0])));
    }
    catch (const FileError& e)
    {
        printError(e.toString());
        raiseExitCode(exitCode, SlateExitCode::error);
    }
    catch (const std::exception& e)
    {
        printError(utfTo<std::wstring>(e.what()));
        raiseExitCode(exitCode, SlateExitCode::exception);
    }

    //errors that could not be reported otherwise
    for (const LogEntry& entry : fetchExtraLog())
        std::cerr << formatMessage(entry);

    return static_cast<int>(exitCode);
}
