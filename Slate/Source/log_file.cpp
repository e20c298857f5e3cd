// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "log_file.h"
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_traverser.h>
#include <zen/format_unit.h>
#include <zen/time.h>

using namespace zen;
using namespace slate;


namespace
{
const int SEPARATION_LINE_LEN = 40;
const int LOG_PREVIEW_MAX = 25;
const std::wstring TAB_SPACE = L"    ";


std::vector<std::wstring> getJobSummary(const TransferJob& job)
{
    int filesOk = 0;
    int filesFailed = 0;
    int64_t bytesOk = 0;
    for (const FileTransferRecord& file : job.report.files)
        if (file.status == FileStatus::failed)
            ++filesFailed;
        else
        {
            ++filesOk;
            bytesOk += file.size;
        }

    std::vector<std::wstring> summary;
    summary.push_back(_("Items processed:") + L' ' + formatNumber(filesOk) + L" (" + formatFilesizeShort(bytesOk) + L')');

    if (filesFailed > 0)
        summary.push_back(_("Items failed:") + L' ' + formatNumber(filesFailed));

    if (const int64_t filesRemaining = static_cast<int64_t>(job.fileList.size()) - filesOk - filesFailed;
        filesRemaining > 0)
        summary.push_back(_("Items remaining:") + L' ' + formatNumber(filesRemaining) +
                          L" (" + formatFilesizeShort(static_cast<int64_t>(job.totalBytes) - bytesOk) + L')');

    summary.push_back(_("Destinations:") + L' ' + formatNumber(job.destinations.size()));
    return summary;
}


std::vector<std::wstring> getJobSummary(const VerifyJob& job)
{
    std::vector<std::wstring> summary;
    summary.push_back(_("Manifest:") + L' ' + fmtPath(job.manifestPath));
    summary.push_back(_("Verified:") + L' ' + formatNumber(job.report.verified));
    if (job.report.failed  > 0) summary.push_back(_("Failed:")  + L' ' + formatNumber(job.report.failed));
    if (job.report.missing > 0) summary.push_back(_("Missing:") + L' ' + formatNumber(job.report.missing));
    return summary;
}


std::pair<time_t, time_t> getJobTimes(const Job& job)
{
    return std::visit([](const auto& j) { return std::make_pair(j.report.startTime, j.report.endTime); }, job);
}


std::string generateLogHeaderTxt(const Job& job)
{
    const ErrorLog& log = getJobLog(job);
    const auto [startTime, endTime] = getJobTimes(job);

    const TimeComp tc = getLocalTime(startTime); //returns TimeComp() on error
    const std::string headerLine = getJobId(job) + ' ' + formatTime(formatIsoDateTag, tc) + " [" + formatTime(formatIsoTimeTag, tc) + ']';

    //assemble summary box
    std::vector<std::string> summary;
    summary.emplace_back();
    summary.push_back(utfTo<std::string>(TAB_SPACE + getStatusLabel(getJobStatus(job))));
    summary.emplace_back();

    const ErrorLogStats logCount = getStats(log);

    if (logCount.error   > 0) summary.push_back(utfTo<std::string>(TAB_SPACE + _("Errors:")   + L' ' + formatNumber(logCount.error)));
    if (logCount.warning > 0) summary.push_back(utfTo<std::string>(TAB_SPACE + _("Warnings:") + L' ' + formatNumber(logCount.warning)));

    for (const std::wstring& line : std::visit([](const auto& j) { return getJobSummary(j); }, job))
        summary.push_back(utfTo<std::string>(TAB_SPACE + line));

    const int64_t totalTimeSec = std::max<int64_t>(endTime - startTime, 0);
    summary.push_back(utfTo<std::string>(TAB_SPACE + _("Total time:")) + ' ' + formatTimeSpan(totalTimeSec));

    size_t sepLineLen = 0; //calculate max width (considering Unicode!)
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, unicodeLength(str));

    std::string output = headerLine + '\n';
    output += std::string(sepLineLen + 1, '_') + '\n';

    for (const std::string& str : summary)
        output += '|' + str + '\n';

    output += '|' + std::string(sepLineLen, '_') + "\n\n";

    //------------ warnings/errors preview ----------------
    const int logFailTotal = logCount.warning + logCount.error;
    if (logFailTotal > 0)
    {
        output += '\n' + utfTo<std::string>(_("Errors and warnings:")) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + '\n';

        int previewCount = 0;
        for (const LogEntry& entry : log)
            if (entry.type & (MSG_TYPE_WARNING | MSG_TYPE_ERROR))
            {
                if (previewCount++ >= LOG_PREVIEW_MAX)
                    break;
                output += formatMessage(entry);
            }

        if (logFailTotal > previewCount)
            output += "  [...]  " + utfTo<std::string>(replaceCpy(_P("Showing %y of 1 item", "Showing %y of %x items", logFailTotal), //%x used as plural form placeholder!
                                                                  L"%y", formatNumber(previewCount))) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + "\n\n\n";
    }
    return output;
}


void limitLogfileCount(const Zstring& logFolderPath, int logfilesMaxAgeDays, const Zstring& logFilePathToKeep) //throw FileError
{
    if (logfilesMaxAgeDays <= 0)
        return;

    const time_t cutOffTime = std::time(nullptr) - static_cast<time_t>(logfilesMaxAgeDays) * 24 * 3600;

    std::vector<Zstring> oldLogFiles;
    traverseFolder(logFolderPath, [&](const FileInfo& fi)
    {
        if (endsWith(fi.itemName, Zstr(".log")) &&
            fi.modTime < cutOffTime &&
            fi.fullPath != logFilePathToKeep)
            oldLogFiles.push_back(fi.fullPath);
    }, nullptr, nullptr); //throw FileError

    std::exception_ptr firstError;

    for (const Zstring& filePath : oldLogFiles)
        try
        {
            removeFilePlain(filePath); //throw FileError
        }
        catch (const FileError&) { if (!firstError) firstError = std::current_exception(); };

    if (firstError) //late failure!
        std::rethrow_exception(firstError);
}
}


Zstring slate::generateLogFileName(const Job& job)
{
    const TimeComp tc = getLocalTime(getJobTimes(job).first);
    return utfTo<Zstring>(getJobId(job)) + Zstr(' ') + formatTime(Zstr("%Y-%m-%d %H%M%S"), tc) + Zstr(".log");
}


Zstring slate::saveLogFile(const Job& job, const Zstring& logFolderPath, int logfilesMaxAgeDays) //throw FileError
{
    createDirectoryIfMissingRecursion(logFolderPath); //throw FileError

    const Zstring logFilePath = appendPath(logFolderPath, generateLogFileName(job));

    std::string logText = generateLogHeaderTxt(job);
    for (const LogEntry& entry : getJobLog(job))
        logText += formatMessage(entry);

    std::exception_ptr firstError;
    try
    {
        setFileContent(logFilePath, logText); //throw FileError
    }
    catch (const FileError&) { firstError = std::current_exception(); };

    try
    {
        limitLogfileCount(logFolderPath, logfilesMaxAgeDays, logFilePath); //throw FileError
    }
    catch (const FileError&) { if (!firstError) firstError = std::current_exception(); };

    if (firstError)
        std::rethrow_exception(firstError);

    return logFilePath;
}
