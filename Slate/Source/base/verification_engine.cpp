// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "verification_engine.h"
#include <zen/file_access.h>
#include <zen/format_unit.h>
#include "checksum_stream.h"
#include "manifest.h"

using namespace zen;
using namespace slate;


FileVerifyRecord VerificationEngine::verifyEntry(const ManifestEntry& entry) //throw FileError, ThreadStopRequest
{
    FileVerifyRecord rec;
    rec.relativePath = entry.relativePath;
    rec.expectedHash = entry.hash;
    rec.hashAlgo     = entry.hashAlgo;

    const Zstring filePath = appendPath(job_.targetDir, entry.relativePath);

    const std::optional<ItemType> type = getItemTypeIfExists(filePath); //throw FileError
    if (!type || *type == ItemType::folder)
    {
        rec.status = EntryStatus::missing;
        logMsg(job_.report.log, replaceCpy(_("File %x is missing."), L"%x", fmtPath(filePath)), MSG_TYPE_ERROR);
        return rec;
    }

    cb_.onFileProgress(job_.id, 0, replaceCpy(_("Verifying %x..."), L"%x", utfTo<std::wstring>(getItemName(filePath))), filePath, 0);

    const std::string actualHash = hashFile(filePath, entry.hashAlgo, VERIFY_CHUNK_SIZE,
    [&](int64_t /*bytesDelta*/) { checkpoint(); /*throw ThreadStopRequest*/ }); //throw FileError, ThreadStopRequest

    if (equalAsciiNoCase(actualHash, entry.hash))
        rec.status = EntryStatus::verified;
    else
    {
        rec.status = EntryStatus::failed;
        rec.actualHash = actualHash;
        logMsg(job_.report.log, replaceCpy(replaceCpy(_("Checksum mismatch for %x: expected %y."), L"%x", fmtPath(filePath)),
                                           L"%y", utfTo<std::wstring>(entry.hash)) + L' ' +
               replaceCpy(_("Found: %x"), L"%x", utfTo<std::wstring>(actualHash)), MSG_TYPE_ERROR);
    }
    return rec;
}


void VerificationEngine::run()
{
    job_.status = JobStatus::running;
    job_.report = VerifyReport();
    job_.report.startTime = std::time(nullptr);

    try
    {
        if (job_.entries.empty() && !job_.manifestPath.empty()) //not parsed yet
            job_.entries = parseMhlFile(job_.manifestPath); //throw FileError

        const size_t entryCount = job_.entries.size();
        logMsg(job_.report.log, replaceCpy(_P("Verifying 1 file against %y", "Verifying %x files against %y", entryCount),
                                           L"%y", fmtPath(job_.manifestPath)), MSG_TYPE_INFO);

        for (size_t i = 0; i < entryCount; ++i)
        {
            checkpoint(); //throw ThreadStopRequest

            FileVerifyRecord rec;
            try
            {
                rec = verifyEntry(job_.entries[i]); //throw FileError, ThreadStopRequest
            }
            catch (const FileError& e)
            {
                rec.relativePath = job_.entries[i].relativePath;
                rec.expectedHash = job_.entries[i].hash;
                rec.hashAlgo     = job_.entries[i].hashAlgo;
                rec.status       = EntryStatus::failed;

                job_.report.errors.push_back(e.toString());
                logMsg(job_.report.log, e.toString(), MSG_TYPE_ERROR);
            }
            switch (rec.status)
            {
                //*INDENT-OFF*
                case EntryStatus::verified: ++job_.report.verified; break;
                case EntryStatus::failed:   ++job_.report.failed;   break;
                case EntryStatus::missing:  ++job_.report.missing;  break;
                //*INDENT-ON*
            }
            job_.report.files.push_back(std::move(rec));

            const std::wstring statusText = replaceCpy(replaceCpy(_("Verified file %x of %y"), L"%x", formatNumber(i + 1)),
                                                       L"%y", formatNumber(entryCount));
            cb_.onFileProgress(job_.id, 100.0 * (i + 1) / entryCount, statusText, appendPath(job_.targetDir, job_.entries[i].relativePath), 0);
            cb_.onJobProgress(job_.id, i + 1, 0, std::nullopt);
        }

        job_.status = job_.report.failed + job_.report.missing > 0 ? JobStatus::completedWithErrors : JobStatus::completed;
    }
    catch (ThreadStopRequest&)
    {
        job_.status = JobStatus::cancelled;
        logMsg(job_.report.log, _("Stopped"), MSG_TYPE_WARNING);
    }
    catch (const FileError& e) //critical error, e.g. unreadable manifest
    {
        job_.report.errors.push_back(e.toString());
        logMsg(job_.report.log, e.toString(), MSG_TYPE_ERROR);
        job_.status = JobStatus::completedWithErrors;
    }
    catch (const std::exception& e)
    {
        job_.report.errors.push_back(utfTo<std::wstring>(e.what()));
        logMsg(job_.report.log, utfTo<std::wstring>(e.what()), MSG_TYPE_ERROR);
        job_.status = JobStatus::completedWithErrors;
    }

    job_.report.endTime = std::time(nullptr);

    logMsg(job_.report.log, getStatusLabel(job_.status) + L": " +
           replaceCpy(replaceCpy(replaceCpy(_("%x verified, %y failed, %z missing"),
                                            L"%x", formatNumber(job_.report.verified)),
                                 L"%y", formatNumber(job_.report.failed)),
                      L"%z", formatNumber(job_.report.missing)), MSG_TYPE_INFO);

    cb_.onJobFinished(std::move(job_));
}
