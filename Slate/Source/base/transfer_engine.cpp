// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transfer_engine.h"
#include <algorithm>
#include <zen/file_io.h>
#include <zen/format_unit.h>
#include "checksum_stream.h"

using namespace zen;
using namespace slate;


namespace
{
struct DestinationState
{
    Zstring path;
    bool skip = false; //already complete
    uint64_t resumeOffset = 0;
    std::unique_ptr<FileOutputPlain> fileOut;
    std::optional<FileError> error;
};


std::wstring getProcessingErrorMsg(const Zstring& filePath, const std::wstring& details)
{
    return replaceCpy(_("Error processing %x:"), L"%x", utfTo<std::wstring>(getItemName(filePath))) + L' ' + details;
}
}


void TransferEngine::logError(const std::wstring& msg)
{
    job_.report.errors.push_back(msg);
    logMsg(job_.report.log, msg, MSG_TYPE_ERROR);
}


double TransferEngine::getBytesPerSec() const
{
    const double timeElapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();
    return timeElapsed > 0 ? bytesDone_ / timeElapsed : 0;
}


FileTransferRecord TransferEngine::processFile(const TransferItem& item) //throw ThreadStopRequest
{
    const JobOptions& options = job_.options;

    FileTransferRecord rec;
    rec.sourcePath = item.sourcePath;

    std::vector<DestinationState> dests;
    try
    {
        FileInputPlain fileIn(item.sourcePath); //throw FileError
        const uint64_t fileSize = fileIn.getFileSize();
        rec.size = fileSize;

        //open all destination handles before the copy loop:
        for (const Zstring& destPath : item.destPaths)
        {
            DestinationState& ds = dests.emplace_back();
            ds.path = destPath;
            try
            {
                if (const std::optional<Zstring> parentPath = getParentFolderPath(destPath))
                    createDirectoryIfMissingRecursion(*parentPath); //throw FileError

                std::optional<uint64_t> destSize;
                if (const std::optional<ItemType> type = getItemTypeIfExists(destPath)) //throw FileError
                    if (*type != ItemType::folder)
                        destSize = getFileSize(destPath); //throw FileError

                if (destSize && options.skipExisting && *destSize == fileSize)
                {
                    ds.skip = true;
                    logMsg(job_.report.log, replaceCpy(_("Skipped existing file %x."), L"%x", fmtPath(destPath)), MSG_TYPE_INFO);
                }
                else if (destSize && options.resumePartial && 0 < *destSize && *destSize < fileSize)
                {
                    ds.resumeOffset = *destSize;
                    ds.fileOut = std::make_unique<FileOutputPlain>(destPath, FileOutputMode::append); //throw FileError
                    logMsg(job_.report.log, replaceCpy(replaceCpy(_("Resuming %x at %y."), L"%x", fmtPath(destPath)),
                                                       L"%y", formatFilesizeShort(*destSize)), MSG_TYPE_INFO);
                }
                else //destination larger than source => start from zero
                    ds.fileOut = std::make_unique<FileOutputPlain>(destPath, FileOutputMode::overwrite); //throw FileError
            }
            catch (const FileError& e) { ds.error = e; }
        }

        //-------------------------------------------------------------------
        std::unique_ptr<ChecksumStream> hashStream;
        if (options.verifyMode == VerifyMode::full)
            try
            {
                hashStream = makeChecksumStream(options.hashAlgo); //throw SysError
            }
            catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(item.sourcePath)), e.toString()); }

        //hashing requires all bytes, copying only those after the lowest resume offset
        uint64_t readOffset = hashStream ? 0 : fileSize;
        for (const DestinationState& ds : dests)
            if (ds.fileOut)
                readOffset = std::min(readOffset, ds.resumeOffset);

        if (hashStream || readOffset < fileSize)
        {
            const std::wstring statusText = hashStream ? _("Copying & Hashing...") : _("Copying...");
            cb_.onFileProgress(job_.id, 0, statusText, item.sourcePath, getBytesPerSec());

            if (readOffset > 0)
                fileIn.seek(readOffset); //throw FileError

            std::string buffer(COPY_CHUNK_SIZE, '\0');
            for (uint64_t pos = readOffset;;)
            {
                checkpoint(); //throw ThreadStopRequest

                const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
                if (bytesRead == 0) //end of file
                    break;

                if (hashStream)
                    try
                    {
                        hashStream->update({buffer.data(), bytesRead}); //throw SysError
                    }
                    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(item.sourcePath)), e.toString()); }

                for (DestinationState& ds : dests)
                    if (ds.fileOut && pos + bytesRead > ds.resumeOffset)
                    {
                        const size_t skipBytes = ds.resumeOffset > pos ? static_cast<size_t>(ds.resumeOffset - pos) : 0;
                        try
                        {
                            ds.fileOut->write(buffer.data() + skipBytes, bytesRead - skipBytes); //throw FileError
                        }
                        catch (const FileError& e)
                        {
                            ds.error = e;
                            ds.fileOut.reset(); //other destinations continue
                        }
                    }
                pos += bytesRead;

                cb_.onFileProgress(job_.id, fileSize > 0 ? 100.0 * pos / fileSize : 100, statusText, item.sourcePath, getBytesPerSec());
            }
        }

        for (DestinationState& ds : dests)
            if (ds.fileOut)
            {
                try
                {
                    ds.fileOut->close(); //throw FileError
                    setFileTime(ds.path, fileIn.getModTime(), ProcSymlink::follow); //throw FileError
                }
                catch (const FileError& e) { ds.error = e; }
                ds.fileOut.reset();
            }

        if (hashStream)
            try
            {
                rec.sourceChecksum = hashStream->finalize(); //throw SysError
            }
            catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(item.sourcePath)), e.toString()); }

        //-------------------------------------------------------------------
        bool allVerified = true;
        bool allPresent  = true;
        bool errorLogged = false;

        for (const DestinationState& ds : dests)
        {
            DestinationOutcome& outcome = rec.destinations.emplace_back();
            outcome.path = ds.path;

            std::optional<FileError> error = ds.error;
            if (!error)
                try
                {
                    std::optional<uint64_t> destSize;
                    if (const std::optional<ItemType> type = getItemTypeIfExists(ds.path); type && *type != ItemType::folder) //throw FileError
                        destSize = getFileSize(ds.path); //throw FileError

                    if (!destSize || *destSize != fileSize)
                    {
                        outcome.statusText = _("Size Mismatch or Missing");
                        allVerified = allPresent = false;
                    }
                    else
                        switch (options.verifyMode)
                        {
                            case VerifyMode::none:
                                outcome.statusText = _("Unverified");
                                allVerified = false;
                                break;

                            case VerifyMode::sizeOnly:
                                outcome.verified = true;
                                outcome.statusText = _("Verified (Size Only)");
                                break;

                            case VerifyMode::full:
                            {
                                cb_.onFileProgress(job_.id, 50, _("Verifying..."), ds.path, getBytesPerSec());

                                const std::string destChecksum = hashFile(ds.path, options.hashAlgo, COPY_CHUNK_SIZE,
                                [&](int64_t /*bytesDelta*/) { checkpoint(); /*throw ThreadStopRequest*/ }); //throw FileError, ThreadStopRequest

                                if (destChecksum == rec.sourceChecksum)
                                {
                                    outcome.verified = true;
                                    outcome.statusText = _("Verified");
                                }
                                else
                                {
                                    outcome.statusText = _("Verification FAILED");
                                    allVerified = false;
                                    logMsg(job_.report.log, replaceCpy(replaceCpy(_("Checksum mismatch for %x: expected %y."), L"%x", fmtPath(ds.path)),
                                                                       L"%y", utfTo<std::wstring>(rec.sourceChecksum)) + L' ' +
                                           replaceCpy(_("Found: %x"), L"%x", utfTo<std::wstring>(destChecksum)), MSG_TYPE_ERROR);
                                }
                            }
                            break;
                        }
                }
                catch (const FileError& e) { error = e; }

            if (error)
            {
                outcome.verified = false;
                outcome.statusText = error->toString();
                allVerified = allPresent = false;

                logError(getProcessingErrorMsg(item.sourcePath, error->toString()));
                errorLogged = true;
            }
        }

        if (allVerified)
            rec.status = FileStatus::verified;
        else if (options.verifyMode == VerifyMode::none && allPresent)
            rec.status = FileStatus::copiedUnverified;
        else
        {
            rec.status = FileStatus::failed;
            if (!errorLogged)
                logError(replaceCpy(_("Verification failed for %x"), L"%x", utfTo<std::wstring>(getItemName(item.sourcePath))));
        }
    }
    catch (const FileError& e)
    {
        rec.status = FileStatus::failed;
        logError(getProcessingErrorMsg(item.sourcePath, e.toString()));

        //source failed: report the state each destination was left in
        if (rec.destinations.empty())
            for (size_t i = 0; i < item.destPaths.size(); ++i)
            {
                DestinationOutcome& outcome = rec.destinations.emplace_back();
                outcome.path = item.destPaths[i];

                if (i < dests.size() && dests[i].error)
                    outcome.statusText = dests[i].error->toString();
                else if (i < dests.size() && dests[i].skip)
                    outcome.statusText = _("Skipped existing file");
                else if (i < dests.size())
                    outcome.statusText = _("Incomplete copy");
                else
                    outcome.statusText = _("Not copied");
            }
    }
    return rec;
}


std::vector<Zstring> TransferEngine::getEjectableSources() const
{
    assert(job_.report.files.size() == job_.fileList.size());
    std::vector<Zstring> ejectable;

    for (const Zstring& sourceRoot : job_.sources)
    {
        bool allVerified = true;
        for (size_t i = 0; i < job_.fileList.size(); ++i)
            if (isPathInsideFolder(job_.fileList[i].sourcePath, sourceRoot) &&
                job_.report.files[i].status != FileStatus::verified)
            {
                allVerified = false;
                break;
            }

        if (allVerified)
            ejectable.push_back(sourceRoot);
    }
    return ejectable;
}


void TransferEngine::run()
{
    startTime_ = std::chrono::steady_clock::now();
    bytesDone_ = 0;

    job_.status = JobStatus::running;
    job_.report = TransferReport();
    job_.report.startTime = std::time(nullptr);

    const size_t destCount = job_.fileList.empty() ? job_.destinations.size() : job_.fileList[0].destPaths.size();
    logMsg(job_.report.log, _P("Transferring 1 file", "Transferring %x files", job_.fileList.size()) +
           L" (" + formatFilesizeShort(job_.totalBytes) + L") " +
           _P("to 1 destination", "to %x destinations", destCount), MSG_TYPE_INFO);
    logMsg(job_.report.log, _("Verification:") + L' ' + getVariantName(job_.options.verifyMode), MSG_TYPE_INFO);
    try
    {
        for (const TransferItem& item : job_.fileList)
        {
            checkpoint(); //throw ThreadStopRequest

            FileTransferRecord rec = processFile(item); //throw ThreadStopRequest

            if (rec.status == FileStatus::verified) //unverified copies do not count as progress
                bytesDone_ += rec.size;

            job_.report.files.push_back(std::move(rec));

            const double bytesPerSec = getBytesPerSec();
            const int64_t bytesRemaining = static_cast<int64_t>(job_.totalBytes) - bytesDone_;
            cb_.onJobProgress(job_.id, bytesDone_, bytesPerSec,
                              bytesPerSec > 0 ? std::optional<double>(std::max<int64_t>(bytesRemaining, 0) / bytesPerSec) : std::nullopt);
        }

        if (job_.options.ejectOnSuccess)
            job_.report.ejectableSources = getEjectableSources();

        job_.status = job_.report.errors.empty() ? JobStatus::completed : JobStatus::completedWithErrors;
    }
    catch (ThreadStopRequest&)
    {
        job_.status = JobStatus::cancelled;
        logMsg(job_.report.log, _("Stopped"), MSG_TYPE_WARNING);
    }
    catch (const std::exception& e) //critical failure => still report a terminal record
    {
        logError(utfTo<std::wstring>(e.what()));
        job_.status = JobStatus::completedWithErrors;
    }

    job_.report.endTime = std::time(nullptr);

    int verifiedCount = 0;
    int failedCount   = 0;
    for (const FileTransferRecord& rec : job_.report.files)
        if (rec.status == FileStatus::verified)
            ++verifiedCount;
        else if (rec.status == FileStatus::failed)
            ++failedCount;

    logMsg(job_.report.log, getStatusLabel(job_.status) + L": " +
           replaceCpy(replaceCpy(replaceCpy(_("%x verified, %y failed, %z processed"),
                                            L"%x", formatNumber(verifiedCount)),
                                 L"%y", formatNumber(failedCount)),
                      L"%z", formatNumber(std::ssize(job_.report.files))) +
           L" [" + utfTo<std::wstring>(formatTimeSpan(job_.report.endTime - job_.report.startTime)) + L']', MSG_TYPE_INFO);

    cb_.onJobFinished(std::move(job_));
}
