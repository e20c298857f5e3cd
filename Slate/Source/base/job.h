// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef JOB_H_8023475610928374650
#define JOB_H_8023475610928374650

#include <map>
#include <variant>
#include <vector>
#include <zen/error_log.h>
#include "structures.h"


namespace slate
{
using Annotations = std::map<std::string, std::string>;

struct DestinationOutcome
{
    Zstring path;
    bool verified = false;
    std::wstring statusText; //e.g. "Verified (Size Only)", "Size Mismatch or Missing"
};

struct FileTransferRecord
{
    Zstring sourcePath;
    uint64_t size = 0;
    std::string sourceChecksum; //lower-case hex; full verification only
    std::vector<DestinationOutcome> destinations;
    FileStatus status = FileStatus::failed;
    Annotations annotations; //filled by post-processing
};

struct TransferReport
{
    std::vector<FileTransferRecord> files;
    std::vector<std::wstring> errors;
    time_t startTime = 0;
    time_t endTime   = 0;
    std::vector<Zstring> ejectableSources; //source roots with all files verified
    zen::ErrorLog log;
};

struct TransferItem
{
    Zstring sourcePath; //absolute
    std::vector<Zstring> destPaths; //absolute, at least one
};

struct TransferJob
{
    std::string id;
    std::vector<Zstring> sources;      //source roots
    std::vector<Zstring> destinations; //destination roots
    std::vector<TransferItem> fileList;
    JobOptions options;
    uint64_t totalBytes = 0; //fixed once planned
    JobStatus status = JobStatus::queued;
    TransferReport report;
};

//-------------------------------------------------------------------

struct ManifestEntry
{
    Zstring relativePath;
    std::string hash; //lower-case hex
    HashAlgorithm hashAlgo = HashAlgorithm::xxHash64;
    uint64_t size = 0;
};

struct FileVerifyRecord
{
    Zstring relativePath;
    std::string expectedHash;
    HashAlgorithm hashAlgo = HashAlgorithm::xxHash64;
    EntryStatus status = EntryStatus::missing;
    std::string actualHash; //set on mismatch only
};

struct VerifyReport
{
    std::vector<FileVerifyRecord> files;
    int verified = 0;
    int failed   = 0;
    int missing  = 0;
    std::vector<std::wstring> errors;
    time_t startTime = 0;
    time_t endTime   = 0;
    zen::ErrorLog log;
};

struct VerifyJob
{
    std::string id;
    Zstring manifestPath;
    std::vector<ManifestEntry> entries;
    Zstring targetDir;
    JobStatus status = JobStatus::queued;
    VerifyReport report;
};

using Job = std::variant<TransferJob, VerifyJob>;

//-------------------------------------------------------------------

std::string createJobId(); //"Job_" + 8 hex digits

const std::string& getJobId(const Job& job);
JobStatus getJobStatus(const Job& job);
void setJobStatus(Job& job, JobStatus status);
const zen::ErrorLog& getJobLog(const Job& job);
const std::vector<std::wstring>& getJobErrors(const Job& job);

//unit of job progress: bytes for transfers, entries for verification
int64_t getJobProgressTotal(const Job& job);

//merge post-processing results into the record of the given source file; returns false if not found
bool patchFileRecord(TransferJob& job, const Zstring& sourcePath, const Annotations& annotations);
}

#endif //JOB_H_8023475610928374650
