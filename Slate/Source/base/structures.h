// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRUCTURES_H_3720598123475098234
#define STRUCTURES_H_3720598123475098234

#include <optional>
#include <string>
#include <zen/zstring.h>


namespace slate
{
enum class HashAlgorithm
{
    xxHash64,
    md5,
};

enum class VerifyMode
{
    full,     //re-hash every destination
    sizeOnly,
    none,
};

//monotonic, except running <-> paused
enum class JobStatus
{
    queued,
    running,
    paused,
    cancelled,
    completed,
    completedWithErrors,
    processed, //post-processing finished
};

enum class FileStatus
{
    verified,
    copiedUnverified,
    failed,
};

enum class EntryStatus
{
    verified,
    failed,
    missing,
};

enum class QueueState
{
    idle,
    running,
    paused,
};


struct JobOptions
{
    HashAlgorithm hashAlgo = HashAlgorithm::xxHash64;
    VerifyMode verifyMode  = VerifyMode::full;
    bool skipExisting   = true;
    bool resumePartial  = true;
    bool ejectOnSuccess = false;

    bool operator==(const JobOptions&) const = default;
};

//no more state changes
inline bool isTerminal(JobStatus status) { return status != JobStatus::queued && status != JobStatus::running && status != JobStatus::paused; }

std::wstring getStatusLabel(JobStatus status);
std::wstring getStatusLabel(FileStatus status);
std::wstring getStatusLabel(EntryStatus status);
std::wstring getVariantName(VerifyMode mode);

//names as used in MHL manifests and config files
std::string getHashAlgorithmName(HashAlgorithm algo);
std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name);

std::string getVerifyModeName(VerifyMode mode);
std::optional<VerifyMode> parseVerifyMode(const std::string& name);
}

#endif //STRUCTURES_H_3720598123475098234
