// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "structures.h"
#include <cassert>
#include <zen/i18n.h>

using namespace zen;
using namespace slate;


std::wstring slate::getStatusLabel(JobStatus status)
{
    switch (status)
    {
        //*INDENT-OFF*
        case JobStatus::queued:              return _("Queued");
        case JobStatus::running:             return _("Running");
        case JobStatus::paused:              return _("Paused");
        case JobStatus::cancelled:           return _("Cancelled");
        case JobStatus::completed:           return _("Completed");
        case JobStatus::completedWithErrors: return _("Completed with issues");
        case JobStatus::processed:           return _("Processed");
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::wstring slate::getStatusLabel(FileStatus status)
{
    switch (status)
    {
        //*INDENT-OFF*
        case FileStatus::verified:         return _("Verified");
        case FileStatus::copiedUnverified: return _("Copied (Unverified)");
        case FileStatus::failed:           return _("Failed");
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::wstring slate::getStatusLabel(EntryStatus status)
{
    switch (status)
    {
        //*INDENT-OFF*
        case EntryStatus::verified: return _("Verified");
        case EntryStatus::failed:   return _("FAILED");
        case EntryStatus::missing:  return _("Missing");
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::wstring slate::getVariantName(VerifyMode mode)
{
    switch (mode)
    {
        //*INDENT-OFF*
        case VerifyMode::full:     return _("Full checksum");
        case VerifyMode::sizeOnly: return _("File size");
        case VerifyMode::none:     return _("None");
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::string slate::getHashAlgorithmName(HashAlgorithm algo)
{
    switch (algo)
    {
        //*INDENT-OFF*
        case HashAlgorithm::xxHash64: return "xxhash64";
        case HashAlgorithm::md5:      return "md5";
        //*INDENT-ON*
    }
    assert(false);
    return {};
}


std::optional<HashAlgorithm> slate::parseHashAlgorithm(const std::string& name)
{
    const std::string nameTrm = trimCpy(name);
    if (equalAsciiNoCase(nameTrm, "xxhash64") ||
        equalAsciiNoCase(nameTrm, "xxhash"))
        return HashAlgorithm::xxHash64;
    if (equalAsciiNoCase(nameTrm, "md5"))
        return HashAlgorithm::md5;
    return std::nullopt;
}


std::string slate::getVerifyModeName(VerifyMode mode)
{
    switch (mode)
    {
        //*INDENT-OFF*
        case VerifyMode::full:     return "full";
        case VerifyMode::sizeOnly: return "size";
        case VerifyMode::none:     return "none";
        //*INDENT-ON*
    }
    assert(false);
    return {};
}


std::optional<VerifyMode> slate::parseVerifyMode(const std::string& name)
{
    const std::string nameTrm = trimCpy(name);
    if (equalAsciiNoCase(nameTrm, "full"))
        return VerifyMode::full;
    if (equalAsciiNoCase(nameTrm, "size"))
        return VerifyMode::sizeOnly;
    if (equalAsciiNoCase(nameTrm, "none"))
        return VerifyMode::none;
    return std::nullopt;
}
