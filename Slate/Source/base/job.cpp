// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "job.h"
#include <zen/guid.h>

using namespace zen;
using namespace slate;


std::string slate::createJobId()
{
    return "Job_" + formatAsHexString(generateGUID().substr(0, 4));
}


const std::string& slate::getJobId(const Job& job)
{
    return std::visit([](const auto& j) -> const std::string& { return j.id; }, job);
}


JobStatus slate::getJobStatus(const Job& job)
{
    return std::visit([](const auto& j) { return j.status; }, job);
}


void slate::setJobStatus(Job& job, JobStatus status)
{
    std::visit([status](auto& j) { j.status = status; }, job);
}


const ErrorLog& slate::getJobLog(const Job& job)
{
    return std::visit([](const auto& j) -> const ErrorLog& { return j.report.log; }, job);
}


const std::vector<std::wstring>& slate::getJobErrors(const Job& job)
{
    return std::visit([](const auto& j) -> const std::vector<std::wstring>& { return j.report.errors; }, job);
}


int64_t slate::getJobProgressTotal(const Job& job)
{
    if (const TransferJob* tj = std::get_if<TransferJob>(&job))
        return static_cast<int64_t>(tj->totalBytes);
    return std::ssize(std::get<VerifyJob>(job).entries);
}


bool slate::patchFileRecord(TransferJob& job, const Zstring& sourcePath, const Annotations& annotations)
{
    for (FileTransferRecord& rec : job.report.files)
        if (rec.sourcePath == sourcePath)
        {
            for (const auto& [key, value] : annotations)
                rec.annotations[key] = value;
            return true;
        }
    return false;
}
