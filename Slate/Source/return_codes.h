// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef RETURN_CODES_H_0394857610293847
#define RETURN_CODES_H_0394857610293847

#include "base/structures.h"


namespace slate
{
enum class SlateExitCode //as returned on process exit
{
    success = 0,
    warning,
    error,
    cancelled,
    exception,
};


inline
void raiseExitCode(SlateExitCode& rc, SlateExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


inline
SlateExitCode getExitCode(JobStatus status)
{
    switch (status)
    {
        //*INDENT-OFF*
        case JobStatus::completed:
        case JobStatus::processed:           return SlateExitCode::success;
        case JobStatus::completedWithErrors: return SlateExitCode::warning;
        case JobStatus::cancelled:           return SlateExitCode::cancelled;
        case JobStatus::queued:
        case JobStatus::running:
        case JobStatus::paused:              return SlateExitCode::error; //not finished?
        //*INDENT-ON*
    }
    assert(false);
    return SlateExitCode::error;
}
}

#endif //RETURN_CODES_H_0394857610293847
