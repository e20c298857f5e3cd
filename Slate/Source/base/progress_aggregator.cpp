// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "progress_aggregator.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <zen/basic_math.h>
#include <zen/i18n.h>
#include <zen/format_unit.h>

using namespace zen;
using namespace slate;


void ProgressAggregator::addSample(std::chrono::nanoseconds timeElapsed, int64_t bytesCurrent)
{
    //time expected to be monotonously ascending
    assert(samples_.empty() || samples_.back().timeElapsed <= timeElapsed);

    samples_.push_back(Sample{timeElapsed, bytesCurrent});

    //remove old records outside of "window"
    std::optional<Sample> lastPop;
    while (!samples_.empty() && samples_.front().timeElapsed < timeElapsed - windowSize_)
    {
        lastPop = samples_.front();
        samples_.pop_front();
    }
    if (lastPop) //keep one point before new start: samples arrive per file, which may take longer than the window
        samples_.push_front(*lastPop);
}


double ProgressAggregator::getBytesPerSec() const
{
    if (samples_.size() >= 2)
    {
        const double timeDelta = std::chrono::duration<double>(samples_.back().timeElapsed - samples_.front().timeElapsed).count();
        const int64_t bytesDelta = samples_.back().bytes - samples_.front().bytes;

        if (timeDelta > 0 && !numeric::isNull(timeDelta))
            return bytesDelta / timeDelta;
    }
    return 0;
}


std::optional<double> ProgressAggregator::getRemainingSec(int64_t bytesRemaining) const
{
    const double bps = getBytesPerSec();
    if (bps > 0)
        return std::max<int64_t>(bytesRemaining, 0) / bps;
    return std::nullopt;
}


std::wstring ProgressAggregator::getBytesPerSecFmt() const
{
    if (const double bps = getBytesPerSec(); bps > 0)
        return replaceCpy(_("%x/sec"), L"%x", formatFilesizeShort(std::llround(bps)));
    return {};
}
