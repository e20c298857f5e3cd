// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef PROGRESS_AGGREGATOR_H_1928374650192837
#define PROGRESS_AGGREGATOR_H_1928374650192837

#include <chrono>
#include <deque>
#include <optional>
#include <string>


namespace slate
{
//rolling-window throughput: speed = (bytes_last - bytes_first) / (t_last - t_first)
class ProgressAggregator
{
public:
    explicit ProgressAggregator(std::chrono::milliseconds windowSize = std::chrono::seconds(10)) : windowSize_(windowSize) {}

    void addSample(std::chrono::nanoseconds timeElapsed, int64_t bytesCurrent);

    double getBytesPerSec() const; //0 if not (yet) available
    std::optional<double> getRemainingSec(int64_t bytesRemaining) const; //no value if speed is 0

    std::wstring getBytesPerSecFmt() const; //empty if not (yet) available

    void clear() { samples_.clear(); }

private:
    struct Sample
    {
        std::chrono::nanoseconds timeElapsed{}; //std::chrono::duration is uninitialized by default! WTF
        int64_t bytes = 0;
    };

    const std::chrono::milliseconds windowSize_;
    std::deque<Sample> samples_;
};

//encoding of "unknown" in progress events
inline double etaToEventValue(const std::optional<double>& etaSec) { return etaSec ? *etaSec : -1; }
}

#endif //PROGRESS_AGGREGATOR_H_1928374650192837
