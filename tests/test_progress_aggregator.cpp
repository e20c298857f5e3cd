// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "test_tools.h"
#include <cmath>
#include "base/progress_aggregator.h"

using namespace zen;
using namespace slate;
using namespace std::chrono_literals;


namespace
{
bool almostEqual(double lhs, double rhs) { return std::abs(lhs - rhs) < 1e-6; }


void testNoSamples()
{
    ProgressAggregator agg;
    assert(agg.getBytesPerSec() == 0);
    assert(!agg.getRemainingSec(1000));
    assert(agg.getBytesPerSecFmt().empty());

    agg.addSample(0s, 0); //single sample: no speed yet
    assert(agg.getBytesPerSec() == 0);
    assert(etaToEventValue(agg.getRemainingSec(1000)) == -1);
}


void testSpeedAndRemainingTime()
{
    ProgressAggregator agg;
    agg.addSample(0s, 0);
    agg.addSample(1s, 1000);
    assert(almostEqual(agg.getBytesPerSec(), 1000));

    agg.addSample(2s, 3000); //average over window
    assert(almostEqual(agg.getBytesPerSec(), 1500));

    const std::optional<double> eta = agg.getRemainingSec(6000);
    assert(eta && almostEqual(*eta, 4));
    assert(etaToEventValue(eta) == *eta);

    assert(almostEqual(*agg.getRemainingSec(-5), 0)); //overshoot

    assert(!agg.getBytesPerSecFmt().empty());
}


void testWindowExpiry()
{
    ProgressAggregator agg(10s);
    agg.addSample(0s, 0);
    agg.addSample(5s, 500);
    agg.addSample(20s, 2500); //earlier samples fall out of the 10s window: last one is kept as left edge
    assert(almostEqual(agg.getBytesPerSec(), 2000.0 / 15));

    agg.addSample(21s, 2600);
    assert(almostEqual(agg.getBytesPerSec(), 2100.0 / 16));

    agg.addSample(25s, 3000); //left edge stays until a newer sample leaves the window
    assert(almostEqual(agg.getBytesPerSec(), 2500.0 / 20));

    agg.addSample(31s, 3600); //20s sample is the new left edge
    assert(almostEqual(agg.getBytesPerSec(), 1100.0 / 11));
}


void testSlowFile()
{
    //one sample per file: a file taking longer than the window still yields a speed
    ProgressAggregator agg(10s);
    agg.addSample(0s, 0);
    agg.addSample(30s, 3000);
    assert(almostEqual(agg.getBytesPerSec(), 100));

    const std::optional<double> eta = agg.getRemainingSec(1000);
    assert(eta && almostEqual(*eta, 10));

    agg.addSample(60s, 6000);
    assert(almostEqual(agg.getBytesPerSec(), 100));
}


void testStall()
{
    ProgressAggregator agg;
    agg.addSample(0s, 1000);
    agg.addSample(3s, 1000);
    assert(agg.getBytesPerSec() == 0);
    assert(!agg.getRemainingSec(1000));

    agg.clear();
    agg.addSample(4s, 1000);
    agg.addSample(4s, 2000); //zero time delta
    assert(agg.getBytesPerSec() == 0);
}
}


int main()
{
    RUN_TEST(testNoSamples);
    RUN_TEST(testSpeedAndRemainingTime);
    RUN_TEST(testWindowExpiry);
    RUN_TEST(testSlowFile);
    RUN_TEST(testStall);
    return 0;
}
