// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSFER_ENGINE_H_0192837465019283
#define TRANSFER_ENGINE_H_0192837465019283

#include <chrono>
#include "engine.h"


namespace slate
{
/*  copy one job, file by file:
    - source is read once, every block is hashed and fanned out to all destinations
    - partial destinations are continued (append), complete ones skipped
    - each destination is verified individually afterwards              */
class TransferEngine : public Engine
{
public:
    TransferEngine(TransferJob job, EngineCallback& cb) : job_(std::move(job)), cb_(cb) {}

    void run() override;

private:
    FileTransferRecord processFile(const TransferItem& item); //throw ThreadStopRequest
    void logError(const std::wstring& msg);

    double getBytesPerSec() const;
    std::vector<Zstring> getEjectableSources() const;

    TransferJob job_;
    EngineCallback& cb_;

    std::chrono::steady_clock::time_point startTime_;
    int64_t bytesDone_ = 0; //bytes of completed files
};
}

#endif //TRANSFER_ENGINE_H_0192837465019283
