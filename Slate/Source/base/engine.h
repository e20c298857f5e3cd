// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ENGINE_H_5610293847561029384
#define ENGINE_H_5610293847561029384

#include <atomic>
#include <optional>
#include <zen/thread.h>
#include "job.h"


namespace slate
{
//notifications from an engine: context of the engine's (worker) thread!
class EngineCallback
{
public:
    virtual ~EngineCallback() {}

    //processed: bytes (transfer) or entries (verification), never decreasing while running
    virtual void onJobProgress(const std::string& jobId, int64_t processed, double bytesPerSec, std::optional<double> etaSec) = 0; //noexcept!

    virtual void onFileProgress(const std::string& jobId, double percent, const std::wstring& statusText, const Zstring& currentPath, double bytesPerSec) = 0; //noexcept!

    //called exactly once per run(), carries the terminal record
    virtual void onJobFinished(Job&& job) = 0; //noexcept!
};


class Engine
{
public:
    virtual ~Engine() {}

    //execute the job on the calling thread; returns after EngineCallback::onJobFinished()
    virtual void run() = 0;

    //thread-safe:
    void pause () { pauseRequested_  = true; }
    void resume() { pauseRequested_  = false; }
    void cancel() { cancelRequested_ = true; pauseRequested_ = false; }

protected:
    Engine() {}

    //suspension point at chunk and file boundaries: context of engine thread
    void checkpoint() //throw ThreadStopRequest
    {
        for (;;)
        {
            if (cancelRequested_)
                throw zen::ThreadStopRequest();
            zen::interruptionPoint(); //throw ThreadStopRequest

            if (!pauseRequested_)
                return;
            zen::interruptibleSleep(std::chrono::milliseconds(500)); //throw ThreadStopRequest
        }
    }

private:
    Engine           (const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    std::atomic<bool> pauseRequested_ {false}; //std::atomic is uninitialized by default!
    std::atomic<bool> cancelRequested_{false}; //
};
}

#endif //ENGINE_H_5610293847561029384
