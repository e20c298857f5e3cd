// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef VERIFICATION_ENGINE_H_7465019283746501
#define VERIFICATION_ENGINE_H_7465019283746501

#include "engine.h"


namespace slate
{
//read-only: re-hash targetDir/relativePath for each manifest entry
class VerificationEngine : public Engine
{
public:
    VerificationEngine(VerifyJob job, EngineCallback& cb) : job_(std::move(job)), cb_(cb) {}

    void run() override;

private:
    FileVerifyRecord verifyEntry(const ManifestEntry& entry); //throw FileError, ThreadStopRequest

    VerifyJob job_;
    EngineCallback& cb_;
};
}

#endif //VERIFICATION_ENGINE_H_7465019283746501
