// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "test_tools.h"
#include "config.h"

using namespace zen;
using namespace slate;
using namespace slate::test;


namespace
{
bool throwsFileError(const Zstring& cfgFilePath)
{
    try
    {
        readConfig(cfgFilePath); //throw FileError
    }
    catch (const FileError&) { return true; }
    return false;
}


void testMissingFileYieldsDefaults()
{
    TempFolder tmp;
    const GlobalConfig cfg = readConfig(tmp / "GlobalSettings.xml");
    assert(cfg == GlobalConfig());
    assert(cfg.maxConcurrentJobs == 1);
    assert(!cfg.deferPostProcess);
    assert(cfg.logfilesMaxAgeDays == 14);
    assert(cfg.logFolderPath.empty());
    assert(cfg.defaultJobOptions.hashAlgo   == HashAlgorithm::xxHash64);
    assert(cfg.defaultJobOptions.verifyMode == VerifyMode::full);
}


void testWriteRead()
{
    TempFolder tmp;

    GlobalConfig cfg;
    cfg.maxConcurrentJobs = 3;
    cfg.deferPostProcess  = true;
    cfg.defaultJobOptions.hashAlgo       = HashAlgorithm::md5;
    cfg.defaultJobOptions.verifyMode     = VerifyMode::sizeOnly;
    cfg.defaultJobOptions.skipExisting   = false;
    cfg.defaultJobOptions.resumePartial  = false;
    cfg.defaultJobOptions.ejectOnSuccess = true;
    cfg.logFolderPath      = tmp / "Logs";
    cfg.logfilesMaxAgeDays = 30;

    writeConfig(cfg, tmp / "GlobalSettings.xml");
    assert(readConfig(tmp / "GlobalSettings.xml") == cfg);

    const std::string xml = readTestFile(tmp / "GlobalSettings.xml");
    assert(contains(xml, "XmlType=\"GLOBAL\""));
    assert(contains(xml, "HashAlgorithm=\"md5\""));

    writeConfig(GlobalConfig(), tmp / "GlobalSettings.xml"); //overwrite
    assert(readConfig(tmp / "GlobalSettings.xml") == GlobalConfig());
}


void testPartialConfig()
{
    TempFolder tmp;
    writeTestFile(tmp / "partial.xml",
                  "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                  "<Slate XmlType=\"GLOBAL\" XmlFormat=\"1\">\n"
                  "    <Scheduler MaxConcurrentJobs=\"0\"/>\n"
                  "    <JobDefaults Verification=\"none\"/>\n"
                  "</Slate>\n");

    const GlobalConfig cfg = readConfig(tmp / "partial.xml");
    assert(cfg.maxConcurrentJobs == 1); //clamped
    assert(cfg.defaultJobOptions.verifyMode == VerifyMode::none);
    assert(cfg.defaultJobOptions.hashAlgo   == HashAlgorithm::xxHash64);
    assert(cfg.logfilesMaxAgeDays == 14);
}


void testInvalidConfig()
{
    TempFolder tmp;

    writeTestFile(tmp / "badEnum.xml", "<Slate XmlType=\"GLOBAL\" XmlFormat=\"1\"><JobDefaults HashAlgorithm=\"sha1\"/></Slate>");
    assert(throwsFileError(tmp / "badEnum.xml"));

    writeTestFile(tmp / "badMode.xml", "<Slate XmlType=\"GLOBAL\" XmlFormat=\"1\"><JobDefaults Verification=\"paranoid\"/></Slate>");
    assert(throwsFileError(tmp / "badMode.xml"));

    writeTestFile(tmp / "badNumber.xml", "<Slate XmlType=\"GLOBAL\" XmlFormat=\"1\"><Scheduler MaxConcurrentJobs=\"many\"/></Slate>");
    assert(throwsFileError(tmp / "badNumber.xml"));

    writeTestFile(tmp / "wrongType.xml", "<Slate XmlType=\"BATCH\" XmlFormat=\"1\"/>");
    assert(throwsFileError(tmp / "wrongType.xml"));

    writeTestFile(tmp / "wrongRoot.xml", "<FreeFileSync XmlType=\"GLOBAL\"/>");
    assert(throwsFileError(tmp / "wrongRoot.xml"));

    writeTestFile(tmp / "future.xml", "<Slate XmlType=\"GLOBAL\" XmlFormat=\"99\"/>");
    assert(throwsFileError(tmp / "future.xml"));

    writeTestFile(tmp / "malformed.xml", "<Slate XmlType=\"GLOBAL\"");
    assert(throwsFileError(tmp / "malformed.xml"));

    createDirectoryIfMissingRecursion(tmp / "folder.xml"); //exists, but not readable as a file
    assert(throwsFileError(tmp / "folder.xml"));
}
}


int main()
{
    try
    {
        RUN_TEST(testMissingFileYieldsDefaults);
        RUN_TEST(testWriteRead);
        RUN_TEST(testPartialConfig);
        RUN_TEST(testInvalidConfig);
    }
    catch (const FileError& e) { std::cerr << utfTo<std::string>(e.toString()) << std::endl; return 1; }
    return 0;
}
