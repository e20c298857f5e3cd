// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "config.h"
#include <algorithm>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/format_unit.h>

using namespace zen;
using namespace slate;
using boost::property_tree::ptree;


namespace
{
//-------------------------------------------------------------------------------------------------------------------------------
const int XML_FORMAT_GLOBAL_CFG = 1; //2025-10-19
//-------------------------------------------------------------------------------------------------------------------------------

const char CFG_ROOT_NAME[] = "Slate";
const char CFG_TYPE_GLOBAL[] = "GLOBAL";


std::wstring getInvalidValueMsg(const std::string& itemName, const std::string& value)
{
    return replaceCpy(replaceCpy(_("Invalid value %y for item %x."), L"%x", utfTo<std::wstring>(itemName)),
                      L"%y", L'\"' + utfTo<std::wstring>(value) + L'\"');
}


std::wstring getInvalidCfgMsg(const Zstring& filePath)
{
    return replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath));
}


//missing attribute: keep current value
template <class T>
void readAttribute(const ptree& in, const std::string& name, T& value, const Zstring& filePath) //throw FileError
{
    const std::string path = "<xmlattr>." + name;
    if (in.get_child_optional(path))
    {
        const boost::optional<T> tmp = in.get_optional<T>(path);
        if (!tmp)
            throw FileError(getInvalidCfgMsg(filePath), getInvalidValueMsg(name, in.get<std::string>(path)));
        value = *tmp;
    }
}


template <class Enum>
void readEnumAttribute(const ptree& in, const std::string& name, Enum& value,
                       std::optional<Enum> (*parseEnum)(const std::string& name), const Zstring& filePath) //throw FileError
{
    std::string enumName;
    readAttribute(in, name, enumName, filePath); //throw FileError
    if (!enumName.empty())
    {
        const std::optional<Enum> tmp = parseEnum(enumName);
        if (!tmp)
            throw FileError(getInvalidCfgMsg(filePath), getInvalidValueMsg(name, enumName));
        value = *tmp;
    }
}


GlobalConfig parseConfig(const ptree& doc, const Zstring& filePath) //throw FileError
{
    const ptree* root = [&]() -> const ptree*
    {
        if (auto it = doc.find(CFG_ROOT_NAME); it != doc.not_found())
            return &it->second;
        return nullptr;
    }();
    if (!root || root->get<std::string>("<xmlattr>.XmlType", "") != CFG_TYPE_GLOBAL)
        throw FileError(getInvalidCfgMsg(filePath));

    int formatVer = 0;
    readAttribute(*root, "XmlFormat", formatVer, filePath); //throw FileError
    if (formatVer > XML_FORMAT_GLOBAL_CFG)
        throw FileError(getInvalidCfgMsg(filePath), replaceCpy(_("Unsupported format version %x."), L"%x", formatNumber(formatVer)));

    GlobalConfig cfg;

    if (const auto scheduler = root->get_child_optional("Scheduler"))
    {
        int maxConcurrentJobs = static_cast<int>(cfg.maxConcurrentJobs);
        readAttribute(*scheduler, "MaxConcurrentJobs",   maxConcurrentJobs,    filePath); //throw FileError
        readAttribute(*scheduler, "DeferPostProcessing", cfg.deferPostProcess, filePath); //
        cfg.maxConcurrentJobs = std::max(maxConcurrentJobs, 1);
    }

    if (const auto jobDefaults = root->get_child_optional("JobDefaults"))
    {
        JobOptions& options = cfg.defaultJobOptions;
        readEnumAttribute(*jobDefaults, "HashAlgorithm", options.hashAlgo,   parseHashAlgorithm, filePath); //throw FileError
        readEnumAttribute(*jobDefaults, "Verification",  options.verifyMode, parseVerifyMode,    filePath); //
        readAttribute(*jobDefaults, "SkipExisting",   options.skipExisting,   filePath); //
        readAttribute(*jobDefaults, "ResumePartial",  options.resumePartial,  filePath); //
        readAttribute(*jobDefaults, "EjectOnSuccess", options.ejectOnSuccess, filePath); //
    }

    if (const auto logFiles = root->get_child_optional("LogFiles"))
    {
        readAttribute(*logFiles, "Folder", cfg.logFolderPath,      filePath); //throw FileError
        readAttribute(*logFiles, "MaxAge", cfg.logfilesMaxAgeDays, filePath); //
    }
    return cfg;
}
}


GlobalConfig slate::readConfig(const Zstring& filePath) //throw FileError
{
    std::string stream;
    try
    {
        stream = getFileContent(filePath); //throw FileError
    }
    catch (FileError&)
    {
        bool cfgExists = true;
        try { cfgExists = itemExists(filePath); /*throw FileError*/ }
        catch (FileError&) {} //=> report original error

        if (!cfgExists) //first start: use defaults
            return GlobalConfig();
        throw;
    }

    ptree doc;
    try
    {
        std::istringstream iss(stream);
        boost::property_tree::read_xml(iss, doc, boost::property_tree::xml_parser::trim_whitespace);
    }
    catch (const boost::property_tree::xml_parser_error& e)
    {
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)),
                        replaceCpy(replaceCpy(_("Error parsing file %x, row %y."), L"%x", fmtPath(filePath)),
                                   L"%y", formatNumber(e.line())) + L'\n' + utfTo<std::wstring>(e.message()));
    }

    return parseConfig(doc, filePath); //throw FileError
}


void slate::writeConfig(const GlobalConfig& cfg, const Zstring& filePath) //throw FileError
{
    ptree root;
    root.put("<xmlattr>.XmlType", std::string(CFG_TYPE_GLOBAL));
    root.put("<xmlattr>.XmlFormat", XML_FORMAT_GLOBAL_CFG);

    ptree& scheduler = root.add_child("Scheduler", ptree());
    scheduler.put("<xmlattr>.MaxConcurrentJobs", std::max<size_t>(cfg.maxConcurrentJobs, 1));
    scheduler.put("<xmlattr>.DeferPostProcessing", cfg.deferPostProcess);

    ptree& jobDefaults = root.add_child("JobDefaults", ptree());
    jobDefaults.put("<xmlattr>.HashAlgorithm",  getHashAlgorithmName(cfg.defaultJobOptions.hashAlgo));
    jobDefaults.put("<xmlattr>.Verification",   getVerifyModeName(cfg.defaultJobOptions.verifyMode));
    jobDefaults.put("<xmlattr>.SkipExisting",   cfg.defaultJobOptions.skipExisting);
    jobDefaults.put("<xmlattr>.ResumePartial",  cfg.defaultJobOptions.resumePartial);
    jobDefaults.put("<xmlattr>.EjectOnSuccess", cfg.defaultJobOptions.ejectOnSuccess);

    ptree& logFiles = root.add_child("LogFiles", ptree());
    logFiles.put("<xmlattr>.Folder", std::string(cfg.logFolderPath));
    logFiles.put("<xmlattr>.MaxAge", cfg.logfilesMaxAgeDays);

    ptree doc;
    doc.add_child(CFG_ROOT_NAME, root);

    std::ostringstream oss;
    boost::property_tree::write_xml(oss, doc, boost::property_tree::xml_writer_make_settings<std::string>(' ', 4));

    setFileContent(filePath, oss.str()); //throw FileError
}
