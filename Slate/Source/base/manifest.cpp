// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "manifest.h"
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <zen/file_io.h>
#include <zen/sys_info.h>
#include <zen/format_unit.h>
#include <zen/time.h>
#include "../version/version.h"

using namespace zen;
using namespace slate;
using boost::property_tree::ptree;


namespace
{
//"mhl:hash" -> "hash"
std::string getLocalName(const std::string& elementName)
{
    return afterLast(elementName, ":", IfNotFoundReturn::all);
}


const ptree* findChild(const ptree& parent, const std::string& localName)
{
    for (const auto& [name, child] : parent)
        if (getLocalName(name) == localName)
            return &child;
    return nullptr;
}


//equivalent to XPath ".//hash"
void collectHashElements(const ptree& node, std::vector<const ptree*>& hashElements)
{
    for (const auto& [name, child] : node)
        if (name != "<xmlattr>" && name != "<xmlcomment>")
        {
            if (getLocalName(name) == "hash")
                hashElements.push_back(&child);
            else
                collectHashElements(child, hashElements);
        }
}


std::string getHashText(const ptree& element)
{
    std::string hash = trimCpy(element.get_value<std::string>());
    for (char& c : hash)
        c = asciiToLower(c);
    return hash;
}


std::string getText(const ptree& element)
{
    return trimCpy(element.get_value<std::string>());
}


std::string formatXmlTime(time_t utcTime)
{
    return formatTime(formatXmlDateTimeTag, getLocalTime(utcTime));
}
}


std::vector<ManifestEntry> slate::parseMhlFile(const Zstring& filePath) //throw FileError
{
    const std::string stream = getFileContent(filePath); //throw FileError

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

    std::vector<const ptree*> hashElements;
    collectHashElements(doc, hashElements);

    std::vector<ManifestEntry> entries;
    for (const ptree* hashElem : hashElements)
    {
        const ptree* fileElem = findChild(*hashElem, "file");
        const ptree* sizeElem = findChild(*hashElem, "size");

        ManifestEntry entry;
        if (const ptree* xxhElem = findChild(*hashElem, "xxhash64"))
        {
            entry.hash     = getHashText(*xxhElem);
            entry.hashAlgo = HashAlgorithm::xxHash64;
        }
        else if (const ptree* md5Elem = findChild(*hashElem, "md5"))
        {
            entry.hash     = getHashText(*md5Elem);
            entry.hashAlgo = HashAlgorithm::md5;
        }

        if (!fileElem || getText(*fileElem).empty() || entry.hash.empty())
            continue;

        entry.relativePath = getText(*fileElem);
        if (sizeElem)
            entry.size = stringTo<uint64_t>(getText(*sizeElem));

        entries.push_back(std::move(entry));
    }
    return entries;
}


void slate::saveMhlFile(const TransferJob& job, const Zstring& filePath) //throw FileError
{
    const Zstring manifestFolderPath = getParentFolderPath(filePath) ? *getParentFolderPath(filePath) : Zstring(Zstr("."));

    ptree doc;
    ptree& hashList = doc.add_child("hashlist", ptree());
    hashList.put("<xmlattr>.version", std::string("1.1"));

    ptree& creatorInfo = hashList.add_child("creatorinfo", ptree());
    creatorInfo.put("hostname", getComputerName()); //throw FileError
    creatorInfo.put("username", getLoginUser());    //throw FileError
    creatorInfo.put("tool", std::string("Slate ") + slateVersion);
    creatorInfo.put("startdate",  formatXmlTime(job.report.startTime));
    creatorInfo.put("finishdate", formatXmlTime(job.report.endTime));

    const std::string hashTag = getHashAlgorithmName(job.options.hashAlgo);

    for (const FileTransferRecord& rec : job.report.files)
        if (rec.status == FileStatus::verified && !rec.sourceChecksum.empty())
            for (const DestinationOutcome& dest : rec.destinations)
                if (dest.verified)
                {
                    ptree& hashElem = hashList.add_child("hash", ptree());
                    hashElem.put("file", getRelativePath(manifestFolderPath, dest.path));
                    hashElem.put("size", numberTo<std::string>(rec.size));
                    hashElem.put(hashTag, rec.sourceChecksum);
                }

    std::ostringstream oss;
    boost::property_tree::write_xml(oss, doc, boost::property_tree::xml_writer_make_settings<std::string>(' ', 2));

    setFileContent(filePath, oss.str()); //throw FileError
}


VerifyJob slate::makeVerifyJob(const Zstring& manifestPath, const Zstring& targetDir) //throw FileError
{
    VerifyJob job;
    job.id           = createJobId();
    job.manifestPath = manifestPath;
    job.targetDir    = targetDir;
    job.entries      = parseMhlFile(manifestPath); //throw FileError
    return job;
}
