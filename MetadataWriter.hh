/**
* @file
*
* MetadataWriter class declaration.
*/

#pragma once
#include "DocumentIO.hh"
#include "VersionProfile.hh"
#include <string>

/**
* Stamps PDF/VT metadata into a document being authored:
* document info, catalog marker, MarkInfo and XMP packet.
* Stateless, one instance may be used for any number of documents.
*/
class MetadataWriter
{
public:
    void stamp(const VersionProfile& profile, DocumentSink& sink) const;
    void stamp(const VersionProfile& profile, DocumentSink& sink, const std::string& timestamp) const;

    static std::string createXmpPacket(const VersionProfile& profile, const std::string& timestamp);
    static std::string getTitle(const VersionProfile& profile);
    static std::string getSubject(const VersionProfile& profile);
    static std::string getKeywords(const VersionProfile& profile);
    static std::string currentTimestamp();
    static std::string toPdfDate(const std::string& timestamp);

private:
    static std::string escapeXml(const std::string& text);
};
