/**
* @file
*
* DocumentGenerator class declaration.
*/

#pragma once
#include "MetadataWriter.hh"
#include "VersionProfile.hh"
#include <string>

/**
* Creates one-page sample PDF/VT documents.
*/
class DocumentGenerator
{
public:
    void createDocument(const VersionProfile& profile, const std::string& outputPath) const;

    static std::string getGeneratedOn();

private:
    MetadataWriter m_writer;
};
