/**
* @file
*
* ComplianceChecker class declaration.
*/

#pragma once
#include "ComplianceResult.hh"
#include "DocumentIO.hh"
#include "VersionProfile.hh"
#include <optional>
#include <ostream>
#include <string>

/**
* Detects the PDF/VT variant of a document and validates it against its profile.
* Implements a subset of ISO 16612-2 and ISO 16612-3: catalog marker, XMP marker,
* MarkInfo and PDF version. Output intents, fonts, color spaces and DPM are not checked.
*/
class ComplianceChecker
{
public:
    ComplianceChecker(const ProfileRegistry& registry, DocumentReader& reader);
    ComplianceChecker(const ComplianceChecker&) = delete;
    ComplianceChecker& operator=(const ComplianceChecker&) = delete;

    ComplianceResult check(const std::string& fileName) const;
    bool isCompliant(const std::string& fileName, const std::string& variantId) const;

    static void printResults(const ComplianceResult& result, std::ostream& out);

private:
    void collectEvidence(ReadableDocument& doc, ComplianceResult& result) const;
    std::optional<std::string> scanPacket(const std::string& packet) const;
    void validate(const std::string& marker, ComplianceResult& result) const;

    const ProfileRegistry& m_registry;
    DocumentReader& m_reader;
};
