/**
* @file
*
* PDF/VT compliance checking.
*
* The catalog GTS_PDFVTVersion entry is the primary variant indicator, the XMP packet
* only confirms it. A document without catalog marker may still be detected from
* its XMP packet, but is never compliant.
*/

#include "ComplianceChecker.hh"
#include "xPDFVT.hh"

ComplianceChecker::ComplianceChecker(const ProfileRegistry& registry, DocumentReader& reader)
: m_registry(registry), m_reader(reader)
{
}

/**
* Find variant marker in XMP packet.
* Markers are tried in #ProfileRegistry::fallbackOrder, so a marker that contains
* another marker wins over the shorter one.
*
* @param[in]    packet  XMP packet
* @return marker of first matching profile, or empty
*/
std::optional<std::string> ComplianceChecker::scanPacket(const std::string& packet) const
{
    for (const auto profile : m_registry.fallbackOrder())
    {
        if (packet.find(profile->marker) != std::string::npos)
        {
            return profile->marker;
        }
    }
    return {};
}

/**
* Read PDF version, catalog marker, MarkInfo and XMP packet.
* Every missing piece of evidence is recorded as an issue.
*/
void ComplianceChecker::collectEvidence(ReadableDocument& doc, ComplianceResult& result) const
{
    result.declaredPdfVersion = doc.getDeclaredVersion();

    auto candidate{ doc.getCatalogEntry(PDFVT_VERSION_KEY) };
    if (candidate)
    {
        result.hasCatalogMarker = true;
    }
    else
    {
        result.issues.emplace_back(std::string(PDFVT_VERSION_KEY) + " not found in catalog");
    }

    result.hasStructureFlag = doc.getCatalogStructureFlag().value_or(false);
    if (!result.hasStructureFlag)
    {
        result.issues.emplace_back("MarkInfo with Marked=true not found");
    }

    const auto packet{ doc.getMetadataPacket() };
    if (!packet)
    {
        result.issues.emplace_back("XMP metadata not found");
    }
    else
    {
        const auto hasKey{ packet->find(PDFVT_VERSION_KEY) != std::string::npos };
        if (!candidate && hasKey)
        {
            candidate = scanPacket(*packet);
        }
        result.hasPacketMarker = candidate && (packet->find(*candidate) != std::string::npos);

        if (!hasKey)
        {
            result.issues.emplace_back(std::string(PDFVT_VERSION_KEY) + " not found in XMP metadata");
        }
        else if (candidate && !result.hasPacketMarker)
        {
            result.issues.emplace_back("XMP metadata does not contain " + *candidate);
        }
        result.conformance = doc.getConformanceSummary();
    }

    result.rawMarker = candidate;
}

/**
* Resolve marker to profile and apply its PDF version rule.
* Catalog marker and MarkInfo are required by every profile.
*/
void ComplianceChecker::validate(const std::string& marker, ComplianceResult& result) const
{
    const auto profile{ m_registry.findByMarker(marker) };
    if (!profile)
    {
        result.issues.emplace_back("Unknown PDF/VT version: " + marker);
        return;
    }

    result.detectedVariant = profile->id;
    const auto& declared{ result.declaredPdfVersion.value_or(std::string()) };
    const auto versionOk{ profile->pdfVersionRule.isSatisfiedBy(declared) };
    if (!versionOk)
    {
        result.issues.emplace_back(profile->marker + " requires " + profile->pdfVersionRule.describe()
            + ", found " + declared);
    }

    result.isCompliant = versionOk && result.hasCatalogMarker && result.hasStructureFlag;
}

/**
* Check PDF/VT compliance of a document.
* Document is opened once and closed before returning.
* Errors while reading the document are recorded as issues, the result is then not compliant.
*
* @param[in]    fileName    document to check
* @return verdict and evidence
* @throw FileNotFoundError if fileName doesn't exist
*/
ComplianceResult ComplianceChecker::check(const std::string& fileName) const
{
    TRACE("%s!%s\n", __func__, fileName.c_str());
    ComplianceResult result;

    try
    {
        const auto doc{ m_reader.open(fileName) };
        collectEvidence(*doc, result);
    }
    catch (const FileNotFoundError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        TRACE("%s!%s\n", __func__, e.what());
        result.issues.emplace_back(std::string("Error reading PDF: ") + e.what());
        return result;
    }

    if (result.rawMarker)
    {
        validate(*result.rawMarker, result);
    }
    else
    {
        result.issues.emplace_back("No PDF/VT version marker found");
    }

    TRACE("%s!compliant=%d issues=%zu\n", __func__, result.isCompliant, result.issues.size());
    return result;
}

/**
* Check that document is compliant and is of expected variant.
*
* @param[in]    fileName    document to check
* @param[in]    variantId   expected #VersionProfile::id, e.g. "vt3"
* @return true if compliant and detected variant is variantId
* @throw FileNotFoundError if fileName doesn't exist
*/
bool ComplianceChecker::isCompliant(const std::string& fileName, const std::string& variantId) const
{
    const auto result{ check(fileName) };
    return result.isCompliant && (result.detectedVariant == variantId);
}

/**
* Print verdict, evidence tree and issues.
*/
void ComplianceChecker::printResults(const ComplianceResult& result, std::ostream& out)
{
    const auto mark = [](bool value) { return value ? "✓" : "✗"; };

    out << "PDF/VT Compliance Check Results\n";
    out << "   PDF Version: " << result.declaredPdfVersion.value_or("unknown") << '\n';
    out << "   Detected: " << result.rawMarker.value_or("Not PDF/VT") << '\n';
    out << "   Compliant: " << (result.isCompliant ? "✓ Yes" : "✗ No") << '\n';
    if (!result.conformance.empty())
    {
        out << "   XMP Conformance: " << result.conformance << '\n';
    }
    out << '\n';

    out << "   Validation Details:\n";
    out << "   ├─ GTS in Catalog: " << mark(result.hasCatalogMarker) << '\n';
    out << "   ├─ GTS in XMP:     " << mark(result.hasPacketMarker) << '\n';
    out << "   └─ MarkInfo:       " << mark(result.hasStructureFlag) << '\n';

    if (!result.issues.empty())
    {
        out << '\n';
        out << "   Issues:\n";
        for (const auto& issue : result.issues)
        {
            out << "   ⚠ " << issue << '\n';
        }
    }
}
