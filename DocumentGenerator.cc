/**
* @file
*
* Sample PDF/VT document generation.
*/

#include "DocumentGenerator.hh"
#include "PageLayout.hh"
#include "QPDFAuthor.hh"
#include "xPDFVT.hh"
#include <ctime>

/**
* Local date and time for page footer, e.g. "May 01, 2024 at 10:20:30".
*/
std::string DocumentGenerator::getGeneratedOn()
{
    const auto now{ std::time(nullptr) };
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[64]{ 0 };
    std::strftime(buffer, sizeof(buffer), "%B %d, %Y at %H:%M:%S", &local);
    return buffer;
}

/**
* Author sample document for profile and write it to outputPath.
* Page, document info, catalog marker, MarkInfo and XMP packet are assembled in memory
* and written in one pass. Errors from qpdf propagate to the caller.
*
* @param[in]    profile     target PDF/VT variant
* @param[in]    outputPath  output file, overwritten if it exists
*/
void DocumentGenerator::createDocument(const VersionProfile& profile, const std::string& outputPath) const
{
    TRACE("%s!%s %s\n", __func__, profile.marker.c_str(), outputPath.c_str());
    const auto& options{ globalOptionsFromIni };

    QPDFAuthor author;
    PageLayout layout{ options.pageWidth, options.pageHeight, options.margin };
    author.addPage(layout.layout(profile, getGeneratedOn(), options.creator), PageLayout::getFonts());
    m_writer.stamp(profile, author);
    author.save(outputPath, profile.pdfVersion);
}
