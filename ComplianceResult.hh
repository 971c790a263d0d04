/**
* @file
*
* Result of one PDF/VT compliance check.
*/

#pragma once
#include <optional>
#include <string>
#include <vector>

/**
* Verdict and evidence collected by #ComplianceChecker::check.
* Created empty for every check and owned by the caller afterwards.
*/
struct ComplianceResult
{
    bool isCompliant{ false };                      /**< overall verdict */
    std::optional<std::string> detectedVariant;     /**< id of the resolved #VersionProfile */
    std::optional<std::string> rawMarker;           /**< marker as found, even if no profile matches */
    std::optional<std::string> declaredPdfVersion;  /**< "major.minor" */
    bool hasCatalogMarker{ false };                 /**< GTS_PDFVTVersion string in catalog */
    bool hasPacketMarker{ false };                  /**< detected marker found in XMP packet */
    bool hasStructureFlag{ false };                 /**< MarkInfo /Marked true */
    std::string conformance;                        /**< XMP conformance summary, informational */
    std::vector<std::string> issues;                /**< diagnostics, in detection order */
};
