/**
* @file
*
* xpdf based implementation of the document reading collaborator.
*/

#pragma once
#include <PDFDoc.h>
#include <Zoox.h>
#include "DocumentIO.hh"
#include <memory>
#include <string>

/**
* PDFDoc with access to PDF/VT evidence: catalog entries, MarkInfo and XMP metadata.
*/
class PDFDocEx : public PDFDoc, public ReadableDocument
{
public:
    explicit PDFDocEx(const std::string& fileName);
    PDFDocEx(const PDFDocEx&) = delete;
    PDFDocEx& operator=(const PDFDocEx&) = delete;
    ~PDFDocEx() override;

    std::string getDeclaredVersion() override;
    std::optional<std::string> getCatalogEntry(const char* key) override;
    std::optional<bool> getCatalogStructureFlag() override;
    std::optional<std::string> getMetadataPacket() override;
    std::string getConformanceSummary() override;

    GString* getMetadataString(const char* key);
    GString* getConformance();
    double getPDFVersion();

    static std::string formatPDFVersion(double version);

private:
    static bool getElemOrAttrData(ZxElement* elem, const char* nodeName, GString& value, const char* prefix);
    static const char* findXmpPrefix(ZxElement* elem, const char* nsURI);
    GString* getXmpValue(const char* nsURI, const char* key, const char* arrayType);
    ZxElement* getXmpRDF();
    bool openXMP();

    std::unique_ptr<ZxDoc> m_xmp{ nullptr };
    bool m_xmpChecked{ false };
};

/**
* Opens PDF documents with xpdf.
* xpdf globalParams must be initialized, see #XpdfGlobals.
*/
class PDFReaderEx : public DocumentReader
{
public:
    std::unique_ptr<ReadableDocument> open(const std::string& fileName) override;

    static const char* describeError(int errorCode);
};
