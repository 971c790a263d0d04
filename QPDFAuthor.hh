/**
* @file
*
* qpdf based implementation of the document authoring collaborator.
*/

#pragma once
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include "DocumentIO.hh"
#include <string>
#include <vector>

/**
* Standard 14 font used by page content, referenced as /key in content streams.
*/
struct StandardFont
{
    std::string key;        /**< resource name without slash, e.g. "F1" */
    std::string baseFont;   /**< standard font name without slash, e.g. "Helvetica" */
};

/**
* In-memory PDF document built with qpdf.
* Nothing is written to disk until #save is called.
*/
class QPDFAuthor : public DocumentSink
{
public:
    explicit QPDFAuthor();
    QPDFAuthor(const QPDFAuthor&) = delete;
    QPDFAuthor& operator=(const QPDFAuthor&) = delete;

    void setInfoField(const std::string& key, const std::string& value) override;
    void setCatalogEntry(const std::string& key, const std::string& value) override;
    void setCatalogStructureFlag(bool marked) override;
    void attachMetadataPacket(const std::string& packet) override;

    void addPage(const std::string& content, const std::vector<StandardFont>& fonts);
    void save(const std::string& fileName, const std::string& pdfVersion);

    int getPageCount();

private:
    QPDFObjectHandle getInfo();

    QPDF m_pdf;
    QPDFObjectHandle m_info;    /**< document info dictionary, created on first use */
};
