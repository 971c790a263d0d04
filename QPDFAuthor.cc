/**
* @file
*
* Document authoring with qpdf.
*/

#include "QPDFAuthor.hh"
#include "xPDFVT.hh"
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

QPDFAuthor::QPDFAuthor()
{
    m_pdf.emptyPDF();
}

/**
* Get document info dictionary.
* Dictionary is created as indirect object and linked from trailer /Info on first use.
*/
QPDFObjectHandle QPDFAuthor::getInfo()
{
    if (!m_info.isInitialized())
    {
        auto trailer{ m_pdf.getTrailer() };
        m_info = m_pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        trailer.replaceKey("/Info", m_info);
    }
    return m_info;
}

/**
* Set document info entry.
*
* @param[in]    key     entry name without slash, e.g. "Title"
* @param[in]    value   UTF-8 value
*/
void QPDFAuthor::setInfoField(const std::string& key, const std::string& value)
{
    getInfo().replaceKey("/" + key, QPDFObjectHandle::newUnicodeString(value));
}

/**
* Set string entry in document catalog.
*
* @param[in]    key     entry name without slash, e.g. "GTS_PDFVTVersion"
* @param[in]    value   UTF-8 value
*/
void QPDFAuthor::setCatalogEntry(const std::string& key, const std::string& value)
{
    m_pdf.getRoot().replaceKey("/" + key, QPDFObjectHandle::newUnicodeString(value));
}

/**
* Set catalog /MarkInfo << /Marked marked >>.
*/
void QPDFAuthor::setCatalogStructureFlag(bool marked)
{
    auto markInfo{ QPDFObjectHandle::newDictionary() };
    markInfo.replaceKey("/Marked", QPDFObjectHandle::newBool(marked));
    m_pdf.getRoot().replaceKey("/MarkInfo", markInfo);
}

/**
* Attach XMP packet as catalog /Metadata stream.
* qpdf never compresses the document metadata stream, so the packet stays readable
* by tools that scan the file for it.
*
* @param[in]    packet  UTF-8 XMP packet
*/
void QPDFAuthor::attachMetadataPacket(const std::string& packet)
{
    auto metadata{ m_pdf.newStream(packet) };
    auto dict{ metadata.getDict() };
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/Metadata"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/XML"));
    m_pdf.getRoot().replaceKey("/Metadata", metadata);
}

/**
* Append page with given content stream.
* Page size comes from #globalOptionsFromIni.
*
* @param[in]    content     page content stream
* @param[in]    fonts       fonts used by content, added as WinAnsiEncoding standard fonts
*/
void QPDFAuthor::addPage(const std::string& content, const std::vector<StandardFont>& fonts)
{
    const auto& options{ globalOptionsFromIni };

    auto fontDict{ QPDFObjectHandle::newDictionary() };
    for (const auto& font : fonts)
    {
        auto fontObj{ QPDFObjectHandle::newDictionary() };
        fontObj.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
        fontObj.replaceKey("/Subtype", QPDFObjectHandle::newName("/Type1"));
        fontObj.replaceKey("/BaseFont", QPDFObjectHandle::newName("/" + font.baseFont));
        fontObj.replaceKey("/Encoding", QPDFObjectHandle::newName("/WinAnsiEncoding"));
        fontDict.replaceKey("/" + font.key, m_pdf.makeIndirectObject(fontObj));
    }

    auto resources{ QPDFObjectHandle::newDictionary() };
    resources.replaceKey("/Font", fontDict);

    auto mediaBox{ QPDFObjectHandle::newArray() };
    mediaBox.appendItem(QPDFObjectHandle::newInteger(0));
    mediaBox.appendItem(QPDFObjectHandle::newInteger(0));
    mediaBox.appendItem(QPDFObjectHandle::newInteger(options.pageWidth));
    mediaBox.appendItem(QPDFObjectHandle::newInteger(options.pageHeight));

    auto page{ QPDFObjectHandle::newDictionary() };
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", mediaBox);
    page.replaceKey("/Contents", m_pdf.newStream(content));
    page.replaceKey("/Resources", resources);

    QPDFPageDocumentHelper(m_pdf).addPage(QPDFPageObjectHelper(m_pdf.makeIndirectObject(page)), false);
    TRACE("%s!page=%d size=%zu\n", __func__, getPageCount(), content.size());
}

int QPDFAuthor::getPageCount()
{
    return static_cast<int>(QPDFPageDocumentHelper(m_pdf).getAllPages().size());
}

/**
* Write document in one pass.
* Compression and /ID generation come from #globalOptionsFromIni.
* Writer errors are not caught.
*
* @param[in]    fileName    output file
* @param[in]    pdfVersion  header version, e.g. "1.6"
*/
void QPDFAuthor::save(const std::string& fileName, const std::string& pdfVersion)
{
    const auto& options{ globalOptionsFromIni };
    TRACE("%s!%s version=%s\n", __func__, fileName.c_str(), pdfVersion.c_str());

    QPDFWriter w(m_pdf, fileName.c_str());
    w.setCompressStreams(options.compressStreams);
    w.setDeterministicID(options.deterministicID);
    w.forcePDFVersion(pdfVersion);
    w.write();
}
