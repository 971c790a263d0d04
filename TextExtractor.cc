/**
* @file
*
* PDF page text extraction.
*/

#include "TextExtractor.hh"
#include "xPDFVT.hh"
#include <utility>

TextExtractor::TextExtractor()
{
    toc.mode = textOutReadingOrder;
    toc.discardInvisibleText = gTrue;
}

/**
* Callback function used in PdfDoc::displayPage to collect extracted text.
* May be called multiple times per page.
*
* @param[in,out]    stream      pointer to TextExtractor
* @param[in]        text        extracted UTF-8 text
* @param[in]        len         length of extracted text
*/
void TextExtractor::outputFunction(void* stream, const char* text, int len)
{
    auto extractor{ static_cast<TextExtractor*>(stream) };
    if (extractor && text && (len > 0))
    {
        extractor->m_text.append(text, len);
    }
}

/**
* Create TextOutputDev on first use.
* xpdf globalParams must exist, text encoding is set by #XpdfGlobals.
*/
bool TextExtractor::createDevice()
{
    if (!m_dev)
    {
        // register #outputFunction as a callback function for text extraction
        m_dev = std::make_unique<TextOutputDev>(&TextExtractor::outputFunction, this, &toc);
    }
    return m_dev->isOk();
}

/**
* Extract text of one page.
*
* @param[in]    doc     open document
* @param[in]    page    page number, starting with 1
* @return UTF-8 text, empty if page doesn't exist
*/
std::string TextExtractor::extractPage(PDFDoc* doc, int page)
{
    m_text.clear();
    if (doc && doc->isOk() && (page >= 1) && (page <= doc->getNumPages()) && createDevice())
    {
        doc->displayPage(m_dev.get(), nullptr, page, 72.0, 72.0, 0, gFalse, gTrue, gFalse);
        // release page resources
        doc->getCatalog()->doneWithPage(page);
    }
    TRACE("%s!page=%d len=%zu\n", __func__, page, m_text.size());
    return std::move(m_text);
}

/**
* Extract text of all pages.
*
* @param[in]    doc     open document
* @return UTF-8 text of all pages in page order
*/
std::string TextExtractor::extract(PDFDoc* doc)
{
    std::string text;
    if (doc && doc->isOk())
    {
        for (int page{ 1 }; page <= doc->getNumPages(); ++page)
        {
            text.append(extractPage(doc, page));
        }
    }
    return text;
}
