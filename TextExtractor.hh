/**
* @file
*
* TextExtractor class declaration.
*/

#pragma once
#include <PDFDoc.h>
#include <TextOutputDev.h>
#include <memory>
#include <string>

/**
* Class for text extraction from PDF pages.
*/
class TextExtractor
{
public:
    explicit TextExtractor();
    TextExtractor(const TextExtractor&) = delete;
    TextExtractor& operator=(const TextExtractor&) = delete;

    std::string extract(PDFDoc* doc);
    std::string extractPage(PDFDoc* doc, int page);

private:
    static void outputFunction(void* stream, const char* text, int len);
    bool createDevice();

    std::unique_ptr<TextOutputDev>  m_dev{ nullptr };   /**< text extractor */
    TextOutputControl               toc;                /**< settings for TextOutputDev */
    std::string                     m_text;             /**< UTF-8 text of current request */
};
