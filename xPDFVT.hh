/**
* @file
*
* Declaration of options, trace macro and xpdf global state used by xPDFVT.
*/

#pragma once
#include <string>

/**
* Options from ini file.
*/
typedef struct options_s
{
    bool compressStreams{ true };       /**< compress page content streams, XMP packet is never compressed */
    bool deterministicID{ false };      /**< generate file /ID from document content instead of time and file name */
    bool xpdfQuiet{ true };             /**< suppress xpdf error messages while reading documents */
    int pageWidth{ 595 };               /**< page width in points, default A4 */
    int pageHeight{ 842 };              /**< page height in points, default A4 */
    int margin{ 50 };                   /**< page margin in points, used on all four sides */
    std::string author{ "PDFVT Generator" };    /**< Author written to document info and dc:creator */
    std::string creator{ "xPDFVT" };            /**< Creator written to document info and xmp:CreatorTool */
    std::string producer{ "xPDFVT with qpdf" }; /**< Producer written to document info and pdf:Producer */
    std::string xpdfrc{ };              /**< xpdfrc file passed to xpdf GlobalParams, empty for defaults */
} options_t;

extern options_t globalOptionsFromIni;

bool loadOptions(const char* iniFileName);

/**
* RAII owner of xpdf globalParams.
* xpdf requires globalParams to exist while any PDFDoc is alive.
* Only the outermost instance creates and deletes globalParams.
*/
class XpdfGlobals
{
public:
    explicit XpdfGlobals();
    XpdfGlobals(const XpdfGlobals&) = delete;
    XpdfGlobals& operator=(const XpdfGlobals&) = delete;
    ~XpdfGlobals();

private:
    bool m_owner{ false };
};

#ifdef _DEBUG
extern bool _trace(const char *format, ...);
#define TRACE _trace
#else
#define TRACE(...) ((void)0)
#endif
