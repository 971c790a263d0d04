#include "PDFDocEx.hh"
#include <Catalog.h>
#include <ErrorCodes.h>
#include <Object.h>
#include <TextString.h>
#include <XRef.h>
#include "xPDFVT.hh"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <utility>
#include <vector>

/**
* Constructor
* PDFDoc takes ownership of the file name GString.
*
* @param fileName       PDF file name to open
*/
PDFDocEx::PDFDocEx(const std::string& fileName)
: PDFDoc(new GString(fileName.c_str()))
{
    TRACE("%s!%s\n", __func__, fileName.c_str());
}

/**
* Destructor, PDF file is closed by PDFDoc.
*/
PDFDocEx::~PDFDocEx()
{
    TRACE("%s\n", __func__);
}

/**
* Get document info from Document Info Directory.
* If there is no Document Info Directory (deprecated in PDF2.0),
* get info from XMP metadata.
*
* @param[in]    key     "Title", "Subject", "Keywords", "Author", "Creator" or "Producer"
*
* @return pointer to allocated GString, needs to be deleted/released after usage.
*/
GString* PDFDocEx::getMetadataString(const char* key)
{
    std::unique_ptr<GString> ret{ nullptr };
    Object objDocInfo;
    if (getDocInfo(&objDocInfo)->isDict())
    {
        Object obj;
        if (objDocInfo.dictLookup(key, &obj)->isString())
        {
            ret.reset(TextString(obj.getString()).toUTF8());
        }
        obj.free();
    }
    objDocInfo.free();

    if (!ret || (ret->getLength() == 0))
    {
        // in PDF2.0 Document information dictionary is deprecated
        // and document info is stored in XMP metadata
        if (!strcmp(key, "Title"))
        {
            ret.reset(getXmpValue(R"(http://purl.org/dc/elements/1.1/)", "title", "rdf:Alt"));
        }
        else if (!strcmp(key, "Subject"))
        {
            ret.reset(getXmpValue(R"(http://purl.org/dc/elements/1.1/)", "description", "rdf:Alt"));
        }
        else if (!strcmp(key, "Keywords"))
        {
            ret.reset(getXmpValue(R"(http://ns.adobe.com/pdf/1.3/)", "Keywords", nullptr));
        }
        else if (!strcmp(key, "Author"))
        {
            ret.reset(getXmpValue(R"(http://purl.org/dc/elements/1.1/)", "creator", "rdf:Seq"));
        }
        else if (!strcmp(key, "Creator"))
        {
            ret.reset(getXmpValue(R"(http://ns.adobe.com/xap/1.0/)", "CreatorTool", nullptr));
        }
        else if (!strcmp(key, "Producer"))
        {
            ret.reset(getXmpValue(R"(http://ns.adobe.com/pdf/1.3/)", "Producer", nullptr));
        }
    }
    return ret.release();
}

/**
* PDF version.
* Compare PDF file version and Version in the Catalog and return higher version.
*
* @return PDF version
*/
double PDFDocEx::getPDFVersion()
{
    auto ver{ PDFDoc::getPDFVersion() };
    Object catObj;
    if (getXRef()->getCatalog(&catObj)->isDict())
    {
        Object objVer;
        if (catObj.dictLookup("Version", &objVer)->isName())
        {
            auto pdfVer{ strtod(objVer.getName(), nullptr) };
            if (pdfVer > ver)
            {
                ver = pdfVer;
            }
        }
        objVer.free();
    }
    catObj.free();
    return ver;
}

/**
* Convert PDF version number to "major.minor" string.
* PDF versions have one digit minor version, 1.7 is 17 tenths.
*
* @param[in]    version     version from PDF header, e.g. 1.6
* @return version string, e.g. "1.6"
*/
std::string PDFDocEx::formatPDFVersion(double version)
{
    const auto tenths{ std::lround(version * 10.0) };
    return std::to_string(tenths / 10) + '.' + std::to_string(tenths % 10);
}

/**
* Declared PDF version, from the file header or the catalog /Version.
*
* @return version string, e.g. "1.6" or "2.0"
*/
std::string PDFDocEx::getDeclaredVersion()
{
    return formatPDFVersion(getPDFVersion());
}

/**
* String value from the document catalog.
* Text string is decoded from PDFDocEncoding or UTF-16 to UTF-8.
*
* @param[in]    key     catalog key without leading slash, e.g. "GTS_PDFVTVersion"
* @return value, or empty if key is missing or not a string
*/
std::optional<std::string> PDFDocEx::getCatalogEntry(const char* key)
{
    std::optional<std::string> ret;
    Object catObj;
    if (getXRef()->getCatalog(&catObj)->isDict())
    {
        Object obj;
        if (catObj.dictLookup(key, &obj)->isString())
        {
            std::unique_ptr<GString> value{ TextString(obj.getString()).toUTF8() };
            if (value)
            {
                ret.emplace(value->getCString(), value->getLength());
            }
        }
        else
        {
            TRACE("%s!no /%s string\n", __func__, key);
        }
        obj.free();
    }
    catObj.free();
    return ret;
}

/**
* From Portable document format - Part 1: PDF 1.7
* 14.7.1 "Marked (Boolean) A flag indicating whether the document conforms to Tagged PDF conventions."
*
* @return /MarkInfo /Marked value, or empty if there is no MarkInfo dictionary or no Marked boolean
*/
std::optional<bool> PDFDocEx::getCatalogStructureFlag()
{
    std::optional<bool> ret;
    Object catObj;
    if (getXRef()->getCatalog(&catObj)->isDict())
    {
        Object markInfo;
        if (catObj.dictLookup("MarkInfo", &markInfo)->isDict())
        {
            Object marked;
            if (markInfo.dictLookup("Marked", &marked)->isBool())
            {
                ret = marked.getBool() ? true : false;
            }
            marked.free();
        }
        else
        {
            TRACE("%s!no /MarkInfo\n", __func__);
        }
        markInfo.free();
    }
    catObj.free();
    return ret;
}

/**
* Raw XMP metadata stream referenced from the catalog.
*
* @return metadata bytes, or empty if there is no /Metadata stream
*/
std::optional<std::string> PDFDocEx::getMetadataPacket()
{
    std::optional<std::string> ret;
    const auto cat{ getCatalog() };
    if (cat)
    {
        std::unique_ptr<GString> metadata{ cat->readMetadata() };
        if (metadata)
        {
            ret.emplace(metadata->getCString(), metadata->getLength());
        }
    }
    return ret;
}

/**
* Conformance summary as string.
*/
std::string PDFDocEx::getConformanceSummary()
{
    std::unique_ptr<GString> conformance{ getConformance() };
    return conformance ? std::string(conformance->getCString(), conformance->getLength()) : std::string();
}

/**
* Open PDF XMP metadata.
* Parsed XMP metadata is stored in #m_xmp.
*
* @return true - xmp is ready to be consumed, false - no XMP metadata or error
*/
bool PDFDocEx::openXMP()
{
    if (m_xmp)
        return true;

    if (!m_xmpChecked)
    {
        m_xmpChecked = true;
        const auto cat{ getCatalog() };
        std::unique_ptr<GString> metadata{ cat ? cat->readMetadata() : nullptr };
        if (metadata && metadata->getLength())
        {
            m_xmp.reset(ZxDoc::loadMem(metadata->getCString(), metadata->getLength()));
            if (m_xmp)
            {
                return true;
            }
            TRACE("%s!XMP parse error\n", __func__);
        }
    }
    return false;
}

/**
* Get rdf:RDF element of XMP metadata.
*
* @return rdf:RDF element or nullptr if XMP is missing or malformed
*/
ZxElement* PDFDocEx::getXmpRDF()
{
    if (!openXMP())
    {
        return nullptr;
    }
    auto root{ m_xmp->getRoot() };
    if (root && root->isElement("x:xmpmeta"))
    {
        root = root->findFirstChildElement("rdf:RDF");
    }
    return (root && root->isElement("rdf:RDF")) ? root : nullptr;
}

/**
* Search for XMP element attribute or child element.
*
* @param[in]    elem            pointer to XMP element
* @param[in]    entry           attribute or child element name
* @param[out]   value           append attribute value or child element value to this parameter
* @param[in]    prefix          prefix to append before value
*
* @return true - attribute or child element found, false - not found
*/
bool PDFDocEx::getElemOrAttrData(ZxElement* elem, const char* entry, GString& value, const char* prefix)
{
    const auto attr{ elem->findAttr(entry) };
    if (attr)
    {
        value.append(prefix)->append(attr->getValue());
        return true;
    }
    const auto child{ elem->findFirstChildElement(entry) };
    if (child)
    {
        const auto node{ child->getFirstChild() };
        if (node && node->isCharData())
        {
            auto data{ static_cast<ZxCharData*>(node)->getData() };
            if (data)
            {
                // trim spaces to check if this is really element data or just indendation
                auto ptr{ data->getCString() };
                auto endptr{ ptr + data->getLength() };
                while ((ptr < endptr) && isspace(static_cast<unsigned char>(*ptr)))
                {
                    ptr++;
                }
                while ((endptr > ptr) && isspace(static_cast<unsigned char>(*(endptr - 1))))
                {
                    endptr--;
                }
                if (ptr < endptr)
                {
                    value.append(prefix)->append(ptr, static_cast<int>(endptr - ptr));
                    return true;
                }
            }
        }
    }
    return false;
}

/**
* XMP conformance properties reported by #getConformance.
*/
static constexpr struct
{
    const char* nsURI;      /**< namespace URI */
    const char* property;   /**< property name without prefix */
    const char* prefix;     /**< text prepended to property value */
} conformanceProperties[] =
{
    { R"(http://www.npes.org/pdfx/ns/id/)", "GTS_PDFXVersion", "" },        // PDF/X
    { R"(http://www.npes.org/pdfx6/ns/id/)", "GTS_PDFXConformance", "" },   // PDF/X-6
    { R"(http://www.npes.org/pdfvt/ns/id/)", "GTS_PDFVTVersion", "" },      // PDF/VT
    { R"(http://ns.adobe.com/pdfx/1.3/)", "GTS_PDFVTVersion", "" },         // PDF/VT, non-standard
};

/**
* Get PDF/X and PDF/VT conformance values from XMP metadata.
* Values are separated with ';', repeated values are reported once.
*
* @return pointer to allocated GString, needs to be deleted/released after usage.
*/
GString* PDFDocEx::getConformance()
{
    auto conformance{ std::make_unique<GString>() };
    std::vector<std::string> seen;
    const auto rdf{ getXmpRDF() };
    if (rdf)
    {
        for (auto node{ rdf->getFirstChild() }; node; node = node->getNextChild())
        {
            if (node->isElement("rdf:Description"))
            {
                const auto elem{ static_cast<ZxElement*>(node) };
                for (const auto& entry : conformanceProperties)
                {
                    const auto ns{ findXmpPrefix(elem, entry.nsURI) };
                    if (!ns)
                    {
                        continue;
                    }
                    GString nodeName(ns);
                    nodeName.append(':')->append(entry.property);
                    GString value;
                    if (getElemOrAttrData(elem, nodeName.getCString(), value, entry.prefix))
                    {
                        std::string item{ value.getCString(), static_cast<size_t>(value.getLength()) };
                        if (std::find(seen.begin(), seen.end(), item) != seen.end())
                        {
                            continue;
                        }
                        seen.push_back(std::move(item));
                        if (conformance->getLength())
                        {
                            conformance->append(';');
                        }
                        conformance->append(&value);
                    }
                }
            }
        }
    }
    return conformance.release();
}

/**
* Find XMP prefix name for nsURI.
* XMP namespace prefixes should be standardized, e.g.:
* xmlns:xmp="http://ns.adobe.com/xap/1.0/", but there is also xmlns:xap="http://ns.adobe.com/xap/1.0/"
*
* @return prefix for the selected namespace URI, or nullptr if not found
*/
const char* PDFDocEx::findXmpPrefix(ZxElement* elem, const char* nsURI)
{
    for (auto attr{ elem->getFirstAttr() }; attr; attr = attr->getNextAttr())
    {
        if (attr->getValue()->cmp(nsURI) == 0)
        {
            auto attrName{ attr->getName() };
            auto ptr{ strchr(attrName->getCString(), ':') };
            if (ptr)
            {
                // it is possible to return pointer to attribute name,
                // because XMP content is stored in m_xmp and not modified
                return ptr + 1;
            }
        }
    }
    return nullptr;
}

/**
* Get value from XMP metadata.
*
* @param[in]    nsURI       XMP namespace URI
* @param[in]    key         XMP node name (element or attribute) without namespace prefix
* @param[in]    arrayType   type of ordered array (rdf:Alt rdf:Bag or rdf:Seq) or nullptr if node is not an array
*
* @return pointer to allocated GString, needs to be deleted/released after usage.
*/
GString* PDFDocEx::getXmpValue(const char* nsURI, const char* key, const char* arrayType)
{
    const auto rdf{ getXmpRDF() };
    if (rdf)
    {
        for (auto node{ rdf->getFirstChild() }; node; node = node->getNextChild())
        {
            if (node->isElement("rdf:Description"))
            {
                const auto elem{ static_cast<ZxElement*>(node) };
                const auto ns{ findXmpPrefix(elem, nsURI) };
                if (ns)
                {
                    GString nodeName(ns);
                    auto value{ std::make_unique<GString>() };
                    nodeName.append(':')->append(key);
                    if (getElemOrAttrData(elem, nodeName.getCString(), *value, ""))
                    {
                        return value.release();
                    }
                    if (arrayType)
                    {
                        auto child{ elem->findFirstChildElement(nodeName.getCString()) };
                        if (child)
                        {
                            auto arr{ child->findFirstChildElement(arrayType) };
                            if (arr && getElemOrAttrData(arr, "rdf:li", *value, ""))
                            {
                                return value.release();
                            }
                        }
                    }
                }
            }
        }
    }
    return nullptr;
}

/**
* Readable description of xpdf error codes.
*
* @param[in]    errorCode   PDFDoc::getErrorCode() value
*/
const char* PDFReaderEx::describeError(int errorCode)
{
    switch (errorCode)
    {
    case errNone:
        return "no error";
    case errOpenFile:
        return "couldn't open the PDF file";
    case errBadCatalog:
        return "couldn't read the page catalog";
    case errDamaged:
        return "PDF file was damaged and couldn't be repaired";
    case errEncrypted:
        return "file was encrypted and password was incorrect or not supplied";
    case errFileIO:
        return "file I/O error";
    default:
        return "unknown error";
    }
}

/**
* Open PDF document.
*
* @param[in]    fileName    path to PDF document
* @return open document, closed when released
* @throw FileNotFoundError if file doesn't exist
* @throw DocumentError if xpdf cannot read the document
*/
std::unique_ptr<ReadableDocument> PDFReaderEx::open(const std::string& fileName)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(fileName, ec))
    {
        TRACE("%s!not found %s\n", __func__, fileName.c_str());
        throw FileNotFoundError(fileName);
    }

    auto doc{ std::make_unique<PDFDocEx>(fileName) };
    if (!doc->isOk())
    {
        const auto errorCode{ doc->getErrorCode() };
        TRACE("%s!%s error=%d\n", __func__, fileName.c_str(), errorCode);
        throw DocumentError(describeError(errorCode), errorCode);
    }
    return doc;
}
