/**
* @file
*
* Interfaces of the document reading and authoring collaborators
* and the errors they report.
*/

#pragma once
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

/**
* Document to be checked does not exist.
* This is the only error #ComplianceChecker lets through.
*/
class FileNotFoundError : public std::runtime_error
{
public:
    explicit FileNotFoundError(const std::string& fileName)
    : std::runtime_error("PDF file not found: " + fileName), m_fileName(fileName) { }
    const std::string& getFileName() const { return m_fileName; }

private:
    std::string m_fileName;
};

/**
* Document exists, but cannot be read as a PDF.
*/
class DocumentError : public std::runtime_error
{
public:
    DocumentError(const std::string& message, int errorCode)
    : std::runtime_error(message), m_errorCode(errorCode) { }
    int getErrorCode() const { return m_errorCode; }

private:
    int m_errorCode{ 0 };
};

/**
* Read access to one open document.
* Document is closed when the object is destroyed.
*/
class ReadableDocument
{
public:
    virtual ~ReadableDocument() = default;

    /** @return declared PDF version as "major.minor" */
    virtual std::string getDeclaredVersion() = 0;
    /** @return catalog string value, or empty if key is missing or not a string */
    virtual std::optional<std::string> getCatalogEntry(const char* key) = 0;
    /** @return MarkInfo /Marked value, or empty if missing */
    virtual std::optional<bool> getCatalogStructureFlag() = 0;
    /** @return raw XMP metadata packet, or empty if document has none */
    virtual std::optional<std::string> getMetadataPacket() = 0;
    /** @return XMP conformance summary, e.g. "PDF/X-4;PDF/VT-1", empty if none */
    virtual std::string getConformanceSummary() { return {}; }
};

/**
* Opens documents for reading.
*/
class DocumentReader
{
public:
    virtual ~DocumentReader() = default;

    /**
    * @throw FileNotFoundError if fileName doesn't exist
    * @throw DocumentError if fileName is not a readable PDF
    */
    virtual std::unique_ptr<ReadableDocument> open(const std::string& fileName) = 0;
};

/**
* Write access to a document being authored.
* Nothing is persisted until the owner finalizes the document.
*/
class DocumentSink
{
public:
    virtual ~DocumentSink() = default;

    virtual void setInfoField(const std::string& key, const std::string& value) = 0;
    virtual void setCatalogEntry(const std::string& key, const std::string& value) = 0;
    virtual void setCatalogStructureFlag(bool marked) = 0;
    virtual void attachMetadataPacket(const std::string& packet) = 0;
};
