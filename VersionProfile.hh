/**
* @file
*
* PDF/VT variant descriptions and the registry of supported variants.
*/

#pragma once
#include <string>
#include <vector>

constexpr auto PDFVT_VERSION_KEY{ "GTS_PDFVTVersion" };    /**< catalog and XMP key holding the PDF/VT marker */

/**
* Requirement on the PDF version declared by a document.
*/
class PdfVersionRule
{
public:
    /**
    * Rule kind
    */
    enum Kind
    {
        atLeast,        /**< declared version must be equal or higher than major.minor */
        exactlyEquals   /**< declared version string must be equal to the required version */
    };

    static PdfVersionRule AtLeast(int major, int minor);
    static PdfVersionRule ExactlyEquals(const std::string& version);

    bool isSatisfiedBy(const std::string& declaredVersion) const;
    std::string describe() const;

    Kind getKind() const { return m_kind; }
    int getMajor() const { return m_major; }
    int getMinor() const { return m_minor; }
    const std::string& getVersion() const { return m_version; }

    static bool parseVersion(const std::string& version, int& major, int& minor);

private:
    PdfVersionRule(Kind kind, int major, int minor, std::string version);

    Kind m_kind{ atLeast };
    int m_major{ 0 };
    int m_minor{ 0 };
    std::string m_version{ };
};

/**
* Additional XMP property written to the metadata packet.
*/
struct XmpProperty
{
    std::string prefix;         /**< namespace prefix, e.g. "pdfx6" */
    std::string namespaceURI;   /**< namespace URI bound to prefix */
    std::string name;           /**< property name without prefix */
    std::string value;          /**< property value, plain text */
};

/**
* One supported PDF/VT variant.
*/
struct VersionProfile
{
    std::string id;                             /**< short variant id, e.g. "vt1" */
    std::vector<std::string> aliases;           /**< other accepted spellings of id */
    std::string marker;                         /**< GTS_PDFVTVersion value, e.g. "PDF/VT-1" */
    std::string pdfVersion;                     /**< PDF version written by the generator */
    PdfVersionRule pdfVersionRule;              /**< declared PDF version requirement */
    std::string baseStandardName;               /**< production standard extended by this variant */
    std::vector<std::string> featureDescriptions;   /**< display only */
    std::vector<XmpProperty> extraMetadataNamespaces;  /**< extra XMP conformance properties */
};

/**
* Immutable catalog of supported variants.
* Markers are the only join key between catalog, XMP and profile,
* so markers and ids must be unique.
*/
class ProfileRegistry
{
public:
    explicit ProfileRegistry(std::vector<VersionProfile> profiles);
    ProfileRegistry(const ProfileRegistry&) = delete;
    ProfileRegistry& operator=(const ProfileRegistry&) = delete;

    static std::vector<VersionProfile> defaultProfiles();

    const VersionProfile* findByMarker(const std::string& marker) const;
    const VersionProfile* findById(const std::string& id) const;
    const VersionProfile* findByName(const std::string& name) const;

    const std::vector<VersionProfile>& profiles() const { return m_profiles; }
    const std::vector<const VersionProfile*>& fallbackOrder() const { return m_fallbackOrder; }

private:
    std::vector<VersionProfile> m_profiles;
    std::vector<const VersionProfile*> m_fallbackOrder;
};
