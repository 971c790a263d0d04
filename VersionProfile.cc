/**
* @file
*
* PDF/VT variant descriptions.
*
* PDF/VT-1 (ISO 16612-2) extends PDF/X-4 and needs PDF 1.6 or higher.
* PDF/VT-3 (ISO 16612-3) extends PDF/X-6 and needs exactly PDF 2.0.
*/

#include "VersionProfile.hh"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <numeric>
#include <stdexcept>
#include <utility>

PdfVersionRule::PdfVersionRule(Kind kind, int major, int minor, std::string version)
: m_kind(kind), m_major(major), m_minor(minor), m_version(std::move(version))
{
}

/**
* Declared version must be major.minor or higher.
* A higher major version always satisfies the rule.
*/
PdfVersionRule PdfVersionRule::AtLeast(int major, int minor)
{
    return PdfVersionRule(atLeast, major, minor, std::to_string(major) + '.' + std::to_string(minor));
}

/**
* Declared version must be equal to version, higher versions fail.
*/
PdfVersionRule PdfVersionRule::ExactlyEquals(const std::string& version)
{
    int major{ 0 };
    int minor{ 0 };
    if (!parseVersion(version, major, minor))
    {
        major = 0;
        minor = 0;
    }
    return PdfVersionRule(exactlyEquals, major, minor, version);
}

/**
* Split "major.minor" version string.
*
* @param[in]    version     version string, e.g. "1.6"
* @param[out]   major       major version
* @param[out]   minor       minor version
*
* @return true if both parts are decimal numbers
*/
bool PdfVersionRule::parseVersion(const std::string& version, int& major, int& minor)
{
    const auto dot{ version.find('.') };
    if ((dot == std::string::npos) || (dot == 0) || (dot + 1 == version.size()))
    {
        return false;
    }
    const auto begin{ version.data() };
    const auto end{ begin + version.size() };
    const auto convMajor{ std::from_chars(begin, begin + dot, major) };
    if ((convMajor.ec != std::errc()) || (convMajor.ptr != begin + dot))
    {
        return false;
    }
    const auto convMinor{ std::from_chars(begin + dot + 1, end, minor) };
    return (convMinor.ec == std::errc()) && (convMinor.ptr == end);
}

/**
* Check declared document version against this rule.
*
* @param[in]    declaredVersion     "major.minor" version from the document
*
* @return true if declaredVersion meets the requirement
*/
bool PdfVersionRule::isSatisfiedBy(const std::string& declaredVersion) const
{
    if (m_kind == exactlyEquals)
    {
        return declaredVersion == m_version;
    }

    int major{ 0 };
    int minor{ 0 };
    if (!parseVersion(declaredVersion, major, minor))
    {
        return false;
    }
    return (major > m_major) || ((major == m_major) && (minor >= m_minor));
}

/**
* Human readable requirement, e.g. "PDF 1.6+" or "PDF 2.0".
*/
std::string PdfVersionRule::describe() const
{
    return (m_kind == atLeast) ? "PDF " + m_version + "+" : "PDF " + m_version;
}

/**
* Create registry and compute marker fallback order.
*
* @param[in]    profiles    supported variants
* @throw std::invalid_argument on empty or duplicate marker or id
*/
ProfileRegistry::ProfileRegistry(std::vector<VersionProfile> profiles)
: m_profiles(std::move(profiles))
{
    for (size_t i{ 0 }; i < m_profiles.size(); i++)
    {
        const auto& profile{ m_profiles[i] };
        if (profile.marker.empty() || profile.id.empty())
        {
            throw std::invalid_argument("PDF/VT profile without marker or id");
        }
        for (size_t j{ 0 }; j < i; j++)
        {
            if (m_profiles[j].marker == profile.marker)
            {
                throw std::invalid_argument("duplicate PDF/VT marker: " + profile.marker);
            }
            if (m_profiles[j].id == profile.id)
            {
                throw std::invalid_argument("duplicate PDF/VT profile id: " + profile.id);
            }
        }
    }

    // Most specific marker first. A marker that contains another marker is always longer,
    // so longer markers go first; equal lengths prefer the most recently registered variant.
    std::vector<size_t> order(m_profiles.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b)
        {
            const auto lenA{ m_profiles[a].marker.size() };
            const auto lenB{ m_profiles[b].marker.size() };
            if (lenA != lenB)
            {
                return lenA > lenB;
            }
            return a > b;
        });
    for (const auto i : order)
    {
        m_fallbackOrder.push_back(&m_profiles[i]);
    }
}

/**
* Built-in PDF/VT-1 and PDF/VT-3 variants.
*/
std::vector<VersionProfile> ProfileRegistry::defaultProfiles()
{
    return
    {
        {
            "vt1", { "1", "pdfvt1", "pdf/vt-1" },
            "PDF/VT-1", "1.6", PdfVersionRule::AtLeast(1, 6), "PDF/X-4",
            {
                "Document Part Metadata (DPM) for tracking individual records",
                "Efficient reuse of common resources across pages",
                "Support for encapsulated external content",
                "Optimized for high-speed variable data printing",
                "Built on PDF/X-4 foundation for print production",
                "Uses PDF 1.6 with transparency and layers support"
            },
            { }
        },
        {
            "vt3", { "3", "pdfvt3", "pdf/vt-3" },
            "PDF/VT-3", "2.0", PdfVersionRule::ExactlyEquals("2.0"), "PDF/X-6",
            {
                "Document Part Metadata (DPM) for tracking individual records",
                "Efficient reuse of common resources across pages",
                "Simplified transparency rules (page-level only)",
                "Per-page Output Intents with optional CxF/X-4 spectral data",
                "Enhanced Black Point Compensation support",
                "Built on PDF/X-6 foundation (PDF 2.0)",
                "Modern toolchain alignment for VDP workflows"
            },
            {
                { "pdf", "http://ns.adobe.com/pdf/1.3/", "PDFVersion", "2.0" },
                { "pdfx6", "http://www.npes.org/pdfx6/ns/id/", "GTS_PDFXConformance", "PDF/X-6" }
            }
        }
    };
}

/**
* @return profile with exactly this marker, or nullptr if none
*/
const VersionProfile* ProfileRegistry::findByMarker(const std::string& marker) const
{
    for (const auto& profile : m_profiles)
    {
        if (profile.marker == marker)
        {
            return &profile;
        }
    }
    return nullptr;
}

/**
* @return profile with this id, or nullptr if none
*/
const VersionProfile* ProfileRegistry::findById(const std::string& id) const
{
    for (const auto& profile : m_profiles)
    {
        if (profile.id == id)
        {
            return &profile;
        }
    }
    return nullptr;
}

/**
* Find profile by id or alias, case-insensitive.
*
* @param[in]    name    e.g. "vt1", "VT3" or "3"
* @return profile, or nullptr if none matches
*/
const VersionProfile* ProfileRegistry::findByName(const std::string& name) const
{
    const auto equalNoCase = [](const std::string& a, const std::string& b)
    {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) { return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y)); });
    };

    for (const auto& profile : m_profiles)
    {
        if (equalNoCase(profile.id, name))
        {
            return &profile;
        }
        for (const auto& alias : profile.aliases)
        {
            if (equalNoCase(alias, name))
            {
                return &profile;
            }
        }
    }
    return nullptr;
}
