/**
* @file
*
* xPDFVT tests: profiles, version rules, metadata stamping, compliance checking
* and documents written with qpdf and read back with xpdf.
*/

#include "ComplianceChecker.hh"
#include "DocumentGenerator.hh"
#include "MetadataWriter.hh"
#include "PDFDocEx.hh"
#include "PageLayout.hh"
#include "QPDFAuthor.hh"
#include "TextExtractor.hh"
#include "VersionProfile.hh"
#include "xPDFVT.hh"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_tests_run = 0;
static int g_tests_passed = 0;

static void expect(bool condition, const std::string& message)
{
    if (!condition)
    {
        std::cerr << "FAIL: " << message << "\n";
        std::exit(1);
    }
}

static void run_test(const std::string& name, void (*fn)())
{
    std::cout << "  " << name << "...";
    fn();
    std::cout << " PASSED\n";
    g_tests_run++;
    g_tests_passed++;
}

static bool contains(const std::string& text, const std::string& part)
{
    return text.find(part) != std::string::npos;
}

static bool hasIssue(const ComplianceResult& result, const std::string& issue)
{
    for (const auto& item : result.issues)
    {
        if (item == issue)
        {
            return true;
        }
    }
    return false;
}

static size_t countOf(const std::string& text, const std::string& part)
{
    size_t count{ 0 };
    for (auto pos{ text.find(part) }; pos != std::string::npos; pos = text.find(part, pos + part.size()))
    {
        ++count;
    }
    return count;
}

static fs::path testDir()
{
    const auto dir{ fs::temp_directory_path() / "xpdfvt_tests" };
    fs::create_directories(dir);
    return dir;
}

static VersionProfile makeProfile(const std::string& id, const std::string& marker, PdfVersionRule rule)
{
    return { id, { }, marker, "1.6", rule, "PDF/X-4", { "feature" }, { } };
}

/**
* Records everything written by MetadataWriter.
*/
class RecordingSink : public DocumentSink
{
public:
    void setInfoField(const std::string& key, const std::string& value) override
    {
        info[key] = value;
        calls.push_back("info:" + key);
    }
    void setCatalogEntry(const std::string& key, const std::string& value) override
    {
        catalog[key] = value;
        calls.push_back("catalog:" + key);
    }
    void setCatalogStructureFlag(bool value) override
    {
        marked = value;
        calls.push_back("markinfo");
    }
    void attachMetadataPacket(const std::string& value) override
    {
        if (failOnPacket)
        {
            throw std::runtime_error("disk full");
        }
        packet = value;
        calls.push_back("metadata");
    }

    std::map<std::string, std::string> info;
    std::map<std::string, std::string> catalog;
    bool marked{ false };
    std::string packet;
    std::vector<std::string> calls;
    bool failOnPacket{ false };
};

/**
* In-memory document for ComplianceChecker tests.
*/
class FakeDocument : public ReadableDocument
{
public:
    ~FakeDocument() override
    {
        if (closed)
        {
            ++*closed;
        }
    }

    std::string getDeclaredVersion() override
    {
        if (failOnRead)
        {
            throw DocumentError("couldn't read the page catalog", 3);
        }
        return version;
    }
    std::optional<std::string> getCatalogEntry(const char* key) override
    {
        return (std::string(key) == PDFVT_VERSION_KEY) ? catalogMarker : std::nullopt;
    }
    std::optional<bool> getCatalogStructureFlag() override { return marked; }
    std::optional<std::string> getMetadataPacket() override { return packet; }

    std::string version{ "1.6" };
    std::optional<std::string> catalogMarker;
    std::optional<bool> marked;
    std::optional<std::string> packet;
    bool failOnRead{ false };
    int* closed{ nullptr };
};

class FakeReader : public DocumentReader
{
public:
    std::unique_ptr<ReadableDocument> open(const std::string& fileName) override
    {
        if (!exists)
        {
            throw FileNotFoundError(fileName);
        }
        if (corrupt)
        {
            throw DocumentError("PDF file was damaged and couldn't be repaired", 3);
        }
        auto doc{ std::make_unique<FakeDocument>(document) };
        doc->closed = &closed;
        return doc;
    }

    FakeDocument document;
    bool exists{ true };
    bool corrupt{ false };
    int closed{ 0 };
};

static std::string packetWith(const std::string& marker)
{
    return "<x:xmpmeta><rdf:RDF><rdf:Description><pdfvtid:GTS_PDFVTVersion>" + marker
        + "</pdfvtid:GTS_PDFVTVersion></rdf:Description></rdf:RDF></x:xmpmeta>";
}

/** Fully stamped VT document in memory. */
static void setCompliant(FakeReader& reader, const std::string& marker, const std::string& version)
{
    reader.document.version = version;
    reader.document.catalogMarker = marker;
    reader.document.marked = true;
    reader.document.packet = packetWith(marker);
}

// ============================================================================
// Profile registry
// ============================================================================

static void test_default_profiles()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    expect(registry.profiles().size() == 2, "two built-in profiles");

    const auto vt1{ registry.findByMarker("PDF/VT-1") };
    expect(vt1 && (vt1->id == "vt1"), "PDF/VT-1 marker resolves to vt1");
    expect(vt1->pdfVersion == "1.6", "vt1 writes PDF 1.6");
    expect(vt1->baseStandardName == "PDF/X-4", "vt1 extends PDF/X-4");
    expect(vt1->featureDescriptions.size() == 6, "vt1 has six features");
    expect(vt1->extraMetadataNamespaces.empty(), "vt1 has no extra XMP properties");

    const auto vt3{ registry.findByMarker("PDF/VT-3") };
    expect(vt3 && (vt3->id == "vt3"), "PDF/VT-3 marker resolves to vt3");
    expect(vt3->pdfVersion == "2.0", "vt3 writes PDF 2.0");
    expect(vt3->baseStandardName == "PDF/X-6", "vt3 extends PDF/X-6");
    expect(vt3->featureDescriptions.size() == 7, "vt3 has seven features");
    expect(vt3->extraMetadataNamespaces.size() == 2, "vt3 has two extra XMP properties");

    expect(!registry.findByMarker("PDF/VT-2"), "PDF/VT-2 is not supported");
    expect(!registry.findByMarker("pdf/vt-1"), "marker lookup is case-sensitive");
}

static void test_find_by_name()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    expect(registry.findByName("vt1") == registry.findById("vt1"), "vt1 by id");
    expect(registry.findByName("VT3") == registry.findById("vt3"), "id is case-insensitive");
    expect(registry.findByName("1") == registry.findById("vt1"), "alias 1");
    expect(registry.findByName("3") == registry.findById("vt3"), "alias 3");
    expect(registry.findByName("PDF/VT-3") == registry.findById("vt3"), "marker spelling alias");
    expect(!registry.findByName("vt2"), "vt2 unknown");
    expect(!registry.findByName(""), "empty name unknown");
}

static void test_registry_rejects_duplicates()
{
    auto threw{ false };
    try
    {
        const ProfileRegistry registry{ { makeProfile("a", "M", PdfVersionRule::AtLeast(1, 6)),
                                          makeProfile("b", "M", PdfVersionRule::AtLeast(1, 6)) } };
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    expect(threw, "duplicate marker rejected");

    threw = false;
    try
    {
        const ProfileRegistry registry{ { makeProfile("a", "M1", PdfVersionRule::AtLeast(1, 6)),
                                          makeProfile("a", "M2", PdfVersionRule::AtLeast(1, 6)) } };
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    expect(threw, "duplicate id rejected");

    threw = false;
    try
    {
        const ProfileRegistry registry{ { makeProfile("a", "", PdfVersionRule::AtLeast(1, 6)) } };
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    expect(threw, "empty marker rejected");
}

static void test_fallback_order()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    const auto& order{ registry.fallbackOrder() };
    expect(order.size() == 2, "fallback order has every profile");
    expect(order[0]->id == "vt3", "later variant of equal marker length first");
    expect(order[1]->id == "vt1", "vt1 last");

    const ProfileRegistry nested{ { makeProfile("long", "X-1.2", PdfVersionRule::AtLeast(1, 6)),
                                    makeProfile("short", "X-1", PdfVersionRule::AtLeast(1, 6)) } };
    expect(nested.fallbackOrder()[0]->id == "long", "containing marker first, even when registered first");

    const ProfileRegistry nested2{ { makeProfile("short", "X-1", PdfVersionRule::AtLeast(1, 6)),
                                     makeProfile("long", "X-1.2", PdfVersionRule::AtLeast(1, 6)) } };
    expect(nested2.fallbackOrder()[0]->id == "long", "containing marker first, registered last");
}

// ============================================================================
// Version rules
// ============================================================================

static void test_at_least_rule()
{
    const auto rule{ PdfVersionRule::AtLeast(1, 6) };
    expect(!rule.isSatisfiedBy("1.5"), "1.5 < 1.6");
    expect(rule.isSatisfiedBy("1.6"), "1.6 satisfies 1.6+");
    expect(rule.isSatisfiedBy("1.7"), "1.7 satisfies 1.6+");
    expect(rule.isSatisfiedBy("2.0"), "higher major always satisfies");
    expect(rule.isSatisfiedBy("1.10"), "minor compared as number");
    expect(!rule.isSatisfiedBy("0.9"), "0.9 < 1.6");
    expect(!rule.isSatisfiedBy("abc"), "unparseable version fails");
    expect(!rule.isSatisfiedBy(""), "empty version fails");
    expect(rule.describe() == "PDF 1.6+", "describe AtLeast");
    expect(rule.getKind() == PdfVersionRule::atLeast, "kind atLeast");
}

static void test_exactly_equals_rule()
{
    const auto rule{ PdfVersionRule::ExactlyEquals("2.0") };
    expect(rule.isSatisfiedBy("2.0"), "2.0 equals 2.0");
    expect(!rule.isSatisfiedBy("2.1"), "higher version fails");
    expect(!rule.isSatisfiedBy("1.6"), "lower version fails");
    expect(!rule.isSatisfiedBy("2"), "string comparison, 2 is not 2.0");
    expect(rule.describe() == "PDF 2.0", "describe ExactlyEquals");
    expect((rule.getMajor() == 2) && (rule.getMinor() == 0), "parsed required version");

    int major{ -1 };
    int minor{ -1 };
    expect(PdfVersionRule::parseVersion("1.7", major, minor) && (major == 1) && (minor == 7), "parse 1.7");
    expect(!PdfVersionRule::parseVersion("1.", major, minor), "missing minor");
    expect(!PdfVersionRule::parseVersion(".7", major, minor), "missing major");
    expect(!PdfVersionRule::parseVersion("1.7a", major, minor), "trailing garbage");
}

// ============================================================================
// MetadataWriter
// ============================================================================

static void test_stamp_vt1()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    const auto& vt1{ *registry.findById("vt1") };
    RecordingSink sink;
    const MetadataWriter writer{};
    writer.stamp(vt1, sink, "2024-05-01T10:20:30Z");

    expect(sink.info["Title"] == "PDF/VT-1 Sample Document", "title");
    expect(sink.info["Author"] == globalOptionsFromIni.author, "author from options");
    expect(sink.info["Subject"] == "Sample PDF/VT-1 document with text and image", "subject");
    expect(sink.info["Keywords"] == "PDF/VT-1, Variable Data, Transactional Printing", "keywords");
    expect(sink.info["CreationDate"] == "D:20240501102030Z", "creation date in PDF format");
    expect(sink.catalog[PDFVT_VERSION_KEY] == "PDF/VT-1", "catalog marker verbatim");
    expect(sink.marked, "MarkInfo /Marked true");

    expect(contains(sink.packet, "<pdfvtid:GTS_PDFVTVersion>PDF/VT-1</pdfvtid:GTS_PDFVTVersion>"), "pdfvtid marker");
    expect(contains(sink.packet, "<pdfx:GTS_PDFVTVersion>PDF/VT-1</pdfx:GTS_PDFVTVersion>"), "pdfx marker");
    expect(contains(sink.packet, "<pdfxid:GTS_PDFXVersion>PDF/X-4</pdfxid:GTS_PDFXVersion>"), "base standard");
    expect(contains(sink.packet, "<xmp:CreateDate>2024-05-01T10:20:30Z</xmp:CreateDate>"), "XMP date");
    expect(!contains(sink.packet, "pdfx6"), "no PDF/X-6 namespace for vt1");
    expect(sink.packet.rfind("<?xpacket end=\"w\"?>") != std::string::npos, "packet trailer");

    expect(!sink.calls.empty() && (sink.calls.back() == "metadata"), "packet attached last");
}

static void test_stamp_vt3_extra_namespaces()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    const auto packet{ MetadataWriter::createXmpPacket(*registry.findById("vt3"), "2024-05-01T10:20:30Z") };

    expect(contains(packet, "<pdfvtid:GTS_PDFVTVersion>PDF/VT-3</pdfvtid:GTS_PDFVTVersion>"), "vt3 marker");
    expect(contains(packet, "<pdf:PDFVersion>2.0</pdf:PDFVersion>"), "explicit PDF version");
    expect(contains(packet, "<pdfx6:GTS_PDFXConformance>PDF/X-6</pdfx6:GTS_PDFXConformance>"), "PDF/X-6 conformance");
    expect(countOf(packet, "xmlns:pdfx6=\"http://www.npes.org/pdfx6/ns/id/\"") == 1, "pdfx6 declared once");
    expect(countOf(packet, "xmlns:pdf=\"") == 1, "pdf namespace not declared twice");
}

static void test_stamp_escapes_xml()
{
    const auto profile{ makeProfile("amp", "A&B<1>", PdfVersionRule::AtLeast(1, 6)) };
    RecordingSink sink;
    MetadataWriter{}.stamp(profile, sink, "2024-05-01T10:20:30Z");
    expect(contains(sink.packet, "<pdfvtid:GTS_PDFVTVersion>A&amp;B&lt;1&gt;</pdfvtid:GTS_PDFVTVersion>"), "escaped marker");
    expect(sink.catalog[PDFVT_VERSION_KEY] == "A&B<1>", "catalog marker not escaped");
}

static void test_stamp_propagates_sink_error()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    RecordingSink sink;
    sink.failOnPacket = true;
    auto threw{ false };
    try
    {
        MetadataWriter{}.stamp(*registry.findById("vt1"), sink);
    }
    catch (const std::runtime_error& e)
    {
        threw = (std::string(e.what()) == "disk full");
    }
    expect(threw, "sink error propagates unchanged");
}

static void test_pdf_date()
{
    expect(MetadataWriter::toPdfDate("2024-05-01T10:20:30Z") == "D:20240501102030Z", "PDF date");
    const auto now{ MetadataWriter::currentTimestamp() };
    expect((now.size() == 20) && (now[4] == '-') && (now[10] == 'T') && (now.back() == 'Z'), "UTC timestamp format");
}

// ============================================================================
// ComplianceChecker
// ============================================================================

static void test_custom_variant_compliant()
{
    const ProfileRegistry registry{ { makeProfile("X1", "X-1", PdfVersionRule::AtLeast(1, 6)) } };
    FakeReader reader;
    setCompliant(reader, "X-1", "1.6");
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("x1.pdf") };
    expect(result.isCompliant, "X-1 document is compliant");
    expect(result.detectedVariant == std::string("X1"), "detected X1");
    expect(result.rawMarker == std::string("X-1"), "raw marker");
    expect(result.declaredPdfVersion == std::string("1.6"), "declared version");
    expect(result.hasCatalogMarker && result.hasPacketMarker && result.hasStructureFlag, "all evidence found");
    expect(result.issues.empty(), "no issues");
    expect(reader.closed == 1, "document closed");
}

static void test_packet_is_evidence_only()
{
    const ProfileRegistry registry{ { makeProfile("X1", "X-1", PdfVersionRule::AtLeast(1, 6)) } };
    FakeReader reader;
    setCompliant(reader, "X-1", "1.6");
    reader.document.packet.reset();
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("x1.pdf") };
    expect(result.isCompliant, "compliant without XMP packet");
    expect(!result.hasPacketMarker, "no packet marker");
    expect((result.issues.size() == 1) && hasIssue(result, "XMP metadata not found"), "missing packet reported");
}

static void test_structure_flag_required()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    setCompliant(reader, "PDF/VT-1", "1.7");
    reader.document.marked.reset();
    const ComplianceChecker checker{ registry, reader };

    auto result{ checker.check("doc.pdf") };
    expect(!result.isCompliant, "missing MarkInfo is never compliant");
    expect(result.detectedVariant == std::string("vt1"), "variant still detected");
    expect(hasIssue(result, "MarkInfo with Marked=true not found"), "missing MarkInfo reported");

    reader.document.marked = false;
    result = checker.check("doc.pdf");
    expect(!result.isCompliant && !result.hasStructureFlag, "Marked false is not compliant");
    expect(hasIssue(result, "MarkInfo with Marked=true not found"), "Marked false reported");
}

static void test_unknown_marker()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    setCompliant(reader, "PDF/VT-2", "1.6");
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("vt2.pdf") };
    expect(!result.isCompliant, "unknown marker is not compliant");
    expect(result.rawMarker == std::string("PDF/VT-2"), "raw marker kept");
    expect(!result.detectedVariant, "no variant");
    expect(hasIssue(result, "Unknown PDF/VT version: PDF/VT-2"), "unknown marker reported");
}

static void test_no_marker()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    reader.document.marked = true;
    reader.document.packet = "<x:xmpmeta><dc:title>plain</dc:title></x:xmpmeta>";
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("plain.pdf") };
    expect(!result.isCompliant && !result.rawMarker && !result.detectedVariant, "plain PDF");
    expect(hasIssue(result, "GTS_PDFVTVersion not found in catalog"), "catalog issue");
    expect(hasIssue(result, "GTS_PDFVTVersion not found in XMP metadata"), "XMP issue");
    expect(hasIssue(result, "No PDF/VT version marker found"), "no marker issue");
    expect(result.issues.back() == "No PDF/VT version marker found", "no marker reported last");
}

static void test_packet_fallback_priority()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    reader.document.marked = true;
    reader.document.packet = "<pdfvtid:GTS_PDFVTVersion>PDF/VT-1</pdfvtid:GTS_PDFVTVersion>"
                             "<pdfx:GTS_PDFVTVersion>PDF/VT-3</pdfx:GTS_PDFVTVersion>";
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("both.pdf") };
    expect(result.detectedVariant == std::string("vt3"), "vt3 wins when packet has both markers");
    expect(result.hasPacketMarker, "packet marker found");
    expect(!result.hasCatalogMarker, "no catalog marker");
    expect(!result.isCompliant, "packet-only detection is never compliant");
}

static void test_packet_fallback_nested_markers()
{
    const ProfileRegistry registry{ { makeProfile("short", "X-1", PdfVersionRule::AtLeast(1, 6)),
                                      makeProfile("long", "X-1.2", PdfVersionRule::AtLeast(1, 6)) } };
    FakeReader reader;
    reader.document.marked = true;
    reader.document.packet = packetWith("X-1.2");
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("nested.pdf") };
    expect(result.detectedVariant == std::string("long"), "containing marker resolves first");
}

static void test_catalog_marker_wins()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    setCompliant(reader, "PDF/VT-1", "1.6");
    reader.document.packet = packetWith("PDF/VT-3");
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("mixed.pdf") };
    expect(result.detectedVariant == std::string("vt1"), "catalog marker is primary");
    expect(!result.hasPacketMarker, "catalog marker not in packet");
    expect(result.isCompliant, "packet mismatch is not gating");
    expect(hasIssue(result, "XMP metadata does not contain PDF/VT-1"), "mismatch reported");
}

static void test_version_rules_in_check()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    const ComplianceChecker checker{ registry, reader };

    setCompliant(reader, "PDF/VT-1", "1.5");
    auto result{ checker.check("doc.pdf") };
    expect(!result.isCompliant, "vt1 at 1.5 fails");
    expect(hasIssue(result, "PDF/VT-1 requires PDF 1.6+, found 1.5"), "vt1 version issue");

    for (const auto version : { "1.6", "1.7", "2.0" })
    {
        setCompliant(reader, "PDF/VT-1", version);
        result = checker.check("doc.pdf");
        expect(result.isCompliant && result.issues.empty(), std::string("vt1 at ") + version + " passes");
    }

    setCompliant(reader, "PDF/VT-3", "2.0");
    expect(checker.check("doc.pdf").isCompliant, "vt3 at 2.0 passes");

    for (const auto version : { "2.1", "1.6" })
    {
        setCompliant(reader, "PDF/VT-3", version);
        result = checker.check("doc.pdf");
        expect(!result.isCompliant, std::string("vt3 at ") + version + " fails");
        expect(hasIssue(result, std::string("PDF/VT-3 requires PDF 2.0, found ") + version), "vt3 version issue");
    }
}

static void test_multiple_issues()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    reader.document.version = "1.4";
    reader.document.catalogMarker = "PDF/VT-1";
    const ComplianceChecker checker{ registry, reader };

    const auto result{ checker.check("doc.pdf") };
    expect(!result.isCompliant, "not compliant");
    expect(result.issues.size() == 3, "all violations recorded");
    expect(result.issues[0] == "MarkInfo with Marked=true not found", "MarkInfo first");
    expect(result.issues[1] == "XMP metadata not found", "packet second");
    expect(result.issues[2] == "PDF/VT-1 requires PDF 1.6+, found 1.4", "version last");
}

static void test_corrupt_document()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    reader.corrupt = true;
    const ComplianceChecker checker{ registry, reader };

    auto result{ checker.check("corrupt.pdf") };
    expect(!result.isCompliant, "corrupt document not compliant");
    expect((result.issues.size() == 1)
        && (result.issues[0] == "Error reading PDF: PDF file was damaged and couldn't be repaired"), "open error recorded");

    reader.corrupt = false;
    setCompliant(reader, "PDF/VT-1", "1.6");
    reader.document.failOnRead = true;
    result = checker.check("corrupt.pdf");
    expect(!result.isCompliant && !result.detectedVariant, "read error not compliant");
    expect(hasIssue(result, "Error reading PDF: couldn't read the page catalog"), "read error recorded");
    expect(reader.closed == 1, "document closed after read error");
}

static void test_missing_file_is_fatal()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    reader.exists = false;
    const ComplianceChecker checker{ registry, reader };

    auto threw{ false };
    try
    {
        checker.check("missing.pdf");
    }
    catch (const FileNotFoundError& e)
    {
        threw = (e.getFileName() == "missing.pdf");
    }
    expect(threw, "check throws FileNotFoundError");

    threw = false;
    try
    {
        checker.isCompliant("missing.pdf", "vt1");
    }
    catch (const FileNotFoundError&)
    {
        threw = true;
    }
    expect(threw, "isCompliant throws FileNotFoundError");
}

static void test_is_compliant_wrapper()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    setCompliant(reader, "PDF/VT-1", "1.6");
    const ComplianceChecker checker{ registry, reader };

    expect(checker.isCompliant("doc.pdf", "vt1"), "vt1 document is vt1");
    expect(!checker.isCompliant("doc.pdf", "vt3"), "vt1 document is not vt3");

    reader.document.marked.reset();
    expect(!checker.isCompliant("doc.pdf", "vt1"), "non-compliant vt1 document");
}

static void test_print_results()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    FakeReader reader;
    setCompliant(reader, "PDF/VT-1", "1.6");
    reader.document.packet.reset();
    const ComplianceChecker checker{ registry, reader };

    std::ostringstream out;
    ComplianceChecker::printResults(checker.check("doc.pdf"), out);
    const auto text{ out.str() };
    expect(contains(text, "PDF Version: 1.6"), "version printed");
    expect(contains(text, "Detected: PDF/VT-1"), "marker printed");
    expect(contains(text, "Compliant: ✓ Yes"), "verdict printed");
    expect(contains(text, "GTS in XMP:     ✗"), "packet evidence printed");
    expect(contains(text, "⚠ XMP metadata not found"), "issue printed");

    std::ostringstream plain;
    ComplianceChecker::printResults(ComplianceResult{}, plain);
    expect(contains(plain.str(), "Detected: Not PDF/VT"), "no marker printed");
    expect(!contains(plain.str(), "Issues:"), "no issue section without issues");
}

// ============================================================================
// Documents written with qpdf, read with xpdf
// ============================================================================

static void test_round_trip()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    PDFReaderEx reader;
    const ComplianceChecker checker{ registry, reader };
    const DocumentGenerator generator{};

    for (const auto& profile : registry.profiles())
    {
        const auto fileName{ (testDir() / (profile.id + ".pdf")).string() };
        generator.createDocument(profile, fileName);

        const auto result{ checker.check(fileName) };
        expect(result.isCompliant, profile.id + " round trip is compliant");
        expect(result.detectedVariant == profile.id, profile.id + " round trip variant");
        expect(result.declaredPdfVersion == profile.pdfVersion, profile.id + " header version");
        expect(result.hasCatalogMarker && result.hasPacketMarker && result.hasStructureFlag, profile.id + " evidence");
        expect(result.issues.empty(), profile.id + " has no issues");
        expect(contains(result.conformance, profile.marker), profile.id + " XMP conformance has marker");
        expect(contains(result.conformance, profile.baseStandardName), profile.id + " XMP conformance has base standard");

        for (const auto& other : registry.profiles())
        {
            expect(checker.isCompliant(fileName, other.id) == (other.id == profile.id),
                profile.id + " document checked as " + other.id);
        }
    }
}

static void test_document_info_and_text()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    const auto& vt3{ *registry.findById("vt3") };
    const auto fileName{ (testDir() / "vt3_text.pdf").string() };
    DocumentGenerator{}.createDocument(vt3, fileName);

    PDFDocEx doc{ fileName };
    expect(doc.isOk(), "generated document opens");
    expect(doc.getNumPages() == 1, "one page");

    std::unique_ptr<GString> title{ doc.getMetadataString("Title") };
    expect(title && (std::string(title->getCString()) == MetadataWriter::getTitle(vt3)), "title read back");
    std::unique_ptr<GString> producer{ doc.getMetadataString("Producer") };
    expect(producer && (std::string(producer->getCString()) == globalOptionsFromIni.producer), "producer read back");

    TextExtractor extractor;
    const auto text{ extractor.extract(&doc) };
    expect(contains(text, "PDF/VT-3 Document Sample"), "page title extracted");
    expect(contains(text, "Key Features of PDF/VT-3:"), "feature heading extracted");
    expect(contains(text, "Figure 1: Geometric design sample"), "caption extracted");
    expect(contains(text, "PDF/VT-3 Compliant"), "footer extracted");
    expect(extractor.extractPage(&doc, 2).empty(), "no text beyond last page");
}

static void test_unstamped_document()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    const auto& vt1{ *registry.findById("vt1") };
    const auto fileName{ (testDir() / "plain.pdf").string() };

    QPDFAuthor author;
    PageLayout layout{ 595, 842, 50 };
    author.addPage(layout.layout(vt1, "today", "tests"), PageLayout::getFonts());
    expect(author.getPageCount() == 1, "page added");
    author.save(fileName, "1.7");

    PDFReaderEx reader;
    const auto result{ ComplianceChecker{ registry, reader }.check(fileName) };
    expect(!result.isCompliant, "unstamped document is not PDF/VT");
    expect(result.declaredPdfVersion == std::string("1.7"), "declared 1.7");
    expect(hasIssue(result, "GTS_PDFVTVersion not found in catalog"), "no catalog marker");
    expect(hasIssue(result, "MarkInfo with Marked=true not found"), "no MarkInfo");
    expect(hasIssue(result, "XMP metadata not found"), "no XMP");
    expect(hasIssue(result, "No PDF/VT version marker found"), "no marker");
}

static void test_wrong_header_version()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    const auto& vt1{ *registry.findById("vt1") };
    const auto fileName{ (testDir() / "vt1_15.pdf").string() };

    QPDFAuthor author;
    PageLayout layout{ 595, 842, 50 };
    author.addPage(layout.layout(vt1, "today", "tests"), PageLayout::getFonts());
    MetadataWriter{}.stamp(vt1, author);
    author.save(fileName, "1.5");

    PDFReaderEx reader;
    const auto result{ ComplianceChecker{ registry, reader }.check(fileName) };
    expect(!result.isCompliant, "vt1 with PDF 1.5 header fails");
    expect(result.detectedVariant == std::string("vt1"), "still detected as vt1");
    expect(hasIssue(result, "PDF/VT-1 requires PDF 1.6+, found 1.5"), "version issue");
}

static void test_garbage_and_missing_files()
{
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };
    PDFReaderEx reader;
    const ComplianceChecker checker{ registry, reader };

    const auto garbage{ (testDir() / "garbage.pdf").string() };
    {
        std::ofstream out(garbage, std::ios::binary);
        out << "this is not a PDF file\n";
    }
    const auto result{ checker.check(garbage) };
    expect(!result.isCompliant, "garbage is not compliant");
    expect(!result.issues.empty() && (result.issues[0].rfind("Error reading PDF: ", 0) == 0), "read error recorded");

    auto threw{ false };
    try
    {
        checker.check((testDir() / "does_not_exist.pdf").string());
    }
    catch (const FileNotFoundError&)
    {
        threw = true;
    }
    expect(threw, "missing file throws");

    threw = false;
    try
    {
        checker.check(testDir().string());
    }
    catch (const FileNotFoundError&)
    {
        threw = true;
    }
    expect(threw, "directory is not a PDF file");
}

static void test_load_options()
{
    const auto iniFile{ (testDir() / "options.ini").string() };
    {
        std::ofstream out(iniFile);
        out << "; test options\n"
            << "[other]\nAuthor=Wrong\n"
            << "[xpdfvt]\n"
            << "  author = Print Shop  \n"
            << "PageWidth=612\nPageHeight=792\nMargin=abc\nCompressStreams=0\n";
    }
    const auto saved{ globalOptionsFromIni };
    expect(loadOptions(iniFile.c_str()), "options file read");
    expect(globalOptionsFromIni.author == "Print Shop", "section and keys case-insensitive, value trimmed");
    expect((globalOptionsFromIni.pageWidth == 612) && (globalOptionsFromIni.pageHeight == 792), "US letter page");
    expect(globalOptionsFromIni.margin == saved.margin, "invalid number keeps current value");
    expect(!globalOptionsFromIni.compressStreams, "compression disabled");
    expect(globalOptionsFromIni.creator == saved.creator, "missing key keeps current value");
    expect(!loadOptions((testDir() / "missing.ini").string().c_str()), "missing options file");
    globalOptionsFromIni = saved;
}

int main()
{
    const XpdfGlobals xpdf;

    std::cout << "\n[Profiles]\n";
    run_test("built-in profiles", test_default_profiles);
    run_test("lookup by id and alias", test_find_by_name);
    run_test("registry rejects duplicates", test_registry_rejects_duplicates);
    run_test("marker fallback order", test_fallback_order);

    std::cout << "\n[Version rules]\n";
    run_test("AtLeast boundaries", test_at_least_rule);
    run_test("ExactlyEquals boundaries", test_exactly_equals_rule);

    std::cout << "\n[MetadataWriter]\n";
    run_test("stamp PDF/VT-1", test_stamp_vt1);
    run_test("PDF/VT-3 extra namespaces", test_stamp_vt3_extra_namespaces);
    run_test("XMP escaping", test_stamp_escapes_xml);
    run_test("sink error propagates", test_stamp_propagates_sink_error);
    run_test("PDF date conversion", test_pdf_date);

    std::cout << "\n[ComplianceChecker]\n";
    run_test("custom variant compliant", test_custom_variant_compliant);
    run_test("packet is evidence only", test_packet_is_evidence_only);
    run_test("structure flag required", test_structure_flag_required);
    run_test("unknown marker", test_unknown_marker);
    run_test("no marker", test_no_marker);
    run_test("packet fallback priority", test_packet_fallback_priority);
    run_test("packet fallback nested markers", test_packet_fallback_nested_markers);
    run_test("catalog marker wins", test_catalog_marker_wins);
    run_test("version rules", test_version_rules_in_check);
    run_test("multiple issues", test_multiple_issues);
    run_test("corrupt document", test_corrupt_document);
    run_test("missing file is fatal", test_missing_file_is_fatal);
    run_test("isCompliant wrapper", test_is_compliant_wrapper);
    run_test("print results", test_print_results);

    std::cout << "\n[qpdf and xpdf]\n";
    run_test("round trip for every profile", test_round_trip);
    run_test("document info and page text", test_document_info_and_text);
    run_test("unstamped document", test_unstamped_document);
    run_test("wrong header version", test_wrong_header_version);
    run_test("garbage and missing files", test_garbage_and_missing_files);

    std::cout << "\n[Options]\n";
    run_test("load options", test_load_options);

    std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
    return g_tests_passed == g_tests_run ? 0 : 1;
}
