/**
* @file
*
* PDF/VT metadata stamping.
*
* ISO 16612-2 and ISO 16612-3 identify the variant in three places that must agree:
* GTS_PDFVTVersion in the document catalog, GTS_PDFVTVersion in the XMP packet,
* and MarkInfo /Marked true in the catalog.
*/

#include "MetadataWriter.hh"
#include "xPDFVT.hh"
#include <ctime>
#include <iterator>
#include <utility>
#include <vector>

/**
* Namespaces declared by every PDF/VT XMP packet.
* Profile specific namespaces are appended after these.
*/
static const std::pair<const char*, const char*> xmpNamespaces[] =
{
    { "dc", "http://purl.org/dc/elements/1.1/" },
    { "xmp", "http://ns.adobe.com/xap/1.0/" },
    { "pdf", "http://ns.adobe.com/pdf/1.3/" },
    { "pdfx", "http://ns.adobe.com/pdfx/1.3/" },
    { "pdfxid", "http://www.npes.org/pdfx/ns/id/" },
    { "pdfvtid", "http://www.npes.org/pdfvt/ns/id/" },
};

std::string MetadataWriter::getTitle(const VersionProfile& profile)
{
    return profile.marker + " Sample Document";
}

std::string MetadataWriter::getSubject(const VersionProfile& profile)
{
    return "Sample " + profile.marker + " document with text and image";
}

std::string MetadataWriter::getKeywords(const VersionProfile& profile)
{
    return profile.marker + ", Variable Data, Transactional Printing";
}

/**
* Current UTC time in XMP format, e.g. 2024-05-01T10:20:30Z
*/
std::string MetadataWriter::currentTimestamp()
{
    const auto now{ std::time(nullptr) };
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32]{ 0 };
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

/**
* Convert XMP date to PDF date.
* 2024-05-01T10:20:30Z becomes D:20240501102030Z
*
* @param[in]    timestamp   XMP date in UTC
* @return PDF date string
*/
std::string MetadataWriter::toPdfDate(const std::string& timestamp)
{
    std::string ret{ "D:" };
    for (const auto c : timestamp)
    {
        if ((c >= '0') && (c <= '9'))
        {
            ret.push_back(c);
        }
    }
    ret.push_back('Z');
    return ret;
}

/**
* Escape XML special characters in element content.
*/
std::string MetadataWriter::escapeXml(const std::string& text)
{
    std::string ret;
    ret.reserve(text.size());
    for (const auto c : text)
    {
        switch (c)
        {
        case '&':
            ret.append("&amp;");
            break;
        case '<':
            ret.append("&lt;");
            break;
        case '>':
            ret.append("&gt;");
            break;
        case '"':
            ret.append("&quot;");
            break;
        default:
            ret.push_back(c);
            break;
        }
    }
    return ret;
}

/**
* Create XMP metadata packet for profile.
* The marker is written as pdfx:GTS_PDFVTVersion and pdfvtid:GTS_PDFVTVersion,
* followed by profile specific properties from #VersionProfile::extraMetadataNamespaces.
*
* @param[in]    profile     target PDF/VT variant
* @param[in]    timestamp   create, modify and metadata date in XMP format
* @return UTF-8 XMP packet
*/
std::string MetadataWriter::createXmpPacket(const VersionProfile& profile, const std::string& timestamp)
{
    const auto& options{ globalOptionsFromIni };
    const auto marker{ escapeXml(profile.marker) };

    // prefix -> namespace URI, base namespaces first
    std::vector<std::pair<std::string, std::string>> namespaces(std::begin(xmpNamespaces), std::end(xmpNamespaces));
    for (const auto& extra : profile.extraMetadataNamespaces)
    {
        auto declared{ false };
        for (const auto& ns : namespaces)
        {
            if (ns.first == extra.prefix)
            {
                declared = true;
                break;
            }
        }
        if (!declared)
        {
            namespaces.emplace_back(extra.prefix, extra.namespaceURI);
        }
    }

    std::string xmp;
    xmp.append("<?xpacket begin=\"\xEF\xBB\xBF\" id=\"W5M0MpCehiHzreSzNTczkc9d\"?>\n");
    xmp.append("<x:xmpmeta xmlns:x=\"adobe:ns:meta/\">\n");
    xmp.append("  <rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">\n");
    xmp.append("    <rdf:Description rdf:about=\"\"");
    for (const auto& ns : namespaces)
    {
        xmp.append("\n        xmlns:").append(ns.first).append("=\"").append(ns.second).append("\"");
    }
    xmp.append(">\n");

    xmp.append("      <dc:format>application/pdf</dc:format>\n");
    xmp.append("      <dc:title>\n        <rdf:Alt>\n          <rdf:li xml:lang=\"x-default\">")
       .append(escapeXml(getTitle(profile))).append("</rdf:li>\n        </rdf:Alt>\n      </dc:title>\n");
    xmp.append("      <dc:creator>\n        <rdf:Seq>\n          <rdf:li>")
       .append(escapeXml(options.author)).append("</rdf:li>\n        </rdf:Seq>\n      </dc:creator>\n");
    xmp.append("      <dc:description>\n        <rdf:Alt>\n          <rdf:li xml:lang=\"x-default\">")
       .append(escapeXml("Sample " + profile.marker + " document based on PDF " + profile.pdfVersion
                         + " and " + profile.baseStandardName + " for variable data printing"))
       .append("</rdf:li>\n        </rdf:Alt>\n      </dc:description>\n");
    xmp.append("      <xmp:CreatorTool>").append(escapeXml(options.creator)).append("</xmp:CreatorTool>\n");
    xmp.append("      <xmp:CreateDate>").append(timestamp).append("</xmp:CreateDate>\n");
    xmp.append("      <xmp:ModifyDate>").append(timestamp).append("</xmp:ModifyDate>\n");
    xmp.append("      <xmp:MetadataDate>").append(timestamp).append("</xmp:MetadataDate>\n");
    xmp.append("      <pdf:Producer>").append(escapeXml(options.producer)).append("</pdf:Producer>\n");
    xmp.append("      <pdf:Keywords>").append(escapeXml(getKeywords(profile))).append("</pdf:Keywords>\n");
    xmp.append("      <pdfxid:GTS_PDFXVersion>").append(escapeXml(profile.baseStandardName)).append("</pdfxid:GTS_PDFXVersion>\n");
    xmp.append("      <pdfx:").append(PDFVT_VERSION_KEY).append(">").append(marker).append("</pdfx:").append(PDFVT_VERSION_KEY).append(">\n");
    xmp.append("      <pdfvtid:").append(PDFVT_VERSION_KEY).append(">").append(marker).append("</pdfvtid:").append(PDFVT_VERSION_KEY).append(">\n");
    for (const auto& extra : profile.extraMetadataNamespaces)
    {
        const auto element{ extra.prefix + ':' + extra.name };
        xmp.append("      <").append(element).append(">").append(escapeXml(extra.value)).append("</").append(element).append(">\n");
    }

    xmp.append("    </rdf:Description>\n");
    xmp.append("  </rdf:RDF>\n");
    xmp.append("</x:xmpmeta>\n");
    xmp.append("<?xpacket end=\"w\"?>");
    return xmp;
}

/**
* Stamp PDF/VT metadata with current time.
*
* @param[in]        profile     target PDF/VT variant
* @param[in,out]    sink        document being authored
*/
void MetadataWriter::stamp(const VersionProfile& profile, DocumentSink& sink) const
{
    stamp(profile, sink, currentTimestamp());
}

/**
* Stamp PDF/VT metadata.
* All locations are written to the in-memory document, which is persisted by its owner
* in one pass. Collaborator errors are not caught.
*
* @param[in]        profile     target PDF/VT variant
* @param[in,out]    sink        document being authored
* @param[in]        timestamp   creation time in XMP format
*/
void MetadataWriter::stamp(const VersionProfile& profile, DocumentSink& sink, const std::string& timestamp) const
{
    TRACE("%s!%s\n", __func__, profile.marker.c_str());
    const auto& options{ globalOptionsFromIni };
    const auto pdfDate{ toPdfDate(timestamp) };

    sink.setInfoField("Title", getTitle(profile));
    sink.setInfoField("Author", options.author);
    sink.setInfoField("Subject", getSubject(profile));
    sink.setInfoField("Keywords", getKeywords(profile));
    sink.setInfoField("Creator", options.creator);
    sink.setInfoField("Producer", options.producer);
    sink.setInfoField("CreationDate", pdfDate);
    sink.setInfoField("ModDate", pdfDate);

    sink.setCatalogEntry(PDFVT_VERSION_KEY, profile.marker);
    sink.setCatalogStructureFlag(true);
    sink.attachMetadataPacket(createXmpPacket(profile, timestamp));
}
