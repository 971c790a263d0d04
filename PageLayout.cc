/**
* @file
*
* Sample page content: title, introduction, feature list, vector figure and footer.
*/

#include "PageLayout.hh"
#include <cstdio>
#include <cstring>

static constexpr auto WINANSI_BULLET{ "\x95" };     /**< bullet in WinAnsiEncoding */
static constexpr auto BEZIER_KAPPA{ 0.5523 };       /**< control point distance of quarter circle */

static const std::vector<StandardFont> pageFonts
{
    { "F1", "Helvetica" },
    { "F2", "Helvetica-Bold" },
    { "F3", "Helvetica-Oblique" },
};

PageLayout::PageLayout(int pageWidth, int pageHeight, int margin)
: m_pageWidth(pageWidth), m_pageHeight(pageHeight), m_margin(margin)
{
}

/**
* Fonts referenced by content streams created by #layout.
*/
const std::vector<StandardFont>& PageLayout::getFonts()
{
    return pageFonts;
}

/**
* Format number for content stream, without trailing zeros.
*/
std::string PageLayout::format(double value)
{
    char buffer[32]{ 0 };
    std::snprintf(buffer, sizeof(buffer), "%.3f", value);
    auto len{ std::strlen(buffer) };
    while ((len > 0) && (buffer[len - 1] == '0'))
    {
        buffer[--len] = '\0';
    }
    if ((len > 0) && (buffer[len - 1] == '.'))
    {
        buffer[--len] = '\0';
    }
    if (!std::strcmp(buffer, "-0"))
    {
        return "0";
    }
    return buffer;
}

/**
* Escape string for PDF literal string.
* Bytes outside printable ASCII are written as octal escapes.
*
* @param[in]    text    WinAnsi encoded text
* @return escaped text without enclosing parentheses
*/
std::string PageLayout::escapeText(const std::string& text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const unsigned char ch : text)
    {
        switch (ch)
        {
        case '(':
        case ')':
        case '\\':
            escaped.push_back('\\');
            escaped.push_back(static_cast<char>(ch));
            break;
        case '\n':
            escaped.append("\\n");
            break;
        case '\r':
            escaped.append("\\r");
            break;
        case '\t':
            escaped.append("\\t");
            break;
        default:
            if ((ch < 0x20) || (ch > 0x7e))
            {
                char buffer[5]{ 0 };
                std::snprintf(buffer, sizeof(buffer), "\\%03o", ch);
                escaped.append(buffer);
            }
            else
            {
                escaped.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    return escaped;
}

/**
* Approximate width of Helvetica text.
*
* @param[in]    text        WinAnsi encoded text
* @param[in]    fontSize    font size in points
* @param[in]    bold        Helvetica-Bold is slightly wider
* @return width in points
*/
double PageLayout::getTextWidth(const std::string& text, double fontSize, bool bold)
{
    double em{ 0 };
    for (const unsigned char ch : text)
    {
        if ((ch == ' ') || std::strchr(".,:;!|'il", ch))
        {
            em += 0.278;
        }
        else if ((ch >= 'A') && (ch <= 'Z'))
        {
            em += 0.667;
        }
        else if ((ch == 'm') || (ch == 'w') || (ch == 'W') || (ch == 'M'))
        {
            em += 0.833;
        }
        else
        {
            em += 0.556;
        }
    }
    return em * fontSize * (bold ? 1.06 : 1.0);
}

void PageLayout::setFill(const Color& color)
{
    m_content << format(color.r / 255.0) << ' ' << format(color.g / 255.0) << ' '
              << format(color.b / 255.0) << " rg\n";
}

/**
* Show text with baseline at current position.
*/
void PageLayout::addText(double x, const std::string& text, Face face, double size, const Color& color)
{
    m_content << "BT\n/" << pageFonts[face].key << ' ' << format(size) << " Tf\n";
    setFill(color);
    m_content << format(x) << ' ' << format(m_y) << " Td\n("
              << escapeText(text) << ") Tj\nET\n";
}

/**
* Show one line of text and move to the next line.
*/
void PageLayout::addLine(const std::string& text, Face face, double size, const Color& color, bool centered, double indent)
{
    m_y -= size;
    auto x{ m_margin + indent };
    if (centered)
    {
        x = (m_pageWidth - getTextWidth(text, size, face == bold)) / 2;
    }
    addText(x, text, face, size, color);
    m_y -= size * 0.25;
}

/**
* Show text word wrapped to the text area.
*/
void PageLayout::addParagraph(const std::string& text, Face face, double size, const Color& color, double indent)
{
    const auto maxWidth{ m_pageWidth - 2 * m_margin - indent };
    std::istringstream words{ text };
    std::string word;
    std::string line;
    while (words >> word)
    {
        const auto candidate{ line.empty() ? word : line + ' ' + word };
        if (!line.empty() && (getTextWidth(candidate, size, face == bold) > maxWidth))
        {
            addLine(line, face, size, color, false, indent);
            line = word;
        }
        else
        {
            line = candidate;
        }
    }
    if (!line.empty())
    {
        addLine(line, face, size, color, false, indent);
    }
}

void PageLayout::addCircle(double cx, double cy, double r, const Color& color)
{
    const auto k{ r * BEZIER_KAPPA };
    setFill(color);
    m_content << format(cx + r) << ' ' << format(cy) << " m\n"
              << format(cx + r) << ' ' << format(cy + k) << ' ' << format(cx + k) << ' ' << format(cy + r) << ' '
              << format(cx) << ' ' << format(cy + r) << " c\n"
              << format(cx - k) << ' ' << format(cy + r) << ' ' << format(cx - r) << ' ' << format(cy + k) << ' '
              << format(cx - r) << ' ' << format(cy) << " c\n"
              << format(cx - r) << ' ' << format(cy - k) << ' ' << format(cx - k) << ' ' << format(cy - r) << ' '
              << format(cx) << ' ' << format(cy - r) << " c\n"
              << format(cx + k) << ' ' << format(cy - r) << ' ' << format(cx + r) << ' ' << format(cy - k) << ' '
              << format(cx + r) << ' ' << format(cy) << " c\nf\n";
}

void PageLayout::addRect(double x, double y, double w, double h, const Color& color)
{
    setFill(color);
    m_content << format(x) << ' ' << format(y) << ' ' << format(w) << ' ' << format(h) << " re f\n";
}

/**
* Geometric figure of 400x300 units, drawn top-down and centered.
*
* @param[in]    scale   points per figure unit
*/
void PageLayout::addFigure(double scale)
{
    static constexpr auto figureWidth{ 400.0 };
    static constexpr auto figureHeight{ 300.0 };
    const Color blue{ 66, 133, 244 };
    const Color orange{ 251, 188, 4 };
    const Color green{ 52, 168, 83 };
    const Color red{ 234, 67, 53 };

    const auto x{ (m_pageWidth - figureWidth * scale) / 2 };
    m_content << "q\n" << format(scale) << " 0 0 " << format(-scale) << ' '
              << format(x) << ' ' << format(m_y) << " cm\n";
    addRect(0, 0, figureWidth, figureHeight, { 255, 255, 255 });
    addCircle(125, 125, 75, blue);
    addCircle(190, 150, 70, orange);
    addCircle(265, 165, 65, green);
    addRect(280, 40, 80, 80, red);
    addRect(100, 200, 200, 60, blue);
    m_content << "Q\n";
    m_y -= figureHeight * scale;
}

void PageLayout::addSeparator(const Color& color)
{
    m_content << format(color.r / 255.0) << ' ' << format(color.g / 255.0) << ' '
              << format(color.b / 255.0) << " RG\n0.5 w\n"
              << format(m_margin) << ' ' << format(m_y) << " m\n"
              << format(m_pageWidth - m_margin) << ' ' << format(m_y) << " l\nS\n";
}

/**
* Create sample page content stream for profile.
*
* @param[in]    profile         target PDF/VT variant
* @param[in]    generatedOn     date and time shown in footer
* @param[in]    creator         tool name shown in footer
* @return content stream using fonts from #getFonts
*/
std::string PageLayout::layout(const VersionProfile& profile, const std::string& generatedOn, const std::string& creator)
{
    const Color dark{ 33, 37, 41 };
    const Color gray{ 108, 117, 125 };
    const Color feature{ 73, 80, 87 };
    const Color light{ 206, 212, 218 };

    m_content.str(std::string());
    m_y = m_pageHeight - m_margin;

    addLine(profile.marker + " Document Sample", bold, 28, dark, true);
    m_y -= 20;
    addLine("Variable Data & Transactional Printing", regular, 16, gray, true);
    m_y -= 24;
    addParagraph("This document demonstrates " + profile.marker
        + " (Variable Data and Transactional Printing) capabilities. This version is based on "
        + profile.baseStandardName + " and uses PDF " + profile.pdfVersion + " features.",
        regular, 12, dark);
    m_y -= 14;

    addLine("Key Features of " + profile.marker + ":", bold, 14, dark, false);
    m_y -= 8;
    for (const auto& description : profile.featureDescriptions)
    {
        addParagraph(std::string(WINANSI_BULLET) + ' ' + description, regular, 11, feature, 20);
        m_y -= 4;
    }

    m_y -= 20;
    addLine("Sample Embedded Image", bold, 14, dark, false);
    m_y -= 10;
    addFigure(0.75);
    m_y -= 10;
    addLine("Figure 1: Geometric design sample demonstrating embedded image support", italic, 10, gray, true);

    m_y -= 20;
    addSeparator(light);
    m_y -= 16;
    addLine("Generated on " + generatedOn, regular, 9, gray, true);
    addLine("Created with " + creator + " | " + profile.marker + " Compliant", regular, 9, gray, true);

    return m_content.str();
}
