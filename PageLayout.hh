/**
* @file
*
* PageLayout class declaration.
*/

#pragma once
#include "QPDFAuthor.hh"
#include "VersionProfile.hh"
#include <sstream>
#include <string>
#include <vector>

/**
* Builds the content stream of the sample page.
* Text is set in standard Helvetica fonts with WinAnsiEncoding,
* widths are approximated, layout is never validated.
*/
class PageLayout
{
public:
    PageLayout(int pageWidth, int pageHeight, int margin);
    PageLayout(const PageLayout&) = delete;
    PageLayout& operator=(const PageLayout&) = delete;

    std::string layout(const VersionProfile& profile, const std::string& generatedOn, const std::string& creator);

    static const std::vector<StandardFont>& getFonts();
    static std::string escapeText(const std::string& text);
    static double getTextWidth(const std::string& text, double fontSize, bool bold);

private:
    /**
    * Font resource used by text operators
    */
    enum Face
    {
        regular,
        bold,
        italic
    };

    struct Color
    {
        int r;
        int g;
        int b;
    };

    void addText(double x, const std::string& text, Face face, double size, const Color& color);
    void addLine(const std::string& text, Face face, double size, const Color& color, bool centered, double indent = 0);
    void addParagraph(const std::string& text, Face face, double size, const Color& color, double indent = 0);
    void addFigure(double scale);
    void addCircle(double cx, double cy, double r, const Color& color);
    void addRect(double x, double y, double w, double h, const Color& color);
    void addSeparator(const Color& color);
    void setFill(const Color& color);

    static std::string format(double value);

    std::ostringstream m_content;
    double m_pageWidth{ 0 };
    double m_pageHeight{ 0 };
    double m_margin{ 0 };
    double m_y{ 0 };            /**< top of next line */
};
