/**
* @file
*
* Options loading, debug trace and xpdf global state.
* Based on xPDF v4.06 from Glyph & Cog, LLC.
*/

#include "xPDFVT.hh"
#include <GlobalParams.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <functional>
#include <thread>

/** Options from ini file, global */
options_t globalOptionsFromIni;

/** Section of the ini file read by #loadOptions */
static constexpr auto appName{ "xPDFVT" };

#ifdef _DEBUG
/** Writes debug trace to stderr.
* Please note that output trace is limited to 1024 characters!
*
* @param[in] format format options
* @param[in] ...     optional arguments
*
*/
bool _trace(const char *format, ...)
{
    char buffer[1024];
    const auto now{ std::chrono::system_clock::now() };
    const auto seconds{ std::chrono::system_clock::to_time_t(now) };
    const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000 };
    std::tm local{};
    localtime_r(&seconds, &local);

    auto len{ std::snprintf(buffer, sizeof(buffer), "%.2d%.2d%.2d.%.3d!%.5zu!",
                            local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis),
                            std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000) };
    if (len < 0)
    {
        return false;
    }

    va_list argptr;
    va_start(argptr, format);
    std::vsnprintf(buffer + len, sizeof(buffer) - len, format, argptr);
    va_end(argptr);

    std::fputs(buffer, stderr);

    return true;
}
#endif

/**
* Initialize globally used xpdf resources.
* xpdf settings can be changed by setting XpdfRc option to xpdfrc file.
*/
XpdfGlobals::XpdfGlobals()
{
    if (!globalParams)
    {
        const auto& rc{ globalOptionsFromIni.xpdfrc };
        globalParams = new GlobalParams(rc.empty() ? nullptr : rc.c_str());
        globalParams->setTextEncoding("UTF-8");         // extracted text encoding
        globalParams->setTextPageBreaks(gFalse);        // don't add \f for page breaks
        globalParams->setTextEOL("unix");               // extracted text line endings
        globalParams->setErrQuiet(globalOptionsFromIni.xpdfQuiet ? gTrue : gFalse);
        m_owner = true;
        TRACE("%s!globalParams\n", __func__);
    }
}

/**
* Clean up xpdf globalParams if this instance created it.
*/
XpdfGlobals::~XpdfGlobals()
{
    if (m_owner)
    {
        TRACE("%s!globalParams\n", __func__);
        delete globalParams;
        globalParams = nullptr;
    }
}

/**
* Remove leading and trailing white space.
*
* @param[in,out]    str     string to trim
*/
static void trim(std::string& str)
{
    const auto notSpace{ [](unsigned char c) { return !std::isspace(c); } };
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), notSpace));
    str.erase(std::find_if(str.rbegin(), str.rend(), notSpace).base(), str.end());
}

/**
* Read one value from the ini file.
* Keys are compared case-insensitive, as in Windows profile functions.
*
* @param[in]    section     section name, without brackets
* @param[in]    key         key name
* @param[in]    defaultValue value returned if section or key is missing
* @param[in]    iniFileName ini file name with path
*
* @return value of the key, or defaultValue
*/
static std::string getProfileString(const char* section, const char* key, const std::string& defaultValue, const char* iniFileName)
{
    std::ifstream ini(iniFileName);
    if (!ini)
    {
        return defaultValue;
    }

    const auto equalNoCase = [](const std::string& a, const char* b)
    {
        const std::string other{ b };
        return std::equal(a.begin(), a.end(), other.begin(), other.end(),
            [](char x, char y) { return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y)); });
    };

    auto inSection{ false };
    std::string line;
    while (std::getline(ini, line))
    {
        trim(line);
        if (line.empty() || (line[0] == ';') || (line[0] == '#'))
        {
            continue;
        }
        if (line.front() == '[')
        {
            const auto end{ line.find(']') };
            auto name{ line.substr(1, (end == std::string::npos) ? std::string::npos : end - 1) };
            trim(name);
            inSection = equalNoCase(name, section);
            continue;
        }
        if (!inSection)
        {
            continue;
        }
        const auto eq{ line.find('=') };
        if (eq == std::string::npos)
        {
            continue;
        }
        auto name{ line.substr(0, eq) };
        trim(name);
        if (equalNoCase(name, key))
        {
            auto value{ line.substr(eq + 1) };
            trim(value);
            return value;
        }
    }
    return defaultValue;
}

/**
* Read integer value from the ini file.
* Value that is not a number is replaced with defaultValue.
*/
static int getProfileInt(const char* section, const char* key, int defaultValue, const char* iniFileName)
{
    const auto value{ getProfileString(section, key, "", iniFileName) };
    if (value.empty())
    {
        return defaultValue;
    }
    char* end{ nullptr };
    const auto ret{ std::strtol(value.c_str(), &end, 10) };
    return (end && (*end == '\0')) ? static_cast<int>(ret) : defaultValue;
}

/**
* Load options from ini file to #globalOptionsFromIni.
* Missing keys keep their current values.
*
* @param[in]    iniFileName     ini file name with path
*
* @return true if ini file exists and has been read
*/
bool loadOptions(const char* iniFileName)
{
    TRACE("%s!%s\n", __func__, iniFileName);
    if (!iniFileName || !std::ifstream(iniFileName))
    {
        return false;
    }

    auto& options{ globalOptionsFromIni };
    options.compressStreams = getProfileInt(appName, "CompressStreams", options.compressStreams, iniFileName);
    options.deterministicID = getProfileInt(appName, "DeterministicID", options.deterministicID, iniFileName);
    options.xpdfQuiet = getProfileInt(appName, "XpdfQuiet", options.xpdfQuiet, iniFileName);
    options.pageWidth = getProfileInt(appName, "PageWidth", options.pageWidth, iniFileName);
    options.pageHeight = getProfileInt(appName, "PageHeight", options.pageHeight, iniFileName);
    options.margin = getProfileInt(appName, "Margin", options.margin, iniFileName);
    options.author = getProfileString(appName, "Author", options.author, iniFileName);
    options.creator = getProfileString(appName, "Creator", options.creator, iniFileName);
    options.producer = getProfileString(appName, "Producer", options.producer, iniFileName);
    options.xpdfrc = getProfileString(appName, "XpdfRc", options.xpdfrc, iniFileName);

    // page must keep some printable area
    if ((options.pageWidth <= 0) || (options.pageHeight <= 0))
    {
        options.pageWidth = options_t{}.pageWidth;
        options.pageHeight = options_t{}.pageHeight;
    }
    if ((options.margin < 0) || (2 * options.margin >= std::min(options.pageWidth, options.pageHeight)))
    {
        options.margin = 0;
    }
    return true;
}
