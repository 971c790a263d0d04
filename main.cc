/**
* @file
*
* xpdfvt command line tool: creates sample PDF/VT documents and checks PDF/VT compliance.
*/

#include "ComplianceChecker.hh"
#include "DocumentGenerator.hh"
#include "PDFDocEx.hh"
#include "VersionProfile.hh"
#include "xPDFVT.hh"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/**
* Parsed command line.
*/
typedef struct arguments_s
{
    const VersionProfile* profile{ nullptr };   /**< variant to create, --version */
    std::string outputPath{ "output.pdf" };     /**< document to create, --output */
    std::string checkPath{ };                   /**< document to check, --check, empty in generation mode */
    std::string iniFile{ };                     /**< options file, --ini */
} arguments_t;

static std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

static void printHelp(const ProfileRegistry& registry)
{
    std::string ids;
    for (const auto& profile : registry.profiles())
    {
        ids.append(ids.empty() ? "" : "|").append(profile.id);
    }

    std::cout << "PDF/VT Document Generator\n\n"
              << "Usage: xpdfvt [options]\n\n"
              << "Options:\n"
              << "  --version, -v <" << ids << ">  PDF/VT version (default: "
              << registry.profiles().front().id << ")\n"
              << "  --output, -o <path>      Output file path (default: output.pdf)\n"
              << "  --check, -c <path>       Check compliance of existing PDF\n"
              << "  --ini, -i <path>         Options file (default: xPDFVT.ini beside xpdfvt)\n"
              << "  --help, -h               Show this help message\n\n"
              << "Examples:\n"
              << "  xpdfvt --version vt1\n"
              << "  xpdfvt -v vt3 -o my_document.pdf\n"
              << "  xpdfvt --check document.pdf\n";
}

/**
* Parse command line arguments.
* Flags are case-insensitive, unknown flags are ignored.
*
* @param[in]    args        arguments without program name
* @param[in]    registry    supported variants
* @return parsed arguments, defaults for missing flags
* @throw std::invalid_argument for unknown variant
*/
static arguments_t parseArguments(const std::vector<std::string>& args, const ProfileRegistry& registry)
{
    arguments_t arguments;
    arguments.profile = &registry.profiles().front();

    for (size_t i{ 0 }; i < args.size(); ++i)
    {
        const auto flag{ toLower(args[i]) };
        const auto hasValue{ i + 1 < args.size() };
        if ((flag == "--version") || (flag == "-v"))
        {
            if (hasValue)
            {
                const auto& name{ args[++i] };
                arguments.profile = registry.findByName(name);
                if (!arguments.profile)
                {
                    throw std::invalid_argument("Invalid PDF/VT version: '" + name + "'. Use 'vt1' or 'vt3'.");
                }
            }
        }
        else if ((flag == "--output") || (flag == "-o"))
        {
            if (hasValue)
            {
                arguments.outputPath = args[++i];
            }
        }
        else if ((flag == "--check") || (flag == "-c"))
        {
            if (hasValue)
            {
                arguments.checkPath = args[++i];
            }
        }
        else if ((flag == "--ini") || (flag == "-i"))
        {
            if (hasValue)
            {
                arguments.iniFile = args[++i];
            }
        }
    }
    return arguments;
}

/**
* Check document and print results.
*
* @return 0 if document is compliant, 1 otherwise
* @throw FileNotFoundError if document doesn't exist
*/
static int runComplianceCheck(const std::string& fileName, const ProfileRegistry& registry)
{
    std::cout << "PDF/VT Compliance Checker\n"
              << "   File: " << fileName << "\n\n";

    PDFReaderEx reader;
    const ComplianceChecker checker{ registry, reader };
    const auto result{ checker.check(fileName) };
    ComplianceChecker::printResults(result, std::cout);

    return result.isCompliant ? 0 : 1;
}

static int runGenerator(const VersionProfile& profile, const std::string& outputPath)
{
    std::cout << "PDF/VT Document Generator\n"
              << "   Version: " << profile.id << '\n'
              << "   Output: " << outputPath << "\n\n"
              << "Creating " << profile.marker << " document...\n"
              << "  - PDF Version: " << profile.pdfVersion << '\n';

    const DocumentGenerator generator{};
    generator.createDocument(profile, outputPath);

    std::cout << "\n✓ " << profile.marker << " document created successfully: " << outputPath << '\n';
    return 0;
}

int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);
    const ProfileRegistry registry{ ProfileRegistry::defaultProfiles() };

    for (const auto& arg : args)
    {
        const auto flag{ toLower(arg) };
        if ((flag == "--help") || (flag == "-h"))
        {
            printHelp(registry);
            return 0;
        }
    }

    try
    {
        const auto arguments{ parseArguments(args, registry) };

        auto iniFile{ arguments.iniFile };
        if (iniFile.empty())
        {
            iniFile = (std::filesystem::path(argv[0]).parent_path() / "xPDFVT.ini").string();
        }
        if (!loadOptions(iniFile.c_str()) && !arguments.iniFile.empty())
        {
            std::cerr << "Warning: cannot read options file " << iniFile << ", using defaults\n";
        }

        const XpdfGlobals xpdf;
        if (!arguments.checkPath.empty())
        {
            return runComplianceCheck(arguments.checkPath, registry);
        }
        return runGenerator(*arguments.profile, arguments.outputPath);
    }
    catch (const FileNotFoundError& e)
    {
        std::cout << "Error: File not found - " << e.getFileName() << '\n';
    }
    catch (const std::invalid_argument& e)
    {
        std::cout << "Error: " << e.what() << "\n\n";
        printHelp(registry);
    }
    catch (const std::exception& e)
    {
        std::cout << "Error: " << e.what() << '\n';
    }
    return 1;
}
