#include <iostream>
#include <map>
#include <vector>
#include "util/util.hpp"

const int errorPanelScope = 3;

namespace util
{
    namespace
    {
        const std::map<std::string, int> colorCodes = {
            {"black", 0},
            {"red", 1},
            {"green", 2},
            {"yellow", 3},
            {"blue", 4},
            {"magenta", 5},
            {"cyan", 6},
            {"white", 7},
        };
    } // namespace

    std::vector<std::string> split(const std::string &text, char delimiter)
    {
        std::vector<std::string> parts;
        std::string current;
        for (char c : text)
        {
            if (c == delimiter)
            {
                parts.push_back(current);
                current.clear();
            }
            else
            {
                current += c;
            }
        }
        parts.push_back(current);
        return parts;
    }

    std::string colorize(const std::string &text, const std::string &foreground, const std::string &background)
    {
        std::string codes;
        if (auto fg = colorCodes.find(foreground); fg != colorCodes.end())
        {
            codes = std::to_string(30 + fg->second);
        }
        if (auto bg = colorCodes.find(background); bg != colorCodes.end())
        {
            codes += (codes.empty() ? "" : ";") + std::to_string(40 + bg->second);
        }

        if (codes.empty())
        {
            return text;
        }
        return "\033[" + codes + "m" + text + "\033[0m";
    }

    void printColoredText(const std::string &text, const std::string &foreground, const std::string &background)
    {
        std::cerr << colorize(text, foreground, background) << std::endl;
    }

    void displayError(const std::string &errorMsg)
    {
        printColoredText("(Error) " + errorMsg, "red");
    }

    int lineNumberAt(const std::string &fileContent, std::size_t byteOffset)
    {
        int line = 1;
        for (std::size_t i = 0; i < byteOffset && i < fileContent.size(); ++i)
        {
            if (fileContent[i] == '\n')
            {
                line++;
            }
        }
        return line;
    }

    void displayErrorPanel(const std::string &fileName, const std::string &fileContent, const int errorLineNumber, const std::string &errorMsg)
    {
        std::vector<std::string> lines = util::split(fileContent, '\n');

        int lineNumber = 1;
        for (auto &&line : lines)
        {
            if (lineNumber >= errorLineNumber - errorPanelScope && lineNumber <= errorLineNumber + errorPanelScope)
            {
                if (lineNumber == errorLineNumber)
                {
                    util::printColoredText(std::to_string(lineNumber) + "| " + line, "white", "red");
                }
                else
                {
                    std::cerr << lineNumber << "| " << line << std::endl;
                }
            }
            lineNumber++;
        }

        std::cerr << "\n"
                  << "(Error) " << fileName << ":" << errorLineNumber << " :: " << errorMsg << std::endl;
    }
} // namespace util
