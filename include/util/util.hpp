#ifndef SYLVA_UTIL_HPP
#define SYLVA_UTIL_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace util
{
    std::vector<std::string> split(const std::string &text, char delimiter);

    // Wraps `text` in ANSI escape codes. Colors: black, red, green, yellow,
    // blue, magenta, cyan, white. An empty background leaves it untouched.
    std::string colorize(const std::string &text, const std::string &foreground, const std::string &background = "");
    void printColoredText(const std::string &text, const std::string &foreground, const std::string &background = "");

    void displayError(const std::string &errorMsg);
    void displayErrorPanel(const std::string &fileName, const std::string &fileContent, int errorLineNumber, const std::string &errorMsg);
    int lineNumberAt(const std::string &fileContent, std::size_t byteOffset);

    bool hasFileExtension(const std::string &filename, const std::string &expectedExtension);
    // Both throw std::runtime_error: for a name without the '.json'
    // extension, and for a file that cannot be opened.
    void checkInputFileExtension(const std::string &filename);
    std::string readFileContent(const std::string &inputFile);
} // namespace util

#endif // SYLVA_UTIL_HPP
