#include <fstream>
#include <sstream>
#include <stdexcept>
#include "util/util.hpp"

namespace util
{
    bool hasFileExtension(const std::string &filename, const std::string &expectedExtension)
    {
        // The extension must follow a non-empty stem: ".json" alone does not count.
        if (filename.size() <= expectedExtension.size())
        {
            return false;
        }
        return filename.compare(filename.size() - expectedExtension.size(), expectedExtension.size(), expectedExtension) == 0;
    }

    void checkInputFileExtension(const std::string &filename)
    {
        if (!hasFileExtension(filename, ".json"))
        {
            throw std::runtime_error("Input file '" + filename + "' is not a '.json' document.");
        }
    }

    std::string readFileContent(const std::string &inputFile)
    {
        std::ifstream file(inputFile, std::ios::binary);
        if (!file)
        {
            throw std::runtime_error("Could not open file '" + inputFile + "'.");
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();
    }
} // namespace util
