#ifndef SYLVA_CLI_OPTIONS_HPP
#define SYLVA_CLI_OPTIONS_HPP

#include <optional>
#include <string>
#include "visitors/tree_printer.hpp"

const std::string SYLVA_VERSION = "1.0.0";

class SylvaOptions
{
private:
    sylva::NodeStyle style_ = sylva::NodeStyle::Tree;
    std::optional<std::string> inputFile_;

public:
    sylva::NodeStyle getStyle() const { return style_; }
    void setStyle(sylva::NodeStyle style) { style_ = style; }

    // Unset means the built-in sample tree is used.
    std::optional<std::string> getInputFile() const { return inputFile_; }
    void setInputFile(const std::string &inputFile) { inputFile_ = inputFile; }
};

#endif // SYLVA_CLI_OPTIONS_HPP
