#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include "cli/cli.hpp"
#include "loader/loader.hpp"
#include "util/util.hpp"
#include "visitors/evaluator.hpp"
#include "visitors/expression_printer.hpp"
#include "visitors/tree_printer.hpp"

using namespace sylva;

namespace
{
    void commandHelp(const std::string &command, const std::string &description)
    {
        std::cout << "Usage: sylva " << command << " [<input_file.json>] [options]" << std::endl;
        std::cout << std::endl;
        std::cout << description << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --style=<tree|indent|bullet>  Layout of structural output (default: tree)." << std::endl;
        std::cout << "  -h, --help                    Display this help message." << std::endl;
    }

    nlohmann::json readDocument(const std::string &inputFile)
    {
        util::checkInputFileExtension(inputFile);
        const std::string fileContent = util::readFileContent(inputFile);

        try
        {
            return nlohmann::json::parse(fileContent);
        }
        catch (const nlohmann::json::parse_error &error)
        {
            util::displayErrorPanel(inputFile, fileContent, util::lineNumberAt(fileContent, error.byte), error.what());
            std::exit(1);
        }
    }

    TreeElement treeInput(const SylvaOptions &opts)
    {
        if (!opts.getInputFile().has_value())
            return sampleTree();
        return loadTree(readDocument(opts.getInputFile().value()));
    }

    Expression expressionInput(const SylvaOptions &opts)
    {
        if (!opts.getInputFile().has_value())
            return sampleExpression();
        return loadExpression(readDocument(opts.getInputFile().value()));
    }
} // namespace

void parseArguments(argh::parser &cmdl, int argc, const char *const argv[])
{
    cmdl.add_params({"-s", "--style"});
    cmdl.parse(argc, argv);
}

SylvaOptions collectOptions(argh::parser &cmdl)
{
    SylvaOptions opts;

    if (cmdl[{"-h", "--help"}])
    {
        commandHelp(cmdl[1], "Render a tree read from a JSON document, or the built-in sample.");
        std::exit(0);
    }

    for (auto &flag : cmdl.flags())
    {
        std::cerr << "(Error) Unknown option '" << (flag.size() == 1 ? "-" : "--") << flag << "'." << std::endl;
        std::exit(1);
    }

    if (cmdl.size() > 3)
    {
        std::cerr << "(Error) Incorrect number of arguments." << std::endl;
        std::cerr << "        Checkout `sylva " << cmdl[1] << " --help` for more information." << std::endl;
        std::exit(1);
    }

    for (auto &param : cmdl.params())
    {
        if (param.first == "s" || param.first == "style")
        {
            std::optional<NodeStyle> style = parseNodeStyle(param.second);
            if (!style.has_value())
            {
                std::cerr << "(Error) Unknown style '" << param.second << "', expected tree, indent or bullet." << std::endl;
                std::exit(1);
            }
            opts.setStyle(style.value());
        }
        else
        {
            std::cerr << "(Error) Unknown option '--" << param.first << "'." << std::endl;
            std::exit(1);
        }
    }

    if (cmdl.size() == 3)
    {
        opts.setInputFile(cmdl[2]);
    }

    return opts;
}

void treeCommand(argh::parser &cmdl)
{
    SylvaOptions opts = collectOptions(cmdl);
    std::cout << printTree(treeInput(opts), opts.getStyle()) << std::endl;
}

void outlineCommand(argh::parser &cmdl)
{
    SylvaOptions opts = collectOptions(cmdl);
    std::cout << printTree(expressionInput(opts), opts.getStyle()) << std::endl;
}

void exprCommand(argh::parser &cmdl)
{
    SylvaOptions opts = collectOptions(cmdl);
    std::cout << printExpression(expressionInput(opts)) << std::endl;
}

void evalCommand(argh::parser &cmdl)
{
    SylvaOptions opts = collectOptions(cmdl);
    std::cout << evaluate(expressionInput(opts)) << std::endl;
}

void helpCommand()
{
    std::cout << "Usage: sylva [command] [<input_file.json>] [options]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  tree            Print a tree as a folder diagram." << std::endl;
    std::cout << "  outline         Print the structure of an expression tree." << std::endl;
    std::cout << "  expr            Print an expression in infix form." << std::endl;
    std::cout << "  eval            Evaluate an expression." << std::endl;
    std::cout << "  help            Display this help message." << std::endl;
    std::cout << "  version         Display the program version." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --style=<tree|indent|bullet>  Layout of tree and outline output." << std::endl;
}

void versionCommand()
{
    std::cout << "Sylva v" << SYLVA_VERSION << std::endl;
}

TreeElement sampleTree()
{
    return Node("Scene",
                Node("Robot",
                     Node("Flange", Node("Gripper", Leaf("Object"))),
                     Leaf("Camera")),
                Node("Table", Leaf("Box")));
}

Expression sampleExpression()
{
    return Add(Integer(2), Divide(Multiply(Float(5.0), Negative(Integer(3))), Float(10.0)));
}
