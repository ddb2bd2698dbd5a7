#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "cli/cli.hpp"
#include "model/errors.hpp"
#include "util/util.hpp"

int main(int argc, char *argv[])
{
    argh::parser cmdl;
    parseArguments(cmdl, argc, argv);

    if (argc <= 1)
    {
        helpCommand();
        return 0;
    }

    std::string command = argv[1];
    try
    {
        if (command == "tree")
            treeCommand(cmdl);
        else if (command == "outline")
            outlineCommand(cmdl);
        else if (command == "expr")
            exprCommand(cmdl);
        else if (command == "eval")
            evalCommand(cmdl);
        else if (command == "version")
            versionCommand();
        else if (command == "help")
            helpCommand();
        else
        {
            std::cerr << "(Error) Unknown command '" << command << "'." << std::endl;
            return 1;
        }
    }
    catch (const sylva::DivisionByZeroError &error)
    {
        util::displayError(error.what());
        return 1;
    }
    catch (const sylva::ConstructionError &error)
    {
        util::displayError(std::string("Invalid tree: ") + error.what());
        return 1;
    }
    catch (const nlohmann::json::exception &error)
    {
        util::displayError(error.what());
        return 1;
    }
    catch (const std::runtime_error &error)
    {
        util::displayError(error.what());
        return 1;
    }

    return 0;
}
