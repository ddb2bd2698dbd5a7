#ifndef SYLVA_CLI_HPP
#define SYLVA_CLI_HPP

#include <argh.h>
#include "model/expression.hpp"
#include "model/tree.hpp"
#include "options.hpp"

// Registers the options that take a value, so `-s bullet` and
// `--style bullet` work as well as `--style=bullet`.
void parseArguments(argh::parser &cmdl, int argc, const char *const argv[]);
SylvaOptions collectOptions(argh::parser &cmdl);

void treeCommand(argh::parser &cmdl);
void outlineCommand(argh::parser &cmdl);
void exprCommand(argh::parser &cmdl);
void evalCommand(argh::parser &cmdl);
void helpCommand();
void versionCommand();

// Trees used when no input file is given.
sylva::TreeElement sampleTree();
sylva::Expression sampleExpression();

#endif // SYLVA_CLI_HPP
