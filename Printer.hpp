#ifndef PRINTER_HPP
#define PRINTER_HPP

#include "Service.hpp"

#include <ostream>

// Plain-text rendering of generate and parse reports.
class Printer
{
public:
    Printer(std::ostream &stream);

    void printGenerate(const GenerateReport &report, bool showStates, bool showSets);
    void printParse(const ParseReport &report);

    void printGrammar(const GenerateReport &report);
    void printStates(const GenerateReport &report);
    void printTable(const GenerateReport &report);
    void printConflicts(const GenerateReport &report);
    void printSets(const GenerateReport &report);
    void printSteps(const std::vector<Lrkit::Step> &steps);
    void printTree(const Lrkit::ParseNode &node);

private:
    void printTreeNode(const Lrkit::ParseNode &node, const std::string &prefix, bool last, bool root);

    std::ostream &mStream;
};

#endif
