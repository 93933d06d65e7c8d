#include "Printer.hpp"

#include <algorithm>
#include <iomanip>

Printer::Printer(std::ostream &stream)
: mStream(stream)
{
}

void Printer::printGenerate(const GenerateReport &report, bool showStates, bool showSets)
{
    printGrammar(report);
    if(showStates) {
        printStates(report);
    }
    if(showSets) {
        printSets(report);
    }
    printTable(report);
    printConflicts(report);
}

void Printer::printGrammar(const GenerateReport &report)
{
    mStream << "Augmented grammar:" << std::endl;
    for(unsigned int i=0; i<report.augmentedGrammar.size(); i++) {
        mStream << "  " << i << ": " << report.augmentedGrammar[i] << std::endl;
    }
    mStream << std::endl;
}

void Printer::printStates(const GenerateReport &report)
{
    for(const auto &state : report.states) {
        mStream << "State " << state.id << ":" << std::endl;
        for(const std::string &item : state.items) {
            mStream << "  " << item << std::endl;
        }
        for(const auto &transition : report.transitions) {
            if(transition.from == state.id) {
                mStream << "    " << transition.symbol << " -> " << transition.to << std::endl;
            }
        }
        mStream << std::endl;
    }
}

void Printer::printTable(const GenerateReport &report)
{
    std::vector<std::string> nonterminals;
    for(const std::string &nonterminal : report.nonterminals) {
        // The synthetic start symbol never has a GOTO entry.
        if(nonterminal != report.nonterminals.front()) {
            nonterminals.push_back(nonterminal);
        }
    }

    size_t width = 6;
    for(const std::string &terminal : report.terminals) {
        width = std::max(width, terminal.size() + 2);
    }
    for(const std::string &nonterminal : nonterminals) {
        width = std::max(width, nonterminal.size() + 2);
    }

    mStream << std::left << std::setw(7) << "State";
    for(const std::string &terminal : report.terminals) {
        mStream << std::setw((int)width) << terminal;
    }
    mStream << "| ";
    for(const std::string &nonterminal : nonterminals) {
        mStream << std::setw((int)width) << nonterminal;
    }
    mStream << std::endl;

    for(unsigned int i=0; i<report.numStates; i++) {
        mStream << std::setw(7) << i;

        auto actions = report.actionTable.find(i);
        for(const std::string &terminal : report.terminals) {
            std::string cell;
            if(actions != report.actionTable.end()) {
                auto it = actions->second.find(terminal);
                if(it != actions->second.end()) {
                    cell = it->second;
                }
            }
            mStream << std::setw((int)width) << cell;
        }
        mStream << "| ";

        auto gotos = report.gotoTable.find(i);
        for(const std::string &nonterminal : nonterminals) {
            std::string cell;
            if(gotos != report.gotoTable.end()) {
                auto it = gotos->second.find(nonterminal);
                if(it != gotos->second.end()) {
                    cell = std::to_string(it->second);
                }
            }
            mStream << std::setw((int)width) << cell;
        }
        mStream << std::endl;
    }
    mStream << std::right << std::endl;
}

void Printer::printConflicts(const GenerateReport &report)
{
    const char *name = Lrkit::parserTypeName(report.parserType);
    if(report.valid) {
        mStream << "Grammar is " << name << " (" << report.numStates << " states, no conflicts)" << std::endl;
        return;
    }

    mStream << "Grammar is not " << name << " (" << report.numStates << " states)" << std::endl;
    for(const auto &conflict : report.shiftReduceConflicts) {
        mStream << "  Shift/Reduce in state " << conflict.state << " on " << conflict.symbol
                << ": " << conflict.kept << " kept, " << conflict.discarded << " discarded" << std::endl;
    }
    for(const auto &conflict : report.reduceReduceConflicts) {
        mStream << "  Reduce/Reduce in state " << conflict.state << " on " << conflict.symbol
                << ": " << conflict.kept << " kept, " << conflict.discarded << " discarded" << std::endl;
    }
}

void Printer::printSets(const GenerateReport &report)
{
    if(!report.firstSets || !report.followSets) {
        return;
    }

    auto printSet = [&](const char *label, const std::string &symbol, const std::vector<std::string> &set) {
        mStream << "  " << label << "(" << symbol << ") = { ";
        for(unsigned int i=0; i<set.size(); i++) {
            mStream << (i > 0 ? ", " : "") << set[i];
        }
        mStream << " }" << std::endl;
    };

    mStream << "FIRST sets:" << std::endl;
    for(const auto &entry : *report.firstSets) {
        printSet("FIRST", entry.first, entry.second);
    }
    mStream << "FOLLOW sets:" << std::endl;
    for(const auto &entry : *report.followSets) {
        printSet("FOLLOW", entry.first, entry.second);
    }
    mStream << std::endl;
}

void Printer::printSteps(const std::vector<Lrkit::Step> &steps)
{
    for(const Lrkit::Step &step : steps) {
        std::string stack;
        for(unsigned int i=0; i<step.states.size(); i++) {
            if(i > 0) {
                stack += " " + step.symbols[i - 1] + " ";
            }
            stack += std::to_string(step.states[i]);
        }

        std::string input;
        for(const std::string &token : step.input) {
            input += (input.empty() ? "" : " ") + token;
        }

        mStream << std::right << std::setw(4) << step.index << "  "
                << std::left << std::setw(30) << stack << " "
                << std::setw(20) << input << " "
                << step.message << std::right << std::endl;
    }
}

void Printer::printTree(const Lrkit::ParseNode &node)
{
    printTreeNode(node, "", true, true);
}

void Printer::printTreeNode(const Lrkit::ParseNode &node, const std::string &prefix, bool last, bool root)
{
    if(root) {
        mStream << node.symbol << std::endl;
    } else {
        mStream << prefix << (last ? "`-- " : "|-- ") << node.symbol << std::endl;
    }

    std::string childPrefix = root ? "" : prefix + (last ? "    " : "|   ");
    if(!node.isTerminal() && node.children.empty()) {
        mStream << childPrefix << "`-- " << Lrkit::Grammar::kEpsilon << std::endl;
        return;
    }

    for(unsigned int i=0; i<node.children.size(); i++) {
        printTreeNode(node.children[i], childPrefix, i + 1 == node.children.size(), false);
    }
}

void Printer::printParse(const ParseReport &report)
{
    printSteps(report.steps);
    if(report.accepted) {
        mStream << "Accepted" << std::endl;
        if(report.tree) {
            printTree(*report.tree);
        }
    } else {
        mStream << "Rejected: " << report.error << std::endl;
    }
}
