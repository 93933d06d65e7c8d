#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "Lrkit/Errors.hpp"
#include "Printer.hpp"
#include "Service.hpp"

static const char *kUsage = " <grammar-file> [--lr0 | --slr1] [--input STR] [--trace] [--max-steps N] [--states] [--sets]";

static std::string readFile(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if(!file) {
        throw std::runtime_error("cannot open file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

static void printConflictError(const GrammarConflictError &e)
{
    std::cout << "Error: " << e.what() << std::endl;
    for(const auto &conflict : e.shiftReduceConflicts()) {
        std::cout << "  Shift/Reduce in state " << conflict.state << " on " << conflict.symbol << ": " << conflict.kept << " / " << conflict.discarded << std::endl;
    }
    for(const auto &conflict : e.reduceReduceConflicts()) {
        std::cout << "  Reduce/Reduce in state " << conflict.state << " on " << conflict.symbol << ": " << conflict.kept << " / " << conflict.discarded << std::endl;
    }
}

int main(int argc, char *argv[])
{
    if(argc < 2) {
        std::cerr << "Usage: " << argv[0] << kUsage << std::endl;
        return 2;
    }

    std::string grammarPath = argv[1];
    Lrkit::ParserType type = Lrkit::ParserType::LR0;
    std::string input;
    bool haveInput = false;
    bool trace = false;
    bool showStates = false;
    bool showSets = false;
    size_t maxSteps = 100000;

    for(int i=2; i<argc; i++) {
        std::string arg = argv[i];
        if(arg.compare(0, 2, "--") == 0 && Lrkit::parserTypeFromName(arg.substr(2), type)) {
            continue;
        } else if(arg == "--input" && i + 1 < argc) {
            haveInput = true;
            input = argv[++i];
        } else if(arg == "--max-steps" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                size_t end = 0;
                maxSteps = (size_t)std::stoull(value, &end);
                if(end != value.size()) {
                    throw std::invalid_argument(value);
                }
            } catch(const std::logic_error &) {
                std::cerr << "Invalid step limit: " << value << std::endl;
                return 2;
            }
        } else if(arg == "--trace") {
            trace = true;
        } else if(arg == "--states") {
            showStates = true;
        } else if(arg == "--sets") {
            showSets = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            std::cerr << "Usage: " << argv[0] << kUsage << std::endl;
            return 2;
        }
    }

    try {
        std::string grammarText = readFile(grammarPath);

        Service service(type);
        service.setMaxSteps(maxSteps);
        if(trace) {
            service.setTrace(&std::cerr);
        }

        Printer printer(std::cout);
        GenerateReport report = service.generate(grammarText);
        printer.printGenerate(report, showStates, showSets);

        if(haveInput) {
            ParseReport result = service.parse(grammarText, input);
            printer.printParse(result);
            return result.accepted ? 0 : 1;
        }

        while(true) {
            std::string line;
            std::cout << ": ";
            if(!std::getline(std::cin, line) || line.size() == 0) {
                break;
            }

            printer.printParse(service.parse(grammarText, line));
        }
    } catch(const Lrkit::InvalidGrammarError &e) {
        std::cout << "Error in grammar: " << e.what() << std::endl;
        return 1;
    } catch(const GrammarConflictError &e) {
        printConflictError(e);
        return 1;
    } catch(const Lrkit::InternalError &e) {
        std::cerr << "Internal error: " << e.what() << std::endl;
        return 3;
    } catch(const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
