#include "../include/shell/shell.hpp"
#include <LinnetUtil/LinnetUtil.hpp>
#include <grammar/grammar_parser.hpp>
#include <nfa/closure.hpp>
#include <nfa/draw.hpp>
#include <nfa/simulator.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

int main(int argc, char **argv) {
  std::optional<shell::Options> options = shell::parseArguments(argc, argv);
  if (!options.has_value()) {
    shell::printUsage(std::cerr, argv[0]);
    return 2;
  }
  if (options->help) {
    shell::printUsage(std::cout, argv[0]);
    return 0;
  }

  std::cout << "Regular Grammar to NFA Converter\n"
            << "--------------------------------" << std::endl;

  try {
    std::unique_ptr<grammar::GrammarDefinition> definition;
    if (options->grammar_file.has_value()) {
      grammar::GrammarParser g_parser(options->grammar_file.value());
      definition = g_parser.parseGrammar();
      shell::printDefinition(std::cout, definition->symbols);
    } else {
      definition = shell::promptGrammar(std::cin, std::cout);
    }

    nfa::Recognizer recognizer =
        nfa::compile(definition->symbols, definition->rules);
    shell::printAutomatonSummary(std::cout, recognizer.getAutomaton());

    if (options->print) {
      recognizer.getAutomaton().printAutomaton();
      recognizer.getClosures().printClosures(recognizer.getAutomaton());
    }

    if (options->draw_file.has_value()) {
      nfa::drawAutomaton(recognizer.getAutomaton(), options->draw_file.value());
      std::cout << "Saved automaton to " << options->draw_file.value()
                << std::endl;
    }

    shell::checkStrings(std::cin, std::cout, recognizer, options->trace);
  } catch (const LinnetException &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  std::cout << "\nExiting." << std::endl;
  return 0;
}
