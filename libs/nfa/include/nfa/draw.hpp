#ifndef __LINNET_NFA_DRAW__
#define __LINNET_NFA_DRAW__

#include <string>

#include "nfa.hpp"

namespace nfa {

// Saves the automaton as an SVG graph. Every (state, label) pair becomes a
// small vertex between the source state and its destinations.
void drawAutomaton(const Automaton &, const std::string &file_name);

} // namespace nfa

#endif
