#include "draw.hpp"

#include <algorithm>
#include <drag/drag.hpp>
#include <drag/drawing/draw.hpp>
#include <drag/types.hpp>
#include <unordered_map>
#include <vector>

namespace nfa {

void drawAutomaton(const Automaton &automaton, const std::string &file_name) {
  drag::graph g;
  std::unordered_map<State, drag::vertex_t, boost::hash<State>> node_map;

  drag::drawing_options opts;

  // Add states
  for (const State &state : automaton.getStates()) {
    drag::vertex_t graph_node = g.add_node();
    node_map[state] = graph_node;
    opts.labels[graph_node] = automaton.getStateString(state);
  }

  std::vector<TransitionKey> keys;
  for (const auto &[key, _] : automaton.getTransitionRelation())
    keys.push_back(key);
  std::sort(keys.begin(), keys.end());

  // Add a labelled vertex per transition key, then its edges
  for (const TransitionKey &key : keys) {
    drag::vertex_t label_node = g.add_node();
    opts.labels[label_node] = automaton.getLabelString(key.label);

    const char *color = key.label.kind == EPSILON ? "red" : "blue";

    drag::vertex_t from = node_map[key.from];
    g.add_edge(from, label_node);
    opts.edge_colors[{from, label_node}] = color;

    for (const State &to : automaton.getTransitionRelation().at(key)) {
      g.add_edge(label_node, node_map[to]);
      opts.edge_colors[{label_node, node_map[to]}] = color;
    }
  }

  opts.labels[node_map[automaton.getStartState()]].insert(0, "> ");

  drag::sugiyama_layout layout(g);

  auto image = drag::draw_svg_image(layout, opts);
  image.save(file_name);
}

} // namespace nfa
