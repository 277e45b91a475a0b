#include "predictor.hh"

#include <glog/logging.h>

#include "misc.hh"

PredictorState PredictorState::fromNode(state_id_t node) {
  PredictorState state;
  state.kind = NODE;
  state.node = node;
  return state;
}

PredictorState PredictorState::fromNodes(
    const std::vector<WeightedState>& nodes) {
  PredictorState state;
  state.kind = NODE_SET;
  state.nodes = nodes;
  return state;
}

PredictorState PredictorState::fromHistory(
    const std::vector<symbol_t>& history) {
  PredictorState state;
  state.kind = HISTORY;
  state.history = history;
  return state;
}

bool PredictorState::operator==(const PredictorState& other) const {
  if (kind != other.kind) return false;
  switch (kind) {
    case NODE:
      return node == other.node;
    case NODE_SET:
      return nodes == other.nodes;
    case HISTORY:
      return history == other.history;
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, const PredictorState& state) {
  switch (state.kind) {
    case PredictorState::NODE:
      os << "node " << state.node;
      break;
    case PredictorState::NODE_SET:
      os << "nodes {";
      for (size_t i = 0; i < state.nodes.size(); ++i) {
        if (i > 0) os << ", ";
        os << state.nodes[i].state << ":" << state.nodes[i].weight;
      }
      os << "}";
      break;
    case PredictorState::HISTORY:
      os << "history " << misc::ContainerToString(state.history);
      break;
  }
  return os;
}

Predictor::Predictor(const PredictorOptions& options)
    : options_(options),
      current_sen_id_(0),
      weight_factor_(options.to_log ? -1.0 : 1.0) {}

Predictor::~Predictor() {}

bool Predictor::isEqual(const PredictorState& state1,
                        const PredictorState& state2) const {
  return state1 == state2;
}

score_t Predictor::getUnkProbability(const Posterior& posterior) const {
  (void)posterior;
  return NEG_INF;
}

void Predictor::initializeHeuristic() {}

score_t Predictor::estimateFutureCost(
    const std::vector<symbol_t>& hypothesis) {
  (void)hypothesis;
  return 0.0;
}

Posterior Predictor::finalizePosterior(const Posterior& scores) const {
  if (scores.empty()) return scores;
  Posterior posterior(scores);
  if (!options_.use_weights) {
    for (auto& entry : posterior) entry.second = 0.0;
  }
  if (options_.normalize_scores) {
    score_t log_sum = NEG_INF;
    for (const auto& entry : posterior) {
      log_sum = misc::add_log_scores_0(log_sum, entry.second);
    }
    if (log_sum == NEG_INF) {
      LOG(WARNING) << "cannot normalize posterior without probability mass";
      return posterior;
    }
    for (auto& entry : posterior) entry.second -= log_sum;
  }
  return posterior;
}
