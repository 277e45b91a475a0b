#include "nfst_predictor.hh"

#include <algorithm>

#include <glog/logging.h>

#include "misc.hh"

namespace {

std::vector<state_id_t> sortedNodeIds(const PredictorState& state) {
  std::vector<state_id_t> ids;
  ids.reserve(state.nodes.size());
  for (const WeightedState& node : state.nodes) ids.push_back(node.state);
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace

NfstPredictor::NfstPredictor(const PredictorOptions& options)
    : Predictor(options),
      store_(options.fst_path, options.weight_key),
      heuristic_ready_(false) {}

NfstPredictor::~NfstPredictor() {}

void NfstPredictor::initialize(size_t sen_id) {
  current_sen_id_ = sen_id;
  heuristic_ready_ = false;
  cur_nodes_.clear();
  automaton_.reset(store_.loadSentence(sen_id));
  if (automaton_ && automaton_->start() != NO_STATE) {
    automaton_->sortArcs();
    std::map<state_id_t, score_t> roots;
    roots[automaton_->start()] = 0.0;
    cur_nodes_ = followEpsilons(roots);
  }
  consume(options_.indexing.bos_id);
  if (cur_nodes_.empty()) {
    LOG(WARNING) << "The lattice for sentence " << sen_id + 1
                 << " does not contain any valid path. Please double-check "
                 << "that the lattice is not empty and that paths start "
                 << "with the begin-of-sentence symbol.";
  }
}

Posterior NfstPredictor::predictNext() {
  Posterior scores;
  for (const WeightedState& node : cur_nodes_) {
    for (fst::ArcIterator<WeightedAutomaton::Fst> aiter(automaton_->getFst(),
                                                        node.state);
         !aiter.Done(); aiter.Next()) {
      const WeightedAutomaton::Arc& arc = aiter.Value();
      if (arc.olabel == EPSILON_ID) continue;
      score_t score = node.weight + toScore(WeightedAutomaton::cost(arc));
      auto it = scores.find(arc.olabel);
      if (it == scores.end()) {
        scores[arc.olabel] = score;
      } else {
        it->second = better(it->second, score);
      }
    }
  }
  return finalizePosterior(scores);
}

score_t NfstPredictor::consume(symbol_t word) {
  if (cur_nodes_.empty()) return 0.0;
  std::map<state_id_t, score_t> unconsumed;
  for (const WeightedState& node : cur_nodes_) {
    for (fst::ArcIterator<WeightedAutomaton::Fst> aiter(automaton_->getFst(),
                                                        node.state);
         !aiter.Done(); aiter.Next()) {
      const WeightedAutomaton::Arc& arc = aiter.Value();
      if (automaton_->isSorted() && arc.olabel > word) break;
      if (arc.olabel != word) continue;
      score_t score = node.weight + toScore(WeightedAutomaton::cost(arc));
      auto it = unconsumed.find(arc.nextstate);
      if (it == unconsumed.end()) {
        unconsumed[arc.nextstate] = score;
      } else {
        it->second = better(it->second, score);
      }
    }
  }
  if (unconsumed.empty()) {
    VLOG(1) << "no arc for " << word << ", nfst predictor is invalid for "
            << "sentence " << current_sen_id_ + 1;
    cur_nodes_.clear();
    return 0.0;
  }
  score_t best = worst();
  for (const auto& entry : unconsumed) best = better(best, entry.second);
  // the new frontier is relative to the score of the consumed symbol
  score_t consumed_score = best;
  if (word == options_.indexing.bos_id && !options_.skip_bos_weight) {
    consumed_score = 0.0;
  }
  for (auto& entry : unconsumed) entry.second -= consumed_score;
  cur_nodes_ = followEpsilons(unconsumed);
  return best;
}

std::vector<WeightedState> NfstPredictor::followEpsilons(
    const std::map<state_id_t, score_t>& roots) const {
  std::map<state_id_t, score_t> open_nodes(roots);
  std::map<state_id_t, score_t> visited(roots);
  std::map<state_id_t, score_t> closed;
  while (!open_nodes.empty()) {
    std::map<state_id_t, score_t> next_open;
    for (const auto& entry : open_nodes) {
      bool has_noneps = false;
      for (fst::ArcIterator<WeightedAutomaton::Fst> aiter(
               automaton_->getFst(), entry.first);
           !aiter.Done(); aiter.Next()) {
        const WeightedAutomaton::Arc& arc = aiter.Value();
        if (arc.olabel != EPSILON_ID) {
          has_noneps = true;
          continue;
        }
        score_t score = entry.second + toScore(WeightedAutomaton::cost(arc));
        auto it = visited.find(arc.nextstate);
        if (it == visited.end() || better(it->second, score) != it->second) {
          visited[arc.nextstate] = score;
          next_open[arc.nextstate] = score;
        }
      }
      if (has_noneps) closed[entry.first] = entry.second;
    }
    open_nodes.swap(next_open);
  }
  std::vector<WeightedState> nodes;
  nodes.reserve(closed.size());
  for (const auto& entry : closed) {
    nodes.push_back(WeightedState(entry.second, entry.first));
  }
  return nodes;
}

PredictorState NfstPredictor::getState() const {
  return PredictorState::fromNodes(cur_nodes_);
}

void NfstPredictor::setState(const PredictorState& state) {
  CHECK_EQ(state.kind, PredictorState::NODE_SET);
  cur_nodes_ = state.nodes;
}

bool NfstPredictor::isEqual(const PredictorState& state1,
                            const PredictorState& state2) const {
  return sortedNodeIds(state1) == sortedNodeIds(state2);
}

void NfstPredictor::initializeHeuristic() {
  if (!automaton_) return;
  automaton_->shortestDistances();
  heuristic_ready_ = true;
}

score_t NfstPredictor::estimateFutureCost(
    const std::vector<symbol_t>& hypothesis) {
  if (!heuristic_ready_ || hypothesis.empty()) return 0.0;
  symbol_t last_word = hypothesis.back();
  bool found = false;
  score_t best = POS_INF;
  for (const WeightedState& node : cur_nodes_) {
    WeightedAutomaton::Arc arc;
    if (automaton_->findArc(node.state, last_word, &arc)) {
      best = std::min(best, automaton_->distanceToFinal(arc.nextstate));
      found = true;
    }
  }
  return found ? best : 0.0;
}
