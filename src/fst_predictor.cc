#include "fst_predictor.hh"

#include <glog/logging.h>

#include "misc.hh"

FstPredictor::FstPredictor(const PredictorOptions& options)
    : Predictor(options),
      store_(options.fst_path, options.weight_key),
      cur_node_(NO_STATE),
      bos_score_(0.0),
      heuristic_ready_(false) {}

FstPredictor::~FstPredictor() {}

void FstPredictor::initialize(size_t sen_id) {
  current_sen_id_ = sen_id;
  heuristic_ready_ = false;
  automaton_.reset(store_.loadSentence(sen_id));
  if (automaton_) automaton_->sortArcs();
  cur_node_ = automaton_ ? automaton_->start() : NO_STATE;
  bos_score_ = consume(options_.indexing.bos_id);
  if (cur_node_ == NO_STATE) {
    LOG(WARNING) << "The lattice for sentence " << sen_id + 1
                 << " does not contain any valid path. Please double-check "
                 << "that the lattice is not empty and that paths contain "
                 << "the begin-of-sentence symbol "
                 << options_.indexing.bos_id << ".";
  }
}

Posterior FstPredictor::predictNext() {
  Posterior scores;
  if (cur_node_ == NO_STATE) return scores;
  for (fst::ArcIterator<WeightedAutomaton::Fst> aiter(automaton_->getFst(),
                                                      cur_node_);
       !aiter.Done(); aiter.Next()) {
    const WeightedAutomaton::Arc& arc = aiter.Value();
    if (arc.olabel == EPSILON_ID) continue;
    scores[arc.olabel] = toScore(WeightedAutomaton::cost(arc));
  }
  auto eos = scores.find(options_.indexing.eos_id);
  if (eos != scores.end() && !options_.skip_bos_weight) {
    eos->second += bos_score_;
  }
  return finalizePosterior(scores);
}

score_t FstPredictor::consume(symbol_t word) {
  if (cur_node_ == NO_STATE) return 0.0;
  WeightedAutomaton::Arc arc;
  if (automaton_->findArc(cur_node_, word, &arc)) {
    cur_node_ = arc.nextstate;
    return toScore(WeightedAutomaton::cost(arc));
  }
  if (automaton_->findArc(cur_node_, options_.indexing.unk_id, &arc)) {
    cur_node_ = arc.nextstate;
    return 0.0;
  }
  VLOG(1) << "no arc for " << word << " at node " << cur_node_
          << ", fst predictor is invalid for sentence "
          << current_sen_id_ + 1;
  cur_node_ = NO_STATE;
  return 0.0;
}

PredictorState FstPredictor::getState() const {
  return PredictorState::fromNode(cur_node_);
}

void FstPredictor::setState(const PredictorState& state) {
  CHECK_EQ(state.kind, PredictorState::NODE);
  cur_node_ = state.node;
}

score_t FstPredictor::getUnkProbability(const Posterior& posterior) const {
  return misc::GetDefault(posterior, options_.indexing.unk_id, NEG_INF);
}

void FstPredictor::initializeHeuristic() {
  if (!automaton_) return;
  automaton_->shortestDistances();
  heuristic_ready_ = true;
}

score_t FstPredictor::estimateFutureCost(
    const std::vector<symbol_t>& hypothesis) {
  if (!heuristic_ready_ || cur_node_ == NO_STATE || hypothesis.empty()) {
    return 0.0;
  }
  WeightedAutomaton::Arc arc;
  if (automaton_->findArc(cur_node_, hypothesis.back(), &arc)) {
    return automaton_->distanceToFinal(arc.nextstate);
  }
  return 0.0;
}
