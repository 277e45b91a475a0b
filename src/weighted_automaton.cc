#include "weighted_automaton.hh"

#include <glog/logging.h>

#include "misc.hh"

WeightedAutomaton::WeightedAutomaton(Fst* fst)
    : fst_(fst), sorted_(false), distances_valid_(false) {
  CHECK(fst != NULL);
}

WeightedAutomaton::~WeightedAutomaton() {}

state_id_t WeightedAutomaton::start() const {
  return fst_->Start() == fst::kNoStateId ? NO_STATE : fst_->Start();
}

size_t WeightedAutomaton::numStates() const {
  return fst_->NumStates();
}

bool WeightedAutomaton::hasState(state_id_t state) const {
  return state >= 0 && state < fst_->NumStates();
}

bool WeightedAutomaton::isFinal(state_id_t state) const {
  return hasState(state) && fst_->Final(state) != fst::TropicalWeight::Zero();
}

score_t WeightedAutomaton::finalCost(state_id_t state) const {
  if (!hasState(state)) return POS_INF;
  return fst_->Final(state).Value();
}

void WeightedAutomaton::sortArcs() {
  if (sorted_) return;
  fst::ArcSort(fst_.get(), fst::OLabelCompare<Arc>());
  sorted_ = true;
}

void WeightedAutomaton::invalidate() {
  sorted_ = false;
  distances_valid_ = false;
  distances_.clear();
}

bool WeightedAutomaton::findArc(state_id_t state, symbol_t label,
                                Arc* arc) const {
  if (!hasState(state)) return false;
  for (fst::ArcIterator<Fst> aiter(*fst_, state); !aiter.Done();
       aiter.Next()) {
    const Arc& candidate = aiter.Value();
    if (candidate.olabel == label) {
      *arc = candidate;
      return true;
    }
    if (sorted_ && candidate.olabel > label) break;
  }
  return false;
}

const std::vector<score_t>& WeightedAutomaton::shortestDistances() {
  if (distances_valid_) return distances_;
  misc::ProcessStopWatch sw;
  std::vector<fst::TropicalWeight> distances;
  fst::ShortestDistance(*fst_, &distances, true);
  distances_.resize(distances.size());
  for (size_t i = 0; i < distances.size(); ++i) {
    distances_[i] = distances[i].Value();
  }
  distances_valid_ = true;
  sw.store();
  VLOG(1) << "computed shortest distances for " << distances_.size()
          << " states in " << sw.report();
  return distances_;
}

score_t WeightedAutomaton::distanceToFinal(state_id_t state) {
  const std::vector<score_t>& distances = shortestDistances();
  if (state < 0 || static_cast<size_t>(state) >= distances.size()) {
    return POS_INF;
  }
  return distances[state];
}
