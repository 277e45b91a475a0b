#ifndef WEIGHTED_AUTOMATON_H_
#define WEIGHTED_AUTOMATON_H_

#include <memory>
#include <vector>

#include <fst/fstlib.h>

#include "global.hh"

/**
 * In-memory weighted automaton backing the lattice predictors. Arc
 * weights are tropical costs. Output labels are used for matching.
 */
class WeightedAutomaton {
 public:
  typedef fst::StdArc Arc;
  typedef fst::StdVectorFst Fst;

  // takes ownership of fst
  explicit WeightedAutomaton(Fst* fst);
  virtual ~WeightedAutomaton();

  state_id_t start() const;
  size_t numStates() const;
  bool hasState(state_id_t state) const;
  bool isFinal(state_id_t state) const;
  score_t finalCost(state_id_t state) const;

  // sort outgoing arcs of every state by output label
  void sortArcs();
  bool isSorted() const {
    return sorted_;
  }
  // call after mutating getMutableFst()
  void invalidate();

  // first arc from state with output label, stops early if sorted
  bool findArc(state_id_t state, symbol_t label, Arc* arc) const;

  // cost of the best path from every state to a final state, cached
  const std::vector<score_t>& shortestDistances();
  score_t distanceToFinal(state_id_t state);

  const Fst& getFst() const {
    return *fst_;
  }
  Fst* getMutableFst() {
    return fst_.get();
  }

  static score_t cost(const Arc& arc) {
    return arc.weight.Value();
  }

 private:
  std::unique_ptr<Fst> fst_;
  bool sorted_;
  bool distances_valid_;
  std::vector<score_t> distances_;
};

#endif /* WEIGHTED_AUTOMATON_H_ */
