#ifndef NFST_PREDICTOR_H_
#define NFST_PREDICTOR_H_

#include <map>
#include <memory>
#include <vector>

#include "automaton_store.hh"
#include "predictor.hh"
#include "weighted_automaton.hh"

/**
 * Predictor for non-deterministic lattices. Keeps the set of nodes
 * reachable from the start node through the consumed symbols, together
 * with the best accumulated score relative to the last consumed symbol.
 *
 * The set is epsilon closed: every member has at least one non-epsilon
 * arc. Nodes with only epsilon arcs are passed through but not kept.
 */
class NfstPredictor : public Predictor {
 public:
  explicit NfstPredictor(const PredictorOptions& options);
  virtual ~NfstPredictor();

  virtual void initialize(size_t sen_id);
  virtual Posterior predictNext();
  virtual score_t consume(symbol_t word);
  virtual PredictorState getState() const;
  virtual void setState(const PredictorState& state);
  // compares node ids only
  virtual bool isEqual(const PredictorState& state1,
                       const PredictorState& state2) const;
  virtual void initializeHeuristic();
  virtual score_t estimateFutureCost(const std::vector<symbol_t>& hypothesis);

  // breadth-first epsilon closure, sorted by node id
  std::vector<WeightedState> followEpsilons(
      const std::map<state_id_t, score_t>& roots) const;

  const std::vector<WeightedState>& getNodes() const {
    return cur_nodes_;
  }

 private:
  AutomatonStore store_;
  std::unique_ptr<WeightedAutomaton> automaton_;
  std::vector<WeightedState> cur_nodes_;
  bool heuristic_ready_;
};

#endif /* NFST_PREDICTOR_H_ */
