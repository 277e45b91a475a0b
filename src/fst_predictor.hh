#ifndef FST_PREDICTOR_H_
#define FST_PREDICTOR_H_

#include <memory>
#include <vector>

#include "automaton_store.hh"
#include "predictor.hh"
#include "weighted_automaton.hh"

/**
 * Predictor for deterministic lattices. The state is the single current
 * node, which is unique because at most one arc per label leaves a node.
 */
class FstPredictor : public Predictor {
 public:
  explicit FstPredictor(const PredictorOptions& options);
  virtual ~FstPredictor();

  virtual void initialize(size_t sen_id);
  virtual Posterior predictNext();
  virtual score_t consume(symbol_t word);
  virtual PredictorState getState() const;
  virtual void setState(const PredictorState& state);
  virtual score_t getUnkProbability(const Posterior& posterior) const;
  virtual void initializeHeuristic();
  virtual score_t estimateFutureCost(const std::vector<symbol_t>& hypothesis);

  bool isValid() const {
    return cur_node_ != NO_STATE;
  }

 private:
  AutomatonStore store_;
  std::unique_ptr<WeightedAutomaton> automaton_;
  state_id_t cur_node_;
  score_t bos_score_;
  bool heuristic_ready_;
};

#endif /* FST_PREDICTOR_H_ */
