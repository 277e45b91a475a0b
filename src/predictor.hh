#ifndef PREDICTOR_H_
#define PREDICTOR_H_

#include <map>
#include <ostream>
#include <vector>

#include "config_options.hh"
#include "global.hh"

// next symbol -> score
typedef std::map<symbol_t, score_t> Posterior;

struct WeightedState {
  WeightedState() : weight(0.0), state(NO_STATE) {}
  WeightedState(score_t weight, state_id_t state)
      : weight(weight), state(state) {}
  bool operator==(const WeightedState& other) const {
    return weight == other.weight && state == other.state;
  }
  score_t weight;
  state_id_t state;
};

/**
 * Snapshot of a predictor's traversal position as handed out to the
 * search. Value type: copies never share data with the predictor.
 */
struct PredictorState {
  enum Kind { NODE, NODE_SET, HISTORY };

  PredictorState() : kind(NODE), node(NO_STATE) {}

  static PredictorState fromNode(state_id_t node);
  static PredictorState fromNodes(const std::vector<WeightedState>& nodes);
  static PredictorState fromHistory(const std::vector<symbol_t>& history);

  bool operator==(const PredictorState& other) const;
  bool operator!=(const PredictorState& other) const {
    return !(*this == other);
  }

  Kind kind;
  state_id_t node;
  std::vector<WeightedState> nodes;
  std::vector<symbol_t> history;
};

std::ostream& operator<<(std::ostream& os, const PredictorState& state);

/**
 * Incremental scoring interface driven by an external search. The search
 * calls initialize() once per sentence and then alternates predictNext()
 * and consume(), saving and restoring positions with getState() and
 * setState().
 */
class Predictor {
 public:
  explicit Predictor(const PredictorOptions& options);
  virtual ~Predictor();

  // sen_id is 0-based
  virtual void initialize(size_t sen_id) = 0;
  virtual Posterior predictNext() = 0;
  // returns the score of the traversed arc, 0 if there is none
  virtual score_t consume(symbol_t word) = 0;
  virtual PredictorState getState() const = 0;
  virtual void setState(const PredictorState& state) = 0;

  virtual bool isEqual(const PredictorState& state1,
                       const PredictorState& state2) const;
  // symbols outside the automaton are impossible by default
  virtual score_t getUnkProbability(const Posterior& posterior) const;
  virtual void initializeHeuristic();
  virtual score_t estimateFutureCost(const std::vector<symbol_t>& hypothesis);

  size_t getCurrentSentence() const {
    return current_sen_id_;
  }
  const PredictorOptions& getOptions() const {
    return options_;
  }

 protected:
  // weights-off and normalization shared by all predictors
  Posterior finalizePosterior(const Posterior& scores) const;

  // cost -> score
  score_t toScore(score_t cost) const {
    return weight_factor_ * cost;
  }
  // the better of two scores, max in log domain and min in cost domain
  score_t better(score_t a, score_t b) const {
    if (options_.to_log) return a > b ? a : b;
    return a < b ? a : b;
  }
  score_t worst() const {
    return options_.to_log ? NEG_INF : POS_INF;
  }

  PredictorOptions options_;
  size_t current_sen_id_;

 private:
  score_t weight_factor_;
};

#endif /* PREDICTOR_H_ */
