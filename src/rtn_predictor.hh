#ifndef RTN_PREDICTOR_H_
#define RTN_PREDICTOR_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "automaton_store.hh"
#include "predictor.hh"
#include "weighted_automaton.hh"

/**
 * Predictor for recursive transition networks as written by hierarchical
 * decoders: a root automaton per sentence whose arcs may carry
 * nonterminal labels referring to sub-automata in <base>/<index>/.
 *
 * Nonterminals are expanded lazily, only as far as needed to score the
 * next symbol after the current history. Substitution renumbers states,
 * so the state of this predictor is the consumed history only and the
 * active nodes are searched again on every predictNext().
 */
class RtnPredictor : public Predictor {
 public:
  explicit RtnPredictor(const PredictorOptions& options);
  virtual ~RtnPredictor();

  virtual void initialize(size_t sen_id);
  virtual Posterior predictNext();
  // appends to the history
  virtual score_t consume(symbol_t word);
  virtual PredictorState getState() const;
  virtual void setState(const PredictorState& state);

  // Repeats expansion passes until no nonterminal is reachable through
  // the history. Fills scores from the last pass and returns the number
  // of nonterminal arcs replaced.
  size_t expand(Posterior* scores);
  // one scan over the automaton followed by substitution
  size_t expansionPass(Posterior* scores);

  symbol_t getStartNonterminal() const {
    return start_nt_;
  }
  const std::string& getRootPrefix() const {
    return root_prefix_;
  }
  const std::vector<symbol_t>& getHistory() const {
    return history_;
  }
  const WeightedAutomaton* getAutomaton() const {
    return automaton_.get();
  }

 private:
  // source state -> positions of nonterminal arcs to replace
  typedef std::map<state_id_t, std::set<size_t>> NtArcMap;

  struct ScanContext {
    Posterior* scores;
    // visited nodes per number of consumed history symbols
    std::vector<std::set<state_id_t>> visited;
    NtArcMap nt_arcs;
  };

  void readNtMap();
  void scan(state_id_t node, score_t acc_score, size_t history_pos,
            ScanContext* ctx) const;
  size_t substitute(const NtArcMap& nt_arcs);
  void optimize();

  AutomatonStore store_;
  std::unique_ptr<WeightedAutomaton> automaton_;
  std::vector<symbol_t> history_;
  symbol_t start_nt_;
  std::string root_prefix_;
  bool needs_optimization_;
};

#endif /* RTN_PREDICTOR_H_ */
