#ifndef AUTOMATON_STORE_H_
#define AUTOMATON_STORE_H_

#include <map>
#include <memory>
#include <string>

#include "global.hh"
#include "weighted_automaton.hh"

/**
 * Resolves automaton file names for a sentence and loads them. Sentence
 * indices passed in are 0-based, file names use 1-based indices.
 *
 * Sub-automata of a recursive transition network are cached per sentence
 * until clearCache() (called by the predictors at initialize).
 */
class AutomatonStore {
 public:
  AutomatonStore(const std::string& base_path, int weight_key);
  virtual ~AutomatonStore();

  // <base> with %d substituted, or <base>/<index>.fst
  std::string sentencePath(size_t sen_id) const;
  // <base>/<index>
  std::string sentenceDir(size_t sen_id) const;
  std::string subAutomatonPath(size_t sen_id, symbol_t nt_label) const;

  // NULL if missing or unreadable, caller owns the result
  WeightedAutomaton* loadSentence(size_t sen_id) const;
  WeightedAutomaton* loadFile(const std::string& fn) const;

  // <base>/<index>.fst, or the last of <base>/<index>/<prefix>*.fst
  // Returns an empty string if there is no candidate.
  std::string findRoot(size_t sen_id, const std::string& prefix) const;

  // cached, NULL if unreadable (failures are cached too)
  const WeightedAutomaton* subAutomaton(size_t sen_id, symbol_t nt_label);
  size_t numCached() const {
    return sub_automata_.size();
  }
  void clearCache();

  const std::string& getBasePath() const {
    return base_path_;
  }

 private:
  std::string base_path_;
  int weight_key_;
  std::map<symbol_t, std::unique_ptr<WeightedAutomaton>> sub_automata_;
};

#endif /* AUTOMATON_STORE_H_ */
