#ifndef CONFIG_OPTIONS_H_
#define CONFIG_OPTIONS_H_

#include <string>

#include "global.hh"

// ids of the explicit sentence markers, epsilon is always 0
struct SymbolIndexing {
  SymbolIndexing() : bos_id(1), eos_id(2), unk_id(3) {}
  symbol_t bos_id;
  symbol_t eos_id;
  symbol_t unk_id;
};

struct PredictorOptions {
  PredictorOptions()
      : use_weights(true),
        normalize_scores(false),
        skip_bos_weight(true),
        to_log(true),
        rmeps(true),
        minimize_rtns(false),
        weight_key(0),
        start_nonterminal("S"),
        max_expansion_passes(10000) {}

  // file pattern (with %d) or directory of the automata
  std::string fst_path;
  // if false, every reachable symbol scores 0
  bool use_weights;
  // renormalize the posterior in probability space
  bool normalize_scores;
  // fst: add the <s> weight to </s> if false
  // nfst: keep the <s> weight in the frontier if false
  bool skip_bos_weight;
  // flip arc costs to log probabilities
  bool to_log;
  // rtn only
  bool rmeps;
  bool minimize_rtns;
  // key into sparse tuple weights, 0 sums all keys
  int weight_key;
  std::string start_nonterminal;
  size_t max_expansion_passes;
  SymbolIndexing indexing;
};

#endif /* CONFIG_OPTIONS_H_ */
