#ifndef GLOBAL_OPTIONS_HH
#define GLOBAL_OPTIONS_HH

#include <cstddef>
#include <limits>

typedef int symbol_t;
typedef int state_id_t;
typedef float score_t;

// OpenFst reserves label 0 for epsilon
const symbol_t EPSILON_ID = 0;
const state_id_t NO_STATE = -1;
const score_t NEG_INF = -std::numeric_limits<score_t>::infinity();
const score_t POS_INF = std::numeric_limits<score_t>::infinity();

// nonterminal labels have ten decimal digits and a leading 1
const symbol_t NT_LABEL_MIN = 1000000000;
const symbol_t NT_LABEL_MAX = 1999999999;

inline bool is_nt_label(symbol_t label) {
  return label >= NT_LABEL_MIN && label <= NT_LABEL_MAX;
}

#endif // GLOBAL_OPTIONS_HH
