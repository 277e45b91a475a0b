#ifndef AUTOMATON_READER_H_
#define AUTOMATON_READER_H_

#include <istream>
#include <string>

#include "global.hh"
#include "weighted_automaton.hh"

// Converts an arc or final weight field to a tropical cost. The field is
// either a scalar or a sparse tuple "d,k1,v1,k2,v2,..." with default d.
// weight_key > 0 selects one key, 0 sums all explicit keys.
bool parseWeight(const std::string& field, int weight_key, score_t* cost);

// Text automaton, one record per line; the source of the first line is
// the start state. Returns NULL on malformed input.
WeightedAutomaton* readTextAutomaton(std::istream& is, const std::string& name,
                                     int weight_key);

// Detects binary OpenFst files by their magic number, otherwise reads
// text. Returns NULL and logs if the file is missing or malformed.
WeightedAutomaton* readAutomaton(const std::string& fn, int weight_key);

#endif /* AUTOMATON_READER_H_ */
