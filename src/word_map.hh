#ifndef WORD_MAP_H_
#define WORD_MAP_H_

#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "global.hh"

#define WORD_MAP_NOT_FOUND -1
#define WORD_MAP_EPSILON "<eps>"

/** Bidirectional mapping between symbol strings and the integer labels
 * used on automaton arcs. Files hold one "word id" pair per line, which
 * is the format of both word maps and nonterminal maps (ntmap).
 * Id 0 is always bound to epsilon.
 */
class WordMap {
 public:
  WordMap();
  virtual ~WordMap();
  symbol_t addWord(const std::string& word);
  void setWord(symbol_t word_id, const std::string& word);
  std::string getWord(symbol_t word_id) const;
  bool containsWord(const std::string& word) const;
  bool containsId(symbol_t word_id) const;
  symbol_t getId(const std::string& word) const;
  std::string getWords(const std::vector<symbol_t>& ids) const;
  bool read(const std::string& fn);
  void print(std::ostream& os) const;
  size_t size() const;
  void clear();

 private:
  std::unordered_map<std::string, symbol_t> word_map_;
  std::unordered_map<symbol_t, std::string> id_map_;
  symbol_t next_id_;
};

#endif /* WORD_MAP_H_ */
