#include "automaton_store.hh"

#include <boost/algorithm/string/replace.hpp>

#include <vector>

#include "automaton_reader.hh"
#include "misc.hh"

AutomatonStore::AutomatonStore(const std::string& base_path, int weight_key)
    : base_path_(base_path), weight_key_(weight_key) {}

AutomatonStore::~AutomatonStore() {}

std::string AutomatonStore::sentencePath(size_t sen_id) const {
  std::string index = std::to_string((unsigned long long)(sen_id + 1));
  if (base_path_.find("%d") != std::string::npos) {
    return boost::algorithm::replace_all_copy(base_path_, "%d", index);
  }
  return base_path_ + "/" + index + ".fst";
}

std::string AutomatonStore::sentenceDir(size_t sen_id) const {
  return base_path_ + "/" + std::to_string((unsigned long long)(sen_id + 1));
}

std::string AutomatonStore::subAutomatonPath(size_t sen_id,
                                             symbol_t nt_label) const {
  return sentenceDir(sen_id) + "/" + std::to_string((long long)nt_label) +
         ".fst";
}

WeightedAutomaton* AutomatonStore::loadSentence(size_t sen_id) const {
  return loadFile(sentencePath(sen_id));
}

WeightedAutomaton* AutomatonStore::loadFile(const std::string& fn) const {
  return readAutomaton(fn, weight_key_);
}

std::string AutomatonStore::findRoot(size_t sen_id,
                                     const std::string& prefix) const {
  std::string file_name = sentencePath(sen_id);
  if (misc::file_exists(file_name)) return file_name;
  std::string pattern = sentenceDir(sen_id) + "/" + prefix + "*.fst";
  std::vector<std::string> candidates = misc::glob_files(pattern);
  if (candidates.empty()) {
    LOG(ERROR) << "Could not find root fst in " << pattern;
    return "";
  }
  if (candidates.size() > 1) {
    LOG(WARNING) << "Ambiguous root fst for " << pattern
                 << ". Take the one with largest span.";
  }
  // glob_files returns sorted names
  return candidates.back();
}

const WeightedAutomaton* AutomatonStore::subAutomaton(size_t sen_id,
                                                      symbol_t nt_label) {
  auto it = sub_automata_.find(nt_label);
  if (it != sub_automata_.end()) return it->second.get();
  std::string fn = subAutomatonPath(sen_id, nt_label);
  WeightedAutomaton* automaton = loadFile(fn);
  if (automaton == NULL) {
    LOG(ERROR) << "error reading sub fst from " << fn;
  } else {
    VLOG(1) << "Read sub fst from " << fn;
  }
  sub_automata_[nt_label].reset(automaton);
  return automaton;
}

void AutomatonStore::clearCache() {
  sub_automata_.clear();
}
