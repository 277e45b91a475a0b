#include "word_map.hh"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <sstream>

#include <glog/logging.h>

#include "misc.hh"

/** constructs a map that only knows epsilon */
WordMap::WordMap() : next_id_(0) {
  setWord(EPSILON_ID, WORD_MAP_EPSILON);
}

WordMap::~WordMap() {}

/** makes new word available under the next free id */
symbol_t WordMap::addWord(const std::string& word) {
  const auto& it = word_map_.find(word);
  if (it != word_map_.end()) {
    return it->second;
  }
  symbol_t id = next_id_;
  setWord(id, word);
  return id;
}

void WordMap::setWord(symbol_t word_id, const std::string& word) {
  const auto& old = id_map_.find(word_id);
  if (old != id_map_.end() && old->second != word) {
    word_map_.erase(old->second);
  }
  word_map_[word] = word_id;
  id_map_[word_id] = word;
  if (word_id >= next_id_) next_id_ = word_id + 1;
}

bool WordMap::containsId(symbol_t word_id) const {
  return id_map_.find(word_id) != id_map_.end();
}

bool WordMap::containsWord(const std::string& word) const {
  return word_map_.find(word) != word_map_.end();
}

/** returns the id of the word or WORD_MAP_NOT_FOUND */
symbol_t WordMap::getId(const std::string& word) const {
  const auto& it = word_map_.find(word);
  if (it != word_map_.end()) {
    return it->second;
  }
  return WORD_MAP_NOT_FOUND;
}

/** unknown ids are rendered as the number itself */
std::string WordMap::getWord(symbol_t word_id) const {
  const auto& it = id_map_.find(word_id);
  if (it != id_map_.end()) {
    return it->second;
  }
  return std::to_string((long long)word_id);
}

std::string WordMap::getWords(const std::vector<symbol_t>& ids) const {
  std::stringstream streamText;
  for (auto it = ids.begin(); it != ids.end(); ++it) {
    streamText << getWord(*it);
    if (it + 1 != ids.end()) streamText << " ";
  }
  return streamText.str();
}

void WordMap::print(std::ostream& os) const {
  os << "WordMap::print" << std::endl;
  os << "map_size: " << word_map_.size() << std::endl;
  for (symbol_t i = 0; i < next_id_; ++i) {
    if (containsId(i)) os << i << "\t'" << getWord(i) << "'" << std::endl;
  }
}

size_t WordMap::size() const { return id_map_.size(); }

void WordMap::clear() {
  word_map_.clear();
  id_map_.clear();
  next_id_ = 0;
  setWord(EPSILON_ID, WORD_MAP_EPSILON);
}

bool WordMap::read(const std::string& fn) {
  if (!misc::file_exists(fn)) {
    LOG(WARNING) << "word map '" << fn << "' does not exist";
    return false;
  }
  VLOG(1) << "reading word map from '" << fn
          << "' (current size=" << size() << ")";
  misc::IFileStream istr(fn);
  size_t num_entries = 0;
  size_t line_no = 0;
  for (std::string current_line; std::getline(istr.get(), current_line);) {
    ++line_no;
    boost::algorithm::trim(current_line);
    if (current_line.empty()) continue;
    std::vector<std::string> fields;
    boost::split(fields, current_line, boost::is_any_of(" \t"),
                 boost::token_compress_on);
    if (fields.size() != 2) {
      LOG(ERROR) << "bad line " << line_no << " in word map '" << fn
                 << "': " << current_line;
      return false;
    }
    try {
      setWord(boost::lexical_cast<symbol_t>(fields[1]), fields[0]);
    } catch (const boost::bad_lexical_cast&) {
      LOG(ERROR) << "bad id on line " << line_no << " in word map '" << fn
                 << "': " << fields[1];
      return false;
    }
    ++num_entries;
  }

  VLOG(1) << "word map reading done (" << num_entries
          << " entries read, current size=" << size() << ")";
  return true;
}
