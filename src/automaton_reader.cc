#include "automaton_reader.hh"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <fstream>
#include <vector>

#include "misc.hh"

namespace {

bool parseCost(const std::string& s, score_t* cost) {
  try {
    *cost = boost::lexical_cast<score_t>(s);
  } catch (const boost::bad_lexical_cast&) {
    return false;
  }
  return true;
}

template <class T>
bool parseId(const std::string& s, T* id) {
  try {
    *id = boost::lexical_cast<T>(s);
  } catch (const boost::bad_lexical_cast&) {
    return false;
  }
  return *id >= 0;
}

bool isBinaryFst(const std::string& fn) {
  std::ifstream ifs(fn.c_str(), std::ios_base::in | std::ios_base::binary);
  int32_t magic = 0;
  ifs.read(reinterpret_cast<char*>(&magic), sizeof(magic));
  return ifs.good() && magic == fst::kFstMagicNumber;
}

}  // namespace

bool parseWeight(const std::string& field, int weight_key, score_t* cost) {
  if (field.find(',') == std::string::npos) {
    return parseCost(field, cost);
  }
  std::vector<std::string> elements;
  boost::split(elements, field, boost::is_any_of(","));
  // default value followed by key/value pairs
  if (elements.size() % 2 != 1) return false;
  score_t default_cost;
  if (!parseCost(elements[0], &default_cost)) return false;
  score_t sum = 0.0;
  bool found = false;
  for (size_t i = 1; i < elements.size(); i += 2) {
    int key;
    score_t value;
    if (!parseId(elements[i], &key) || !parseCost(elements[i + 1], &value)) {
      return false;
    }
    if (weight_key == 0) {
      sum += value;
      found = true;
    } else if (key == weight_key) {
      sum = value;
      found = true;
    }
  }
  *cost = found ? sum : default_cost;
  return true;
}

WeightedAutomaton* readTextAutomaton(std::istream& is, const std::string& name,
                                     int weight_key) {
  typedef WeightedAutomaton::Arc Arc;
  std::unique_ptr<WeightedAutomaton::Fst> fst(new WeightedAutomaton::Fst());
  size_t nline = 0;
  bool seen_record = false;
  for (std::string line; std::getline(is, line);) {
    ++nline;
    boost::algorithm::trim(line);
    if (line.empty()) continue;
    std::vector<std::string> col;
    boost::split(col, line, boost::is_any_of(" \t"), boost::token_compress_on);

    state_id_t s;
    if (!parseId(col[0], &s)) {
      LOG(ERROR) << "Bad line " << nline << " in automaton " << name << ": "
                 << line;
      return NULL;
    }
    while (s >= fst->NumStates()) fst->AddState();
    if (!seen_record) {
      fst->SetStart(s);
      seen_record = true;
    }

    bool ok = true;
    Arc arc;
    score_t cost = 0.0;
    state_id_t d = s;
    switch (col.size()) {
      case 1:
        fst->SetFinal(s, Arc::Weight::One());
        break;
      case 2:
        ok = parseWeight(col[1], weight_key, &cost);
        if (ok) fst->SetFinal(s, Arc::Weight(cost));
        break;
      case 4:
      case 5:
        ok = parseId(col[1], &arc.nextstate) && parseId(col[2], &arc.ilabel) &&
             parseId(col[3], &arc.olabel);
        if (ok && col.size() == 5) ok = parseWeight(col[4], weight_key, &cost);
        if (ok) {
          d = arc.nextstate;
          arc.weight = Arc::Weight(cost);
          fst->AddArc(s, arc);
        }
        break;
      default:
        ok = false;
    }
    if (!ok) {
      LOG(ERROR) << "Bad line " << nline << " in automaton " << name << ": "
                 << line;
      return NULL;
    }
    while (d >= fst->NumStates()) fst->AddState();
  }
  return new WeightedAutomaton(fst.release());
}

WeightedAutomaton* readAutomaton(const std::string& fn, int weight_key) {
  if (!misc::file_exists(fn)) {
    VLOG(1) << "automaton file '" << fn << "' does not exist";
    return NULL;
  }
  misc::ProcessStopWatch sw;
  WeightedAutomaton* automaton = NULL;
  if (isBinaryFst(fn)) {
    WeightedAutomaton::Fst* fst = WeightedAutomaton::Fst::Read(fn);
    if (fst == NULL) {
      LOG(ERROR) << "could not read binary fst from '" << fn << "'";
      return NULL;
    }
    automaton = new WeightedAutomaton(fst);
  } else {
    misc::IFileStream ifs(fn);
    if (!ifs.is_open()) return NULL;
    automaton = readTextAutomaton(ifs.get(), fn, weight_key);
    if (automaton == NULL) return NULL;
  }
  sw.store();
  VLOG(1) << "read automaton with " << automaton->numStates()
          << " states from '" << fn << "' in " << sw.report();
  return automaton;
}
