#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_string(predictor, "fst", "fst|nfst|rtn");
DEFINE_string(config, "", "libconfig file with predictor settings, flags given explicitly take precedence");
DEFINE_string(fst_path, "", "automaton file pattern with %d, or directory with <index>.fst files");
DEFINE_string(wmap, "", "word map ('word id' per line) for printing symbols");
DEFINE_string(prefixes, "", "file with one forced prefix per sentence");
DEFINE_bool(use_weights, true, "if false, every reachable symbol scores 0");
DEFINE_bool(normalize_scores, false, "renormalize scores on outgoing arcs");
DEFINE_bool(skip_bos_weight, true, "ignore the weight on the <s> arc");
DEFINE_bool(to_log, true, "arc weights are costs, flip their sign");
DEFINE_bool(rmeps, true, "rtn: remove epsilons after expansion");
DEFINE_bool(minimize_rtns, false, "rtn: determinize and minimize after expansion");
DEFINE_int32(weight_key, 0, "key in sparse tuple weights, 0 sums all keys");
DEFINE_string(start_nonterminal, "S", "rtn: name of the start nonterminal in ntmap");
DEFINE_uint64(max_expansion_passes, 10000, "rtn: limit on expansion passes per prediction");
DEFINE_int32(bos_id, 1, "begin-of-sentence symbol");
DEFINE_int32(eos_id, 2, "end-of-sentence symbol");
DEFINE_int32(unk_id, 3, "unknown word symbol");
DEFINE_uint64(first_sentence, 1, "1-based index of the first sentence");
DEFINE_uint64(num_sentences, 1, "number of sentences to process");
DEFINE_uint64(max_len, 200, "maximum length of the best-first walk");
DEFINE_bool(heuristic, false, "log the future cost estimate of each step");

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config_options.hh"
#include "config_reader.hh"
#include "global.hh"
#include "misc.hh"
#include "predictor.hh"
#include "predictor_factory.hh"
#include "word_map.hh"

#define APPLY_FLAG(NAME, TARGET) \
  if (FLAGS_config.empty() || \
      !google::GetCommandLineFlagInfoOrDie(#NAME).is_default) { \
    TARGET = FLAGS_##NAME; \
  }

bool parsePrefix(const std::string& line, const WordMap& wmap,
                 std::vector<symbol_t>* prefix) {
  std::vector<std::string> tokens;
  boost::split(tokens, line, boost::is_any_of(" \t"), boost::token_compress_on);
  for (const std::string& token : tokens) {
    if (token.empty()) continue;
    if (wmap.containsWord(token)) {
      prefix->push_back(wmap.getId(token));
      continue;
    }
    try {
      prefix->push_back(boost::lexical_cast<symbol_t>(token));
    } catch (const boost::bad_lexical_cast&) {
      LOG(ERROR) << "unknown symbol '" << token << "' in prefix '" << line
                 << "'";
      return false;
    }
  }
  return true;
}

std::string posteriorToString(const Posterior& posterior,
                              const WordMap& wmap) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& entry : posterior) {
    if (!first) oss << " ";
    first = false;
    oss << wmap.getWord(entry.first) << ":" << entry.second;
  }
  return oss.str();
}

int main(int argc, char** argv) {
  INIT_MAIN("query automaton predictors for translation lattices\n");

  PredictorOptions options;
  std::string predictor_name = FLAGS_predictor;
  if (!FLAGS_config.empty()) {
    CHECK(readPredictorConfig(FLAGS_config, &options, &predictor_name))
        << "could not read config file '" << FLAGS_config << "'";
  }
  APPLY_FLAG(predictor, predictor_name);
  APPLY_FLAG(fst_path, options.fst_path);
  APPLY_FLAG(use_weights, options.use_weights);
  APPLY_FLAG(normalize_scores, options.normalize_scores);
  APPLY_FLAG(skip_bos_weight, options.skip_bos_weight);
  APPLY_FLAG(to_log, options.to_log);
  APPLY_FLAG(rmeps, options.rmeps);
  APPLY_FLAG(minimize_rtns, options.minimize_rtns);
  APPLY_FLAG(weight_key, options.weight_key);
  APPLY_FLAG(start_nonterminal, options.start_nonterminal);
  APPLY_FLAG(max_expansion_passes, options.max_expansion_passes);
  APPLY_FLAG(bos_id, options.indexing.bos_id);
  APPLY_FLAG(eos_id, options.indexing.eos_id);
  APPLY_FLAG(unk_id, options.indexing.unk_id);

  CHECK(!options.fst_path.empty()) << "no automaton path given (--fst_path)";
  CHECK_GE(FLAGS_first_sentence, 1u) << "sentence indices are 1-based";

  std::unique_ptr<Predictor> predictor(
      createPredictor(predictor_name, options));
  CHECK(predictor) << "could not create predictor '" << predictor_name << "'";
  LOG(INFO) << "using " << predictor_name << " predictor on '"
            << options.fst_path << "'";

  WordMap wmap;
  if (!FLAGS_wmap.empty()) {
    CHECK(wmap.read(FLAGS_wmap)) << "could not read word map";
  }
  std::vector<std::string> prefixes;
  if (!FLAGS_prefixes.empty()) {
    prefixes = misc::readCorpus(FLAGS_prefixes);
  }

  for (size_t i = 0; i < FLAGS_num_sentences; ++i) {
    misc::ProcessStopWatch sw;
    size_t sen_id = FLAGS_first_sentence - 1 + i;
    predictor->initialize(sen_id);
    if (FLAGS_heuristic) predictor->initializeHeuristic();

    std::vector<symbol_t> hypothesis;
    score_t total = 0.0;
    Posterior posterior = predictor->predictNext();

    std::vector<symbol_t> prefix;
    if (i < prefixes.size() && !parsePrefix(prefixes[i], wmap, &prefix)) {
      prefix.clear();
    }
    for (symbol_t word : prefix) {
      auto it = posterior.find(word);
      total += (it != posterior.end())
                   ? it->second
                   : predictor->getUnkProbability(posterior);
      predictor->consume(word);
      hypothesis.push_back(word);
      posterior = predictor->predictNext();
    }
    std::cout << sen_id + 1 << " ||| posterior ||| "
              << posteriorToString(posterior, wmap) << std::endl;

    while (hypothesis.size() < FLAGS_max_len && !posterior.empty()) {
      auto best = posterior.begin();
      for (auto it = posterior.begin(); it != posterior.end(); ++it) {
        // scores are costs without --to_log
        if (options.to_log ? it->second > best->second
                           : it->second < best->second) {
          best = it;
        }
      }
      hypothesis.push_back(best->first);
      total += best->second;
      if (FLAGS_heuristic) {
        VLOG(1) << "future cost after " << wmap.getWord(best->first) << ": "
                << predictor->estimateFutureCost(hypothesis);
      }
      if (best->first == options.indexing.eos_id) break;
      predictor->consume(best->first);
      posterior = predictor->predictNext();
    }
    sw.store();
    std::cout << sen_id + 1 << " ||| best ||| " << wmap.getWords(hypothesis)
              << " ||| " << total << std::endl;
    LOG(INFO) << "sentence " << sen_id + 1 << " done in " << sw.report();
  }
  return 0;
}
