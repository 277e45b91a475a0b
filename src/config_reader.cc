#include "config_reader.hh"

#include <glog/logging.h>
#include <libconfig.h++>

namespace {

template <class T>
void lookupInt(const libconfig::Setting& root, const char* name, T* value) {
  int v;
  if (root.lookupValue(name, v)) *value = static_cast<T>(v);
}

}  // namespace

bool readPredictorConfig(const std::string& fn, PredictorOptions* options,
                         std::string* predictor_name) {
  libconfig::Config cfg;
  try {
    cfg.readFile(fn.c_str());
  } catch (const libconfig::FileIOException&) {
    LOG(ERROR) << "I/O error while reading config file '" << fn << "'";
    return false;
  } catch (const libconfig::ParseException& pex) {
    LOG(ERROR) << "parse error in config file " << pex.getFile() << ":"
               << pex.getLine() << " - " << pex.getError();
    return false;
  }
  const libconfig::Setting& root = cfg.getRoot();

  root.lookupValue("predictor", *predictor_name);
  root.lookupValue("fst_path", options->fst_path);
  root.lookupValue("use_weights", options->use_weights);
  root.lookupValue("normalize_scores", options->normalize_scores);
  root.lookupValue("skip_bos_weight", options->skip_bos_weight);
  root.lookupValue("to_log", options->to_log);
  root.lookupValue("rmeps", options->rmeps);
  root.lookupValue("minimize_rtns", options->minimize_rtns);
  root.lookupValue("weight_key", options->weight_key);
  root.lookupValue("start_nonterminal", options->start_nonterminal);
  lookupInt(root, "max_expansion_passes", &options->max_expansion_passes);
  lookupInt(root, "bos_id", &options->indexing.bos_id);
  lookupInt(root, "eos_id", &options->indexing.eos_id);
  lookupInt(root, "unk_id", &options->indexing.unk_id);

  LOG(INFO) << "read predictor config from '" << fn << "'";
  return true;
}
