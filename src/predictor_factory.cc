#include "predictor_factory.hh"

#include <glog/logging.h>

#include "fst_predictor.hh"
#include "nfst_predictor.hh"
#include "rtn_predictor.hh"

Predictor* createPredictor(const std::string& name,
                           const PredictorOptions& options) {
  if (name == "fst") {
    return new FstPredictor(options);
  } else if (name == "nfst") {
    return new NfstPredictor(options);
  } else if (name == "rtn") {
    return new RtnPredictor(options);
  }
  LOG(ERROR) << "unknown predictor '" << name << "' (fst|nfst|rtn)";
  return NULL;
}
