#ifndef PREDICTOR_FACTORY_H_
#define PREDICTOR_FACTORY_H_

#include <string>

#include "config_options.hh"
#include "predictor.hh"

// "fst", "nfst" or "rtn"; NULL for unknown names, caller owns the result
Predictor* createPredictor(const std::string& name,
                           const PredictorOptions& options);

#endif /* PREDICTOR_FACTORY_H_ */
