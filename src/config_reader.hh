#ifndef CONFIG_READER_H_
#define CONFIG_READER_H_

#include <string>

#include "config_options.hh"

// Reads predictor settings from a libconfig file. Settings missing in the
// file keep their current values. Returns false if the file cannot be
// read or parsed.
bool readPredictorConfig(const std::string& fn, PredictorOptions* options,
                         std::string* predictor_name);

#endif /* CONFIG_READER_H_ */
