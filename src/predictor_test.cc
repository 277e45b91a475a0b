#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <sstream>

#include "predictor.hh"
#include "predictor_factory.hh"

namespace {

// serves a fixed posterior through the shared post-processing
class FixedPredictor : public Predictor {
 public:
  FixedPredictor(const PredictorOptions& options, const Posterior& scores)
      : Predictor(options), scores_(scores) {}
  virtual void initialize(size_t sen_id) {
    current_sen_id_ = sen_id;
  }
  virtual Posterior predictNext() {
    return finalizePosterior(scores_);
  }
  virtual score_t consume(symbol_t word) {
    return scoreOf(word);
  }
  virtual PredictorState getState() const {
    return PredictorState::fromNode(0);
  }
  virtual void setState(const PredictorState& state) {
    (void)state;
  }

 private:
  score_t scoreOf(symbol_t word) const {
    auto it = scores_.find(word);
    return it == scores_.end() ? 0.0 : it->second;
  }
  Posterior scores_;
};

}  // namespace

TEST(PredictorTestSuite, StateEquality) {
  EXPECT_EQ(PredictorState::fromNode(3), PredictorState::fromNode(3));
  EXPECT_NE(PredictorState::fromNode(3), PredictorState::fromNode(4));

  std::vector<WeightedState> nodes;
  nodes.push_back(WeightedState(0.0, 2));
  nodes.push_back(WeightedState(-1.5, 7));
  PredictorState node_set = PredictorState::fromNodes(nodes);
  EXPECT_EQ(node_set, PredictorState::fromNodes(nodes));
  nodes[1].weight = -1.0;
  EXPECT_NE(node_set, PredictorState::fromNodes(nodes));

  std::vector<symbol_t> history = {1, 5, 6};
  EXPECT_EQ(PredictorState::fromHistory(history),
            PredictorState::fromHistory(history));
  EXPECT_NE(PredictorState::fromHistory(history),
            PredictorState::fromHistory(std::vector<symbol_t>{1, 5}));

  EXPECT_NE(PredictorState::fromNode(2), PredictorState::fromNodes(nodes))
      << "different kinds never compare equal";
}

TEST(PredictorTestSuite, StateIsValueCopy) {
  std::vector<symbol_t> history = {1, 5};
  PredictorState state = PredictorState::fromHistory(history);
  history.push_back(6);
  EXPECT_EQ(2u, state.history.size());
  PredictorState copy = state;
  copy.history.push_back(9);
  EXPECT_EQ(2u, state.history.size());
}

TEST(PredictorTestSuite, StatePrint) {
  std::ostringstream os;
  os << PredictorState::fromNode(4);
  EXPECT_EQ("node 4", os.str());
}

TEST(PredictorTestSuite, PosteriorPassThrough) {
  PredictorOptions options;
  Posterior scores;
  scores[5] = -2.0;
  scores[6] = -0.5;
  FixedPredictor predictor(options, scores);
  EXPECT_EQ(scores, predictor.predictNext());
  EXPECT_EQ(NEG_INF, predictor.getUnkProbability(scores));
  EXPECT_FLOAT_EQ(0.0, predictor.estimateFutureCost({5}));
}

TEST(PredictorTestSuite, PosteriorWithoutWeights) {
  PredictorOptions options;
  options.use_weights = false;
  Posterior scores;
  scores[5] = -2.0;
  scores[6] = -0.5;
  FixedPredictor predictor(options, scores);
  Posterior posterior = predictor.predictNext();
  ASSERT_EQ(2u, posterior.size());
  EXPECT_FLOAT_EQ(0.0, posterior[5]);
  EXPECT_FLOAT_EQ(0.0, posterior[6]);
}

TEST(PredictorTestSuite, PosteriorNormalized) {
  PredictorOptions options;
  options.normalize_scores = true;
  Posterior scores;
  scores[5] = std::log(0.1);
  scores[6] = std::log(0.3);
  FixedPredictor predictor(options, scores);
  Posterior posterior = predictor.predictNext();
  EXPECT_NEAR(std::log(0.25), posterior[5], 1e-5);
  EXPECT_NEAR(std::log(0.75), posterior[6], 1e-5);
}

TEST(PredictorTestSuite, PosteriorUniformWithoutWeights) {
  PredictorOptions options;
  options.normalize_scores = true;
  options.use_weights = false;
  Posterior scores;
  for (symbol_t w = 4; w < 8; ++w) scores[w] = -w;
  FixedPredictor predictor(options, scores);
  Posterior posterior = predictor.predictNext();
  ASSERT_EQ(4u, posterior.size());
  for (const auto& entry : posterior) {
    EXPECT_NEAR(-std::log(4.0), entry.second, 1e-5);
  }
}

TEST(PredictorTestSuite, EmptyPosteriorStaysEmpty) {
  PredictorOptions options;
  options.normalize_scores = true;
  FixedPredictor predictor(options, Posterior());
  EXPECT_TRUE(predictor.predictNext().empty());
}

TEST(PredictorTestSuite, Factory) {
  PredictorOptions options;
  options.fst_path = "/nonexistent/latpredict";
  std::unique_ptr<Predictor> fst(createPredictor("fst", options));
  EXPECT_TRUE(fst != NULL);
  std::unique_ptr<Predictor> nfst(createPredictor("nfst", options));
  EXPECT_TRUE(nfst != NULL);
  std::unique_ptr<Predictor> rtn(createPredictor("rtn", options));
  EXPECT_TRUE(rtn != NULL);
  std::unique_ptr<Predictor> unknown(createPredictor("ngram", options));
  EXPECT_TRUE(unknown == NULL);
  EXPECT_EQ("/nonexistent/latpredict", rtn->getOptions().fst_path);
}
