#include <gtest/gtest.h>
#include <sys/stat.h>

#include "misc.hh"
#include "rtn_predictor.hh"
#include "test_util.hh"

namespace {

// base dir with an empty sentence directory for the first sentence
std::string makeRtnDir() {
  std::string dir = misc::make_temp_dir();
  CHECK_EQ(0, mkdir((dir + "/1").c_str(), 0755));
  return dir;
}

PredictorOptions makeOptions(const std::string& dir) {
  PredictorOptions options;
  options.fst_path = dir;
  return options;
}

// <s> X </s> with X -> 5 | 6
void writeGrammar(const std::string& dir) {
  misc::make_file(dir + "/1", "1001000010.fst",
                  "0 1 1 1\n"
                  "1 2 1001002000 1001002000 0.5\n"
                  "2 3 2 2\n"
                  "3\n");
  misc::make_file(dir + "/1", "1001002000.fst",
                  "0 1 5 5 1.0\n"
                  "0 1 6 6 2.0\n"
                  "1\n");
}

}  // namespace

TEST(RtnPredictorTestSuite, DefaultStartNonterminal) {
  std::string dir = makeRtnDir();
  LogCapture log;
  RtnPredictor predictor(makeOptions(dir));
  EXPECT_TRUE(log.contains("Could not find NT S"));
  EXPECT_EQ(1, predictor.getStartNonterminal());
  EXPECT_EQ("1001000", predictor.getRootPrefix());
}

TEST(RtnPredictorTestSuite, StartNonterminalFromNtMap) {
  std::string dir = makeRtnDir();
  misc::make_file(dir, "ntmap", "X 2\nS 12\n");
  LogCapture log;
  RtnPredictor predictor(makeOptions(dir));
  EXPECT_EQ(0u, log.count(GLOG_WARNING));
  EXPECT_EQ(12, predictor.getStartNonterminal());
  EXPECT_EQ("1012000", predictor.getRootPrefix());

  PredictorOptions options = makeOptions(dir);
  options.start_nonterminal = "X";
  RtnPredictor other(options);
  EXPECT_EQ("1002000", other.getRootPrefix());
}

TEST(RtnPredictorTestSuite, ExpandNonterminal) {
  std::string dir = makeRtnDir();
  writeGrammar(dir);
  RtnPredictor predictor(makeOptions(dir));
  predictor.initialize(0);
  ASSERT_EQ(1u, predictor.getHistory().size());

  Posterior posterior = predictor.predictNext();
  ASSERT_EQ(2u, posterior.size());
  EXPECT_NEAR(-1.5, posterior[5], 1e-5);
  EXPECT_NEAR(-2.5, posterior[6], 1e-5);

  Posterior again;
  EXPECT_EQ(0u, predictor.expansionPass(&again)) << "nothing left to expand";
  ASSERT_EQ(2u, again.size());
  EXPECT_NEAR(posterior[5], again[5], 1e-5);

  EXPECT_FLOAT_EQ(0.0, predictor.consume(6));
  posterior = predictor.predictNext();
  ASSERT_EQ(1u, posterior.size());
  EXPECT_NEAR(-2.5, posterior[2], 1e-5) << "scores are full path scores";
}

TEST(RtnPredictorTestSuite, ExpandWithoutEpsilonRemoval) {
  std::string dir = makeRtnDir();
  writeGrammar(dir);
  PredictorOptions options = makeOptions(dir);
  options.rmeps = false;
  RtnPredictor predictor(options);
  predictor.initialize(0);
  Posterior posterior = predictor.predictNext();
  EXPECT_NEAR(-1.5, posterior[5], 1e-5);
  predictor.consume(5);
  posterior = predictor.predictNext();
  EXPECT_NEAR(-1.5, posterior[2], 1e-5);
}

TEST(RtnPredictorTestSuite, MinimizedExpansionKeepsScores) {
  std::string dir = makeRtnDir();
  writeGrammar(dir);
  PredictorOptions options = makeOptions(dir);
  options.minimize_rtns = true;
  RtnPredictor predictor(options);
  predictor.initialize(0);
  Posterior posterior = predictor.predictNext();
  EXPECT_NEAR(-1.5, posterior[5], 1e-5);
  EXPECT_NEAR(-2.5, posterior[6], 1e-5);
  predictor.consume(5);
  EXPECT_NEAR(-1.5, predictor.predictNext()[2], 1e-5);
}

TEST(RtnPredictorTestSuite, NestedNonterminals) {
  std::string dir = makeRtnDir();
  misc::make_file(dir + "/1", "1001000010.fst",
                  "0 1 1 1\n"
                  "1 2 1001002000 1001002000\n"
                  "2 3 2 2\n"
                  "3\n");
  misc::make_file(dir + "/1", "1001002000.fst",
                  "0 1 1001003000 1001003000 1.0\n"
                  "1 2 7 7\n"
                  "2\n");
  misc::make_file(dir + "/1", "1001003000.fst",
                  "0 1 5 5 0.25\n"
                  "1\n");
  RtnPredictor predictor(makeOptions(dir));
  predictor.initialize(0);
  Posterior posterior = predictor.predictNext();
  ASSERT_EQ(1u, posterior.size());
  EXPECT_NEAR(-1.25, posterior[5], 1e-5);
  predictor.consume(5);
  posterior = predictor.predictNext();
  ASSERT_EQ(1u, posterior.size());
  EXPECT_NEAR(-1.25, posterior[7], 1e-5);
}

TEST(RtnPredictorTestSuite, UnreadableSubAutomaton) {
  std::string dir = makeRtnDir();
  misc::make_file(dir + "/1", "1001000010.fst",
                  "0 1 1 1\n"
                  "1 2 7 7 1.0\n"
                  "1 2 1001003000 1001003000\n"
                  "2\n");
  RtnPredictor predictor(makeOptions(dir));
  predictor.initialize(0);
  LogCapture log;
  Posterior posterior = predictor.predictNext();
  EXPECT_TRUE(log.contains("error reading sub fst from"));
  ASSERT_EQ(1u, posterior.size());
  EXPECT_FLOAT_EQ(-1.0, posterior[7]);
}

TEST(RtnPredictorTestSuite, AmbiguousRoot) {
  std::string dir = makeRtnDir();
  misc::make_file(dir + "/1", "1001000003.fst", "0 1 1 1\n1 2 5 5\n2\n");
  misc::make_file(dir + "/1", "1001000017.fst", "0 1 1 1\n1 2 6 6\n2\n");
  RtnPredictor predictor(makeOptions(dir));
  LogCapture log;
  predictor.initialize(0);
  EXPECT_TRUE(log.contains("Ambiguous root fst"));
  Posterior posterior = predictor.predictNext();
  ASSERT_EQ(1u, posterior.size());
  EXPECT_EQ(1u, posterior.count(6)) << "largest span is taken";
}

TEST(RtnPredictorTestSuite, DirectRootFile) {
  std::string dir = makeRtnDir();
  misc::make_file(dir, "1.fst", "0 1 1 1\n1 2 5 5 3.0\n2\n");
  RtnPredictor predictor(makeOptions(dir));
  predictor.initialize(0);
  Posterior posterior = predictor.predictNext();
  EXPECT_FLOAT_EQ(-3.0, posterior[5]);
}

TEST(RtnPredictorTestSuite, MissingRoot) {
  std::string dir = makeRtnDir();
  RtnPredictor predictor(makeOptions(dir));
  LogCapture log;
  predictor.initialize(0);
  EXPECT_GE(log.count(GLOG_ERROR), 1u);
  EXPECT_TRUE(predictor.getAutomaton() == NULL);
  EXPECT_TRUE(predictor.predictNext().empty());
}

TEST(RtnPredictorTestSuite, StateRoundTrip) {
  std::string dir = makeRtnDir();
  writeGrammar(dir);
  RtnPredictor predictor(makeOptions(dir));
  predictor.initialize(0);
  Posterior after_bos = predictor.predictNext();
  PredictorState state = predictor.getState();
  EXPECT_EQ(PredictorState::HISTORY, state.kind);

  predictor.consume(5);
  EXPECT_FALSE(predictor.isEqual(state, predictor.getState()));
  EXPECT_EQ(1u, predictor.predictNext().count(2));

  predictor.setState(state);
  EXPECT_TRUE(predictor.isEqual(state, predictor.getState()));
  Posterior restored = predictor.predictNext();
  ASSERT_EQ(after_bos.size(), restored.size());
  EXPECT_NEAR(after_bos[5], restored[5], 1e-5);
  EXPECT_NEAR(after_bos[6], restored[6], 1e-5);
}

TEST(RtnPredictorTestSuite, LeftRecursionIsBounded) {
  std::string dir = makeRtnDir();
  misc::make_file(dir + "/1", "1001000010.fst",
                  "0 1 1 1\n"
                  "1 2 1001002000 1001002000\n"
                  "2\n");
  misc::make_file(dir + "/1", "1001002000.fst",
                  "0 1 1001002000 1001002000\n"
                  "0 2 5 5\n"
                  "1 2 6 6\n"
                  "2\n");
  PredictorOptions options = makeOptions(dir);
  options.max_expansion_passes = 5;
  RtnPredictor predictor(options);
  predictor.initialize(0);
  LogCapture log;
  Posterior scores;
  EXPECT_EQ(5u, predictor.expand(&scores));
  EXPECT_TRUE(log.contains("did not converge"));
}
