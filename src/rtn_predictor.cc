#include "rtn_predictor.hh"

#include <glog/logging.h>

#include "fst_splice.hh"
#include "misc.hh"
#include "word_map.hh"

RtnPredictor::RtnPredictor(const PredictorOptions& options)
    : Predictor(options),
      store_(options.fst_path, options.weight_key),
      start_nt_(1),
      needs_optimization_(false) {
  readNtMap();
}

RtnPredictor::~RtnPredictor() {}

void RtnPredictor::readNtMap() {
  WordMap ntmap;
  std::string fn = options_.fst_path + "/ntmap";
  if (misc::file_exists(fn) && ntmap.read(fn) &&
      ntmap.containsWord(options_.start_nonterminal)) {
    start_nt_ = ntmap.getId(options_.start_nonterminal);
  } else {
    LOG(WARNING) << "Could not find NT " << options_.start_nonterminal
                 << " in " << fn << ". Assuming its ID 1";
    start_nt_ = 1;
  }
  root_prefix_ = "1" + misc::intToStrZeroFill(start_nt_, 3) + "000";
  VLOG(1) << "root fst prefix is " << root_prefix_;
}

void RtnPredictor::initialize(size_t sen_id) {
  current_sen_id_ = sen_id;
  history_.clear();
  store_.clearCache();
  automaton_.reset();
  std::string fn = store_.findRoot(sen_id, root_prefix_);
  if (!fn.empty()) {
    automaton_.reset(store_.loadFile(fn));
    if (!automaton_) {
      LOG(ERROR) << "error reading fst from " << fn;
    } else if (automaton_->start() == NO_STATE) {
      LOG(WARNING) << "root fst " << fn << " for sentence " << sen_id + 1
                   << " is empty";
    } else {
      VLOG(1) << "Read (root)fst from " << fn;
    }
  }
  needs_optimization_ = true;
  consume(options_.indexing.bos_id);
}

Posterior RtnPredictor::predictNext() {
  Posterior scores;
  if (!automaton_ || automaton_->start() == NO_STATE) return scores;
  expand(&scores);
  return finalizePosterior(scores);
}

score_t RtnPredictor::consume(symbol_t word) {
  history_.push_back(word);
  return 0.0;
}

PredictorState RtnPredictor::getState() const {
  return PredictorState::fromHistory(history_);
}

void RtnPredictor::setState(const PredictorState& state) {
  CHECK_EQ(state.kind, PredictorState::HISTORY);
  history_ = state.history;
}

size_t RtnPredictor::expand(Posterior* scores) {
  size_t total = 0;
  size_t passes = 0;
  while (true) {
    scores->clear();
    size_t replaced = expansionPass(scores);
    if (replaced == 0) break;
    total += replaced;
    if (++passes >= options_.max_expansion_passes) {
      LOG(ERROR) << "RTN expansion for sentence " << current_sen_id_ + 1
                 << " did not converge after " << passes
                 << " passes. Is the grammar left recursive?";
      break;
    }
  }
  if (total > 0 || needs_optimization_) optimize();
  return total;
}

size_t RtnPredictor::expansionPass(Posterior* scores) {
  if (!automaton_ || automaton_->start() == NO_STATE) return 0;
  automaton_->sortArcs();
  ScanContext ctx;
  ctx.scores = scores;
  ctx.visited.resize(history_.size() + 1);
  scan(automaton_->start(), 0.0, 0, &ctx);
  if (ctx.nt_arcs.empty()) return 0;
  size_t replaced = substitute(ctx.nt_arcs);
  VLOG(1) << "Replaced " << replaced << " NT arcs for history "
          << misc::ContainerToString(history_);
  return replaced;
}

// Depth-first search for the nodes reachable through the history. The
// first path reaching a node with a given history suffix wins, so a
// better scoring alternative path to the same node may be missed.
void RtnPredictor::scan(state_id_t node, score_t acc_score,
                        size_t history_pos, ScanContext* ctx) const {
  if (!ctx->visited[history_pos].insert(node).second) return;
  bool history_done = (history_pos == history_.size());
  size_t arc_pos = 0;
  for (fst::ArcIterator<WeightedAutomaton::Fst> aiter(automaton_->getFst(),
                                                      node);
       !aiter.Done(); aiter.Next(), ++arc_pos) {
    const WeightedAutomaton::Arc& arc = aiter.Value();
    score_t score = acc_score + toScore(WeightedAutomaton::cost(arc));
    if (arc.olabel == EPSILON_ID) {
      scan(arc.nextstate, score, history_pos, ctx);
    } else if (history_done) {
      if (is_nt_label(arc.olabel)) {
        ctx->nt_arcs[node].insert(arc_pos);
      } else {
        auto it = ctx->scores->find(arc.olabel);
        if (it == ctx->scores->end()) {
          (*ctx->scores)[arc.olabel] = score;
        } else {
          it->second = better(it->second, score);
        }
      }
    } else if (arc.olabel == history_[history_pos]) {
      scan(arc.nextstate, score, history_pos + 1, ctx);
    } else if (arc.olabel > history_[history_pos]) {
      // arcs are sorted by output label
      break;
    }
  }
}

size_t RtnPredictor::substitute(const NtArcMap& nt_arcs) {
  typedef WeightedAutomaton::Arc Arc;
  WeightedAutomaton::Fst* fst = automaton_->getMutableFst();
  size_t replaced = 0;
  for (const auto& entry : nt_arcs) {
    state_id_t source = entry.first;
    std::vector<Arc> arcs;
    for (fst::ArcIterator<WeightedAutomaton::Fst> aiter(*fst, source);
         !aiter.Done(); aiter.Next()) {
      arcs.push_back(aiter.Value());
    }
    fst->DeleteArcs(source);
    for (size_t i = 0; i < arcs.size(); ++i) {
      if (entry.second.count(i) == 0) {
        fst->AddArc(source, arcs[i]);
        continue;
      }
      ++replaced;
      const WeightedAutomaton* sub =
          store_.subAutomaton(current_sen_id_, arcs[i].olabel);
      // unreadable sub automata contribute no arcs
      if (sub == NULL) continue;
      spliceFst<Arc>(sub->getFst(), source, arcs[i], fst);
    }
  }
  automaton_->invalidate();
  return replaced;
}

void RtnPredictor::optimize() {
  needs_optimization_ = false;
  if (!options_.rmeps && !options_.minimize_rtns) return;
  misc::ProcessStopWatch sw;
  WeightedAutomaton::Fst* fst = automaton_->getMutableFst();
  fst::RmEpsilon(fst);
  if (options_.minimize_rtns) {
    // encoding labels and weights keeps the weight of every arc intact
    fst::EncodeMapper<WeightedAutomaton::Arc> encoder(
        fst::kEncodeLabels | fst::kEncodeWeights, fst::ENCODE);
    fst::Encode(fst, &encoder);
    WeightedAutomaton::Fst det;
    fst::Determinize(*fst, &det);
    fst::Minimize(&det);
    fst::Decode(&det, encoder);
    *fst = det;
  }
  automaton_->invalidate();
  sw.store();
  VLOG(1) << "optimized expanded fst to " << automaton_->numStates()
          << " states in " << sw.report();
}
