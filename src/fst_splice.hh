#ifndef FST_SPLICE_HH
#define FST_SPLICE_HH

#include <fst/fst.h>
#include <fst/mutable-fst.h>

/**
 * Replaces a nonterminal arc by a copy of the referenced automaton. The
 * copy gets fresh state ids. An epsilon arc carrying the weight of the
 * nonterminal arc enters the copy's start state, and every final state of
 * the copy gets an epsilon arc carrying its final weight to the original
 * destination. The nonterminal arc itself must be removed by the caller.
 *
 * Returns the number of states added.
 */
template<class A> typename A::StateId spliceFst(const fst::Fst<A> &sub, typename A::StateId source, const A &nt_arc, fst::MutableFst<A> *fst) {
    typedef typename A::StateId StateId;
    typedef typename A::Weight Weight;
    if (sub.Start() == fst::kNoStateId) {
        return 0;
    }
    StateId offset = fst->NumStates();
    StateId num_states = 0;
    for (fst::StateIterator<fst::Fst<A> > siter(sub); !siter.Done(); siter.Next()) {
        fst->AddState();
        ++num_states;
    }
    for (fst::StateIterator<fst::Fst<A> > siter(sub); !siter.Done(); siter.Next()) {
        StateId s = siter.Value();
        for (fst::ArcIterator<fst::Fst<A> > aiter(sub, s); !aiter.Done(); aiter.Next()) {
            A arc = aiter.Value();
            arc.nextstate += offset;
            fst->AddArc(s + offset, arc);
        }
        if (sub.Final(s) != Weight::Zero()) {
            fst->AddArc(s + offset, A(0, 0, sub.Final(s), nt_arc.nextstate));
        }
    }
    fst->AddArc(source, A(0, 0, nt_arc.weight, sub.Start() + offset));
    return num_states;
}

#endif // FST_SPLICE_HH
