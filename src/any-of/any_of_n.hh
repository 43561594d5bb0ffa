#pragma once

#include <any-of/any_of.hh>
#include <any-of/fwd.hh>

// =========================================================================================================
// Composite arities
// =========================================================================================================
//
// any_of4 / any_of8 / any_of16 are plain nestings of any_of, so every operation of any_of applies
// level by level. The flat accessors (ll() ... rrrr()), opt4() / opt8() / opt16() and the
// create4 / from_opt4 family come from path_interface and any_of itself.
//
// Omitted type parameters repeat the parameter in the same position one level down:
//   any_of4<int>                      == any_of<any_of<int, int>, any_of<int, int>>
//   any_of4<int, float>               == any_of<any_of<int, float>, any_of<float, float>>
//   any_of8<A, B, C, D>               == any_of<any_of4<A, B, C, D>, any_of4<A, B, C, D>>
//
// Usage:
//   auto v = ao::any_of4<int, std::string>::create4(1, ao::nullopt, "rl", ao::nullopt);
//   if (auto rl = v.rl(); rl.has_value()) use(rl.value());
//

namespace ao
{
template <class LL, class LR = LL, class RL = LR, class RR = RL>
using any_of4 = any_of<any_of<LL, LR>, any_of<RL, RR>>;

template <class LLL,
          class LLR = LLL,
          class LRL = LLR,
          class LRR = LRL,
          class RLL = LLL,
          class RLR = LLR,
          class RRL = LRL,
          class RRR = LRR>
using any_of8 = any_of<any_of4<LLL, LLR, LRL, LRR>, any_of4<RLL, RLR, RRL, RRR>>;

template <class LLLL,
          class LLLR = LLLL,
          class LLRL = LLLR,
          class LLRR = LLRL,
          class LRLL = LLLL,
          class LRLR = LLLR,
          class LRRL = LLRL,
          class LRRR = LLRR,
          class RLLL = LLLL,
          class RLLR = LLLR,
          class RLRL = LLRL,
          class RLRR = LLRR,
          class RRLL = LRLL,
          class RRLR = LRLR,
          class RRRL = LRRL,
          class RRRR = LRRR>
using any_of16 = any_of<any_of8<LLLL, LLLR, LLRL, LLRR, LRLL, LRLR, LRRL, LRRR>, //
                        any_of8<RLLL, RLLR, RLRL, RLRR, RRLL, RRLR, RRRL, RRRR>>;

/// ((ll, lr), (rl, rr)), the owning counterpart of any_of4::opt4()
template <class LL, class LR = LL, class RL = LR, class RR = RL>
using opt4_of = couple<opt2_of<LL, LR>, opt2_of<RL, RR>>;

template <class LLL,
          class LLR = LLL,
          class LRL = LLR,
          class LRR = LRL,
          class RLL = LLL,
          class RLR = LLR,
          class RRL = LRL,
          class RRR = LRR>
using opt8_of = couple<opt4_of<LLL, LLR, LRL, LRR>, opt4_of<RLL, RLR, RRL, RRR>>;

template <class LLLL,
          class LLLR = LLLL,
          class LLRL = LLLR,
          class LLRR = LLRL,
          class LRLL = LLLL,
          class LRLR = LLLR,
          class LRRL = LLRL,
          class LRRR = LLRR,
          class RLLL = LLLL,
          class RLLR = LLLR,
          class RLRL = LLRL,
          class RLRR = LLRR,
          class RRLL = LRLL,
          class RRLR = LRLR,
          class RRRL = LRRL,
          class RRRR = LRRR>
using opt16_of = couple<opt8_of<LLLL, LLLR, LLRL, LLRR, LRLL, LRLR, LRRL, LRRR>, //
                        opt8_of<RLLL, RLLR, RLRL, RLRR, RRLL, RRLR, RRRL, RRRR>>;

} // namespace ao
