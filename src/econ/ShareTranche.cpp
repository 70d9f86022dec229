#include "shipcalc/econ/ShareTranche.h"

#include "shipcalc/core/Assert.h"

#include <algorithm>
#include <cmath>

namespace shipcalc::econ {

core::i64 shareTier(double totalShares, const ShareTrancheSchedule& s) {
  SHIPCALC_ASSERT_MSG(s.trancheSize > 0.0, "share tranche size must be positive");
  if (!std::isfinite(totalShares)) return 0;

  const double t = std::floor((totalShares - s.firstTrancheSize) / s.trancheSize);
  if (!(t > 0.0)) return 0;
  if (t >= (double)kMaxShareTier) return kMaxShareTier;
  return (core::i64)t;
}

double tranchePrice(core::i64 tier, const ShareTrancheSchedule& s) {
  const core::i64 clamped = std::clamp<core::i64>(tier, 0, kMaxShareTier);
  return std::ldexp(s.basePrice, (int)clamped);
}

ShareTier describeTier(core::i64 tier, const ShareTrancheSchedule& s) {
  ShareTier t{};
  t.index = tier;
  t.fromShares = s.firstTrancheSize + (double)tier * s.trancheSize;
  t.toShares = t.fromShares + s.trancheSize;
  t.price = tranchePrice(tier, s);
  return t;
}

ShareTierQuote quoteShares(double totalShares, const ShareTrancheSchedule& s) {
  ShareTierQuote q{};
  q.tier = shareTier(totalShares, s);
  q.price = tranchePrice(q.tier, s);
  q.sharesPerPurchase = s.trancheSize;

  const core::i64 first = std::max<core::i64>(0, q.tier - kMaxListedTiers + 1);
  q.reached.reserve((std::size_t)(q.tier - first + 1));
  for (core::i64 i = first; i <= q.tier; ++i) {
    q.reached.push_back(describeTier(i, s));
  }
  q.next = describeTier(q.tier + 1, s);
  return q;
}

} // namespace shipcalc::econ
