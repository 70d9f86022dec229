#pragma once

#include "shipcalc/core/Types.h"

#include <vector>

namespace shipcalc::econ {

// Company share issuance: shares are sold in fixed tranches whose price doubles
// each time another tranche's worth of shares has been issued.
struct ShareTrancheSchedule {
  double firstTrancheSize{25000.0};
  double trancheSize{25000.0};
  double basePrice{6250000.0};
};

inline constexpr ShareTrancheSchedule kDefaultShareSchedule{};

// Tiers are capped here. For basePrice >= 1, basePrice * 2^tier overflows to +inf
// from tier 1024 on, so the cap only affects prices that are already infinite.
inline constexpr core::i64 kMaxShareTier = 1100;

// At most this many tiers are listed in ShareTierQuote::reached.
inline constexpr core::i64 kMaxListedTiers = 64;

// min(kMaxShareTier, max(0, floor((totalShares - firstTrancheSize) / trancheSize))).
// Non-finite totals map to tier 0.
core::i64 shareTier(double totalShares, const ShareTrancheSchedule& s = kDefaultShareSchedule);

// basePrice * 2^tier, with tier clamped to [0, kMaxShareTier].
double tranchePrice(core::i64 tier, const ShareTrancheSchedule& s = kDefaultShareSchedule);

struct ShareTier {
  core::i64 index{0};
  double fromShares{0.0}; // inclusive
  double toShares{0.0};   // exclusive
  double price{0.0};
};

struct ShareTierQuote {
  core::i64 tier{0};
  double price{0.0};
  double sharesPerPurchase{0.0};

  // The last kMaxListedTiers tiers up to and including `tier`, in order.
  std::vector<ShareTier> reached;
  ShareTier next{};
};

// Tier i covers shares [firstTrancheSize + i*trancheSize, firstTrancheSize + (i+1)*trancheSize).
ShareTier describeTier(core::i64 tier, const ShareTrancheSchedule& s = kDefaultShareSchedule);

ShareTierQuote quoteShares(double totalShares, const ShareTrancheSchedule& s = kDefaultShareSchedule);

} // namespace shipcalc::econ
