#ifndef SHAREPOOL_SHAREPOOL_HPP
#define SHAREPOOL_SHAREPOOL_HPP

// =============================================================================
// SharePool - Deposit pool with proportional proceeds distribution
//
//   ProceedsPool      deposit / withdraw / deposit_proceeds / claim_proceeds
//   ClaimLedger       claim unit balances, calls the settlement hooks
//   RewardAccumulator cumulative reward-per-share (x PRECISION)
//   RewardBook        per-account checkpoint + locked proceeds
//   IAssetMover       underlying asset custody (AssetToken + TokenMover)
//
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "asset.hpp"
#include "claim_ledger.hpp"
#include "rewards.hpp"
#include "events.hpp"
#include "config.hpp"
#include "pool.hpp"

#endif // SHAREPOOL_SHAREPOOL_HPP
