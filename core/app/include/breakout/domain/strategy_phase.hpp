#pragma once

#include <optional>
#include <string>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyPhase
// -----------------------------------------------------------------------------
// Responsibility: Lifecycle state of a Strategy.
//
//   Pending ──► Lookback ──► Monitoring ──► Completed
//      │            │             │
//      └────────────┴─────────────┴──────► Cancelled   (explicit removal)
//
// Phases only move forward. Completed and Cancelled are terminal: no further
// tracker updates are accepted. Pending and Lookback may also jump straight
// to Completed at market close, or when no candidate could be selected.
// -----------------------------------------------------------------------------
enum class StrategyPhase {
  Pending,
  Lookback,
  Monitoring,
  Completed,
  Cancelled,
};

// -----------------------------------------------------------------------------
// CompletionReason
// -----------------------------------------------------------------------------
// Why a terminal phase was reached. None while the strategy is live.
// -----------------------------------------------------------------------------
enum class CompletionReason {
  None,
  StopLoss,
  MarketClose,
  NoCandidates,
  Removed,
};

inline bool isTerminal(StrategyPhase phase) {
  return phase == StrategyPhase::Completed ||
         phase == StrategyPhase::Cancelled;
}

// -------------------------------------------------------------------------
// isForwardTransition(from, to)
// -------------------------------------------------------------------------
// @brief  True iff `to` is a legal successor of `from`.
//
// @details
// Mirrors the diagram above. Self-transitions are not transitions and
// return false. Used by Strategy::transitionTo() to refuse anything else.
// -------------------------------------------------------------------------
inline bool isForwardTransition(StrategyPhase from, StrategyPhase to) {
  using P = StrategyPhase;
  switch (from) {
    case P::Pending:
      return to == P::Lookback || to == P::Completed || to == P::Cancelled;
    case P::Lookback:
      return to == P::Monitoring || to == P::Completed || to == P::Cancelled;
    case P::Monitoring:
      return to == P::Completed || to == P::Cancelled;
    case P::Completed:
    case P::Cancelled:
      return false;
  }
  return false;
}

const char* phaseToString(StrategyPhase phase);
std::optional<StrategyPhase> parsePhase(const std::string& text);

const char* completionReasonToString(CompletionReason reason);
std::optional<CompletionReason> parseCompletionReason(const std::string& text);

}  // namespace domain
}  // namespace breakout
