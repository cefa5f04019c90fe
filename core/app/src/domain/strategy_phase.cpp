#include "breakout/domain/strategy_phase.hpp"

namespace breakout {
namespace domain {

const char* phaseToString(StrategyPhase phase) {
  switch (phase) {
    case StrategyPhase::Pending:    return "pending";
    case StrategyPhase::Lookback:   return "lookback";
    case StrategyPhase::Monitoring: return "monitoring";
    case StrategyPhase::Completed:  return "completed";
    case StrategyPhase::Cancelled:  return "cancelled";
  }
  return "unknown";
}

std::optional<StrategyPhase> parsePhase(const std::string& text) {
  if (text == "pending") return StrategyPhase::Pending;
  if (text == "lookback") return StrategyPhase::Lookback;
  if (text == "monitoring") return StrategyPhase::Monitoring;
  if (text == "completed") return StrategyPhase::Completed;
  if (text == "cancelled") return StrategyPhase::Cancelled;
  return std::nullopt;
}

const char* completionReasonToString(CompletionReason reason) {
  switch (reason) {
    case CompletionReason::None:         return "none";
    case CompletionReason::StopLoss:     return "stop_loss";
    case CompletionReason::MarketClose:  return "market_close";
    case CompletionReason::NoCandidates: return "no_candidates";
    case CompletionReason::Removed:      return "removed";
  }
  return "unknown";
}

std::optional<CompletionReason> parseCompletionReason(const std::string& text) {
  if (text == "none") return CompletionReason::None;
  if (text == "stop_loss") return CompletionReason::StopLoss;
  if (text == "market_close") return CompletionReason::MarketClose;
  if (text == "no_candidates") return CompletionReason::NoCandidates;
  if (text == "removed") return CompletionReason::Removed;
  return std::nullopt;
}

}  // namespace domain
}  // namespace breakout
