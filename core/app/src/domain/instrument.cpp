#include "breakout/domain/instrument.hpp"

#include <algorithm>
#include <cctype>

namespace breakout {
namespace domain {

namespace {

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return text;
}

}  // namespace

const char* indexToString(IndexName index) {
  switch (index) {
    case IndexName::Nifty:     return "NIFTY";
    case IndexName::BankNifty: return "BANKNIFTY";
    case IndexName::FinNifty:  return "FINNIFTY";
    case IndexName::Sensex:    return "SENSEX";
  }
  return "UNKNOWN";
}

std::optional<IndexName> parseIndex(const std::string& text) {
  const std::string u = upper(text);
  if (u == "NIFTY") return IndexName::Nifty;
  if (u == "BANKNIFTY") return IndexName::BankNifty;
  if (u == "FINNIFTY") return IndexName::FinNifty;
  if (u == "SENSEX") return IndexName::Sensex;
  return std::nullopt;
}

const char* optionTypeToString(OptionType type) {
  switch (type) {
    case OptionType::Call: return "CE";
    case OptionType::Put:  return "PE";
  }
  return "??";
}

std::optional<OptionType> parseOptionType(const std::string& text) {
  const std::string u = upper(text);
  if (u == "CE" || u == "CALL") return OptionType::Call;
  if (u == "PE" || u == "PUT") return OptionType::Put;
  return std::nullopt;
}

int defaultStrikeStep(IndexName index) {
  switch (index) {
    case IndexName::Nifty:
    case IndexName::FinNifty:
      return 50;
    case IndexName::BankNifty:
    case IndexName::Sensex:
      return 100;
  }
  return 50;
}

std::string describe(const InstrumentKey& key) {
  return std::string(indexToString(key.index)) + " " +
         format_date(key.expiry) + " " + std::to_string(key.strike) +
         optionTypeToString(key.type);
}

}  // namespace domain
}  // namespace breakout
