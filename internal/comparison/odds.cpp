#include "internal/comparison/odds.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace sportsledger::comparison {
namespace {

void RequireProbability(double p, const char* what) {
  if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
    throw std::invalid_argument(std::string(what) + " must be a probability in [0, 1]");
  }
}

std::optional<double> CentsToProbability(std::optional<double> cents, const char* what) {
  if (!cents) return std::nullopt;
  if (!std::isfinite(*cents) || *cents < 0.0 || *cents > 100.0) {
    throw std::invalid_argument(std::string(what) + " must be a price in [0, 100] cents");
  }
  return *cents / 100.0;
}

} // namespace

double AmericanToProbability(double american_odds) {
  if (!std::isfinite(american_odds) || std::fabs(american_odds) < 100.0) {
    throw std::invalid_argument("american odds must be <= -100 or >= +100");
  }
  if (american_odds > 0) {
    return 100.0 / (american_odds + 100.0);
  }
  const double line = -american_odds;
  return line / (line + 100.0);
}

NoVigPair RemoveVig(double raw_a, double raw_b) {
  RequireProbability(raw_a, "raw probability");
  RequireProbability(raw_b, "raw probability");

  const double total = raw_a + raw_b;
  if (total <= 0.0) {
    throw std::invalid_argument("raw probabilities must not both be zero");
  }
  return {raw_a / total, raw_b / total, total};
}

double MidPrice(std::optional<double> bid_cents, std::optional<double> ask_cents) {
  const auto bid = CentsToProbability(bid_cents, "bid");
  const auto ask = CentsToProbability(ask_cents, "ask");

  if (bid && ask) {
    if (*bid > *ask) {
      throw std::invalid_argument("bid above ask");
    }
    return (*bid + *ask) / 2.0;
  }
  if (bid) return *bid;
  if (ask) return *ask;
  throw std::invalid_argument("mid price needs a bid or an ask");
}

std::string_view ToString(EdgeDirection direction) {
  switch (direction) {
    case EdgeDirection::kMarketHigher:
      return "market_higher";
    case EdgeDirection::kSportsbookHigher:
      return "sportsbook_higher";
    case EdgeDirection::kNone:
      return "none";
  }
  return "none";
}

EdgeDirection ParseEdgeDirection(std::string_view text) {
  if (text == "market_higher") return EdgeDirection::kMarketHigher;
  if (text == "sportsbook_higher") return EdgeDirection::kSportsbookHigher;
  if (text == "none") return EdgeDirection::kNone;
  throw std::invalid_argument("unknown edge direction: " + std::string(text));
}

Edge ComputeEdge(double market_probability, double fair_probability, double threshold) {
  RequireProbability(market_probability, "market probability");
  RequireProbability(fair_probability, "fair probability");
  if (!std::isfinite(threshold) || threshold < 0.0) {
    throw std::invalid_argument("edge threshold must be non-negative");
  }

  Edge edge;
  edge.delta     = market_probability - fair_probability;
  edge.magnitude = std::fabs(edge.delta);
  edge.flagged   = edge.magnitude > threshold;
  if (edge.delta > 0) {
    edge.direction = EdgeDirection::kMarketHigher;
  } else if (edge.delta < 0) {
    edge.direction = EdgeDirection::kSportsbookHigher;
  }
  return edge;
}

} // namespace sportsledger::comparison
