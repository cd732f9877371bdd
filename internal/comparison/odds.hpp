#pragma once

#include <optional>
#include <string_view>

namespace sportsledger::comparison {

/*
  Odds and price arithmetic.

  All functions are pure. Probabilities are in [0, 1]; prediction-market
  prices are in cents [0, 100]. Out-of-domain input throws
  std::invalid_argument.
*/

// -L -> L / (L + 100), +L -> 100 / (L + 100). |odds| must be >= 100.
double AmericanToProbability(double american_odds);

struct NoVigPair {
  double fair_a    = 0.0;
  double fair_b    = 0.0;
  double overround = 0.0; // raw_a + raw_b
};

// Divides each raw implied probability by their sum.
NoVigPair RemoveVig(double raw_a, double raw_b);

// Mid of bid and ask in probability units. A one-sided quote falls back to
// the side that is present.
double MidPrice(std::optional<double> bid_cents, std::optional<double> ask_cents);

enum class EdgeDirection { kNone, kMarketHigher, kSportsbookHigher };

std::string_view ToString(EdgeDirection direction);
EdgeDirection    ParseEdgeDirection(std::string_view text);

struct Edge {
  double        delta     = 0.0; // market - fair
  double        magnitude = 0.0;
  bool          flagged   = false;
  EdgeDirection direction = EdgeDirection::kNone;
};

// flagged when |market - fair| > threshold.
Edge ComputeEdge(double market_probability, double fair_probability, double threshold);

} // namespace sportsledger::comparison
