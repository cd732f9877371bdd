#pragma once

namespace sportsledger::model::fields {

/*
  Keys of Snapshot::normalized_fields.

  sportsbook          best moneyline for the game across bookmakers
    event_id, home_team, away_team, commence_time,
    best_home_odds, best_away_odds (american), bookmaker_count
  prediction_market   binary market matched to the game, YES = home wins
    market_id, title, status, yes_bid, yes_ask (cents), volume

  Either object may be absent when the provider had nothing for the game.
*/

inline constexpr char kSportsbook[]       = "sportsbook";
inline constexpr char kPredictionMarket[] = "prediction_market";

inline constexpr char kEventId[]        = "event_id";
inline constexpr char kHomeTeam[]       = "home_team";
inline constexpr char kAwayTeam[]       = "away_team";
inline constexpr char kCommenceTime[]   = "commence_time";
inline constexpr char kBestHomeOdds[]   = "best_home_odds";
inline constexpr char kBestAwayOdds[]   = "best_away_odds";
inline constexpr char kBookmakerCount[] = "bookmaker_count";

inline constexpr char kMarketId[] = "market_id";
inline constexpr char kTitle[]    = "title";
inline constexpr char kStatus[]   = "status";
inline constexpr char kYesBid[]   = "yes_bid";
inline constexpr char kYesAsk[]   = "yes_ask";
inline constexpr char kVolume[]   = "volume";

} // namespace sportsledger::model::fields
