#include "internal/ingest/payload_normalizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "internal/model/normalized_fields.hpp"
#include "internal/util/json.hpp"

namespace sportsledger::ingest {
namespace {

namespace fields = model::fields;

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

constexpr std::array<std::string_view, 35> kCityWords = {
    "los",       "angeles",    "new",       "york",      "san",       "francisco", "antonio",
    "golden",    "state",      "oklahoma",  "city",      "portland",  "trail",     "minnesota",
    "indiana",   "milwaukee",  "philadelphia", "phoenix", "detroit",  "chicago",   "boston",
    "miami",     "orlando",    "charlotte", "atlanta",   "cleveland", "toronto",   "brooklyn",
    "washington", "denver",    "utah",      "sacramento", "memphis",  "dallas",    "houston"};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool IsCityWord(std::string_view word) {
  return std::find(kCityWords.begin(), kCityWords.end(), word) != kCityWords.end();
}

const ListValue* ListOrField(const Value& payload, const char* key) {
  if (payload.kind_case() == Value::kListValue) return &payload.list_value();
  if (payload.kind_case() == Value::kStructValue) return util::GetList(payload.struct_value(), key);
  return nullptr;
}

std::string RequireString(const Struct& object, const std::string& key) {
  auto value = util::GetString(object, key);
  if (!value || value->empty()) {
    throw std::invalid_argument("missing string field " + key);
  }
  return *value;
}

std::optional<std::string> OptionalString(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return std::nullopt;
  }
  if (it->second.kind_case() != Value::kStringValue) {
    throw std::invalid_argument("field " + key + " must be a string");
  }
  return it->second.string_value();
}

int64_t RequireInteger(const Struct& object, const std::string& key) {
  auto value = util::GetNumber(object, key);
  if (!value || !std::isfinite(*value) || std::trunc(*value) != *value) {
    throw std::invalid_argument("field " + key + " must be an integer");
  }
  // [-2^63, 2^63) is exactly the doubles that fit
  const double limit = std::ldexp(1.0, 63);
  if (*value < -limit || *value >= limit) {
    throw std::invalid_argument("field " + key + " is out of range");
  }
  return static_cast<int64_t>(*value);
}

// Kalshi reports an empty side as 0.
std::optional<double> PositiveNumber(const Struct& object, const std::string& key) {
  auto value = util::GetNumber(object, key);
  if (!value || *value <= 0.0) return std::nullopt;
  return value;
}

const Struct* FindEvent(const Value& payload, const std::string& game_id) {
  if (payload.kind_case() == Value::kStructValue && util::GetList(payload.struct_value(), "bookmakers")) {
    const auto& event = payload.struct_value();
    return util::GetString(event, "id") == game_id ? &event : nullptr;
  }
  const auto* events = ListOrField(payload, "events");
  if (!events) return nullptr;
  for (const auto& value : events->values()) {
    if (value.kind_case() == Value::kStructValue && util::GetString(value.struct_value(), "id") == game_id) {
      return &value.struct_value();
    }
  }
  return nullptr;
}

model::Outcome OutcomeFromExplicit(const Struct& doc) {
  model::Outcome outcome;
  outcome.game_id     = RequireString(doc, "game_id");
  outcome.occurred_at = util::ParseTimestamp(RequireString(doc, "occurred_at"));
  outcome.source      = RequireString(doc, "source");

  const auto* score = util::GetStruct(doc, "final_score");
  if (!score) {
    throw std::invalid_argument("missing object field final_score");
  }
  outcome.final_score.home = RequireInteger(*score, "home");
  outcome.final_score.away = RequireInteger(*score, "away");
  outcome.winner           = OptionalString(doc, "winner");

  if (const auto* stats = util::GetStruct(doc, "stats_summary")) {
    outcome.stats_summary = *stats;
  }
  if (doc.fields().count("revision")) {
    outcome.revision = RequireInteger(doc, "revision");
  }
  outcome.supersedes_outcome_id = OptionalString(doc, "supersedes_outcome_id");
  return outcome;
}

model::Outcome OutcomeFromScores(const Struct& game) {
  if (!util::GetBool(game, "completed").value_or(false)) {
    throw std::invalid_argument("score entry is not a completed game");
  }

  const auto home_team = RequireString(game, "home_team");
  const auto away_team = RequireString(game, "away_team");
  const auto* scores   = util::GetList(game, "scores");
  if (!scores) {
    throw std::invalid_argument("completed game has no scores");
  }

  std::optional<int64_t> home;
  std::optional<int64_t> away;
  for (const auto& entry : scores->values()) {
    if (entry.kind_case() != Value::kStructValue) continue;
    const auto& s    = entry.struct_value();
    const auto  name = util::GetString(s, "name");

    // the scores feed sends numbers as strings
    std::optional<int64_t> points;
    if (auto text = util::GetString(s, "score")) {
      try {
        points = std::stoll(*text);
      } catch (const std::exception&) {
        throw std::invalid_argument("unparseable score '" + *text + "'");
      }
    } else if (util::GetNumber(s, "score")) {
      points = RequireInteger(s, "score");
    }
    if (!name || !points) continue;
    if (*name == home_team) home = points;
    if (*name == away_team) away = points;
  }
  if (!home || !away) {
    throw std::invalid_argument("scores missing for " + home_team + " or " + away_team);
  }

  model::Outcome outcome;
  outcome.game_id          = RequireString(game, "id");
  outcome.occurred_at      = util::ParseTimestamp(RequireString(game, "commence_time"));
  outcome.final_score.home = *home;
  outcome.final_score.away = *away;
  if (*home > *away) {
    outcome.winner = home_team;
  } else if (*away > *home) {
    outcome.winner = away_team;
  }
  outcome.source = kOddsApiProvider;

  auto& stats          = *outcome.stats_summary.mutable_fields();
  stats["home_team"]   = util::StringValue(home_team);
  stats["away_team"]   = util::StringValue(away_team);
  for (const std::string key : {"sport_key", "sport_title", "last_update"}) {
    if (auto value = util::GetString(game, key)) stats[key] = util::StringValue(*value);
  }
  return outcome;
}

ListValue OptionalList(const Struct& doc, const std::string& key) {
  auto it = doc.fields().find(key);
  if (it == doc.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return {};
  }
  if (it->second.kind_case() != Value::kListValue) {
    throw std::invalid_argument("field " + key + " must be a list");
  }
  return it->second.list_value();
}

} // namespace

std::vector<std::string> TeamKeywords(std::string_view team_name) {
  const auto               lowered = Lower(team_name);
  std::vector<std::string> keywords{lowered};

  std::istringstream       words(lowered);
  std::string              word;
  std::string              last;
  while (words >> word) last = word;

  if (!last.empty() && last != lowered && !IsCityWord(last)) {
    keywords.push_back(last);
  }
  return keywords;
}

bool TitleMatchesTeams(std::string_view title, std::string_view home_team, std::string_view away_team) {
  if (home_team.empty() || away_team.empty()) return false;

  const auto lowered  = Lower(title);
  const auto contains = [&](const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](const std::string& kw) { return lowered.find(kw) != std::string::npos; });
  };
  return contains(TeamKeywords(home_team)) && contains(TeamKeywords(away_team));
}

std::optional<Struct> NormalizeSportsbook(const Value& payload, const std::string& game_id) {
  const auto* event = FindEvent(payload, game_id);
  if (!event) return std::nullopt;

  const auto home_team = util::GetString(*event, "home_team").value_or("");
  const auto away_team = util::GetString(*event, "away_team").value_or("");

  std::optional<double> best_home;
  std::optional<double> best_away;
  int                   bookmaker_count = 0;

  if (const auto* bookmakers = util::GetList(*event, "bookmakers")) {
    for (const auto& bookmaker : bookmakers->values()) {
      if (bookmaker.kind_case() != Value::kStructValue) continue;
      ++bookmaker_count;
      const auto* markets = util::GetList(bookmaker.struct_value(), "markets");
      if (!markets) continue;
      for (const auto& market : markets->values()) {
        if (market.kind_case() != Value::kStructValue || util::GetString(market.struct_value(), "key") != "h2h") continue;
        const auto* outcomes = util::GetList(market.struct_value(), "outcomes");
        if (!outcomes) continue;
        for (const auto& o : outcomes->values()) {
          if (o.kind_case() != Value::kStructValue) continue;
          const auto name  = util::GetString(o.struct_value(), "name");
          const auto price = util::GetNumber(o.struct_value(), "price");
          if (!name || !price) continue;
          if (*name == home_team && (!best_home || *price > *best_home)) best_home = price;
          if (*name == away_team && (!best_away || *price > *best_away)) best_away = price;
        }
      }
    }
  }

  Struct out;
  auto&  f = *out.mutable_fields();
  f[fields::kEventId]        = util::StringValue(game_id);
  f[fields::kHomeTeam]       = util::StringValue(home_team);
  f[fields::kAwayTeam]       = util::StringValue(away_team);
  f[fields::kCommenceTime]   = util::GetString(*event, "commence_time") ? util::StringValue(*util::GetString(*event, "commence_time"))
                                                                        : util::NullValue();
  f[fields::kBookmakerCount] = util::NumberValue(bookmaker_count);
  if (best_home) f[fields::kBestHomeOdds] = util::NumberValue(*best_home);
  if (best_away) f[fields::kBestAwayOdds] = util::NumberValue(*best_away);
  return out;
}

std::optional<Struct> NormalizePredictionMarket(const Value& payload, const std::string& home_team, const std::string& away_team) {
  const auto* markets = ListOrField(payload, "markets");
  if (!markets) return std::nullopt;

  for (const auto& value : markets->values()) {
    if (value.kind_case() != Value::kStructValue) continue;
    const auto& market = value.struct_value();
    const auto  title  = util::GetString(market, "title").value_or("");
    if (!TitleMatchesTeams(title, home_team, away_team)) continue;

    Struct out;
    auto&  f = *out.mutable_fields();
    f[fields::kMarketId] = util::StringValue(util::GetString(market, "ticker").value_or(""));
    f[fields::kTitle]    = util::StringValue(title);
    f[fields::kStatus]   = util::StringValue(util::GetString(market, "status").value_or(""));
    if (auto bid = PositiveNumber(market, "yes_bid")) f[fields::kYesBid] = util::NumberValue(*bid);
    if (auto ask = PositiveNumber(market, "yes_ask")) f[fields::kYesAsk] = util::NumberValue(*ask);
    if (auto volume = util::GetNumber(market, "volume")) f[fields::kVolume] = util::NumberValue(*volume);
    return out;
  }
  return std::nullopt;
}

Struct NormalizeFields(const std::string& game_id, const Struct& raw_payloads) {
  Struct normalized;

  auto odds = raw_payloads.fields().find(kOddsApiProvider);
  if (odds == raw_payloads.fields().end()) {
    return normalized;
  }
  auto book = NormalizeSportsbook(odds->second, game_id);
  if (!book) {
    return normalized;
  }

  const auto home_team = util::GetString(*book, fields::kHomeTeam).value_or("");
  const auto away_team = util::GetString(*book, fields::kAwayTeam).value_or("");
  (*normalized.mutable_fields())[fields::kSportsbook].mutable_struct_value()->Swap(&*book);

  auto kalshi = raw_payloads.fields().find(kKalshiProvider);
  if (kalshi != raw_payloads.fields().end()) {
    if (auto market = NormalizePredictionMarket(kalshi->second, home_team, away_team)) {
      (*normalized.mutable_fields())[fields::kPredictionMarket].mutable_struct_value()->Swap(&*market);
    }
  }
  return normalized;
}

model::Snapshot ParseCollectorPayload(const std::string& json, const std::string& schema_version) {
  const auto doc = util::ParseStruct(json);

  model::Snapshot snapshot;
  snapshot.game_id        = RequireString(doc, "game_id");
  snapshot.schema_version = schema_version;
  if (auto collected_at = OptionalString(doc, "collected_at")) {
    snapshot.collected_at = util::ParseTimestamp(*collected_at);
  }

  const auto* providers = util::GetStruct(doc, "providers");
  if (!providers || providers->fields().empty()) {
    throw std::invalid_argument("collector payload has no providers");
  }
  for (const auto& [name, entry] : providers->fields()) {
    if (entry.kind_case() != Value::kStructValue) {
      throw std::invalid_argument("provider " + name + " must be an object");
    }
    const auto& provider = entry.struct_value();
    snapshot.source_versions[name] = RequireString(provider, "version");

    auto payload = provider.fields().find("payload");
    if (payload == provider.fields().end()) {
      throw std::invalid_argument("provider " + name + " has no payload");
    }
    (*snapshot.raw_payloads.mutable_fields())[name] = payload->second;
  }

  snapshot.normalized_fields = NormalizeFields(snapshot.game_id, snapshot.raw_payloads);
  return snapshot;
}

model::Outcome ParseOutcomePayload(const std::string& json) {
  const auto doc = util::ParseStruct(json);
  if (doc.fields().count("scores")) {
    return OutcomeFromScores(doc);
  }
  return OutcomeFromExplicit(doc);
}

model::ImprovementProposal ParseProposalPayload(const std::string& json) {
  const auto doc = util::ParseStruct(json);

  model::ImprovementProposal proposal;
  proposal.proposal_text = RequireString(doc, "proposal_text");

  const auto* ids = util::GetList(doc, "based_on_evaluation_ids");
  if (!ids) {
    throw std::invalid_argument("missing list field based_on_evaluation_ids");
  }
  for (const auto& id : ids->values()) {
    if (id.kind_case() != Value::kStringValue) {
      throw std::invalid_argument("based_on_evaluation_ids must hold strings");
    }
    proposal.based_on_evaluation_ids.push_back(id.string_value());
  }

  proposal.suggested_schema_additions = OptionalList(doc, "suggested_schema_additions");
  proposal.suggested_modules          = OptionalList(doc, "suggested_modules");
  proposal.expected_impact            = OptionalString(doc, "expected_impact").value_or("");
  return proposal;
}

} // namespace sportsledger::ingest
