#pragma once

#include <string>
#include <string_view>

namespace sportsledger::db {

/*
  Status of a repository write.

  Backends translate their own failures (sqlite result codes, trigger
  aborts, map collisions) into these codes; the store turns them into
  the ledger's exception types. Nothing above db/ sees sqlite errors.
*/
enum class ErrorCode {
  OK = 0,

  // referenced row is absent
  NotFound,
  // primary key, hash or (game, revision) already taken
  AlreadyExists,
  // proposal status did not move forward
  Conflict,
  Busy,

  // foreign key or check constraint failed
  ConstraintViolation,
  // update or delete of a ledger row was refused
  ImmutableViolation,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::ImmutableViolation: return "immutable_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace sportsledger::db
