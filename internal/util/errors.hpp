#pragma once

#include <stdexcept>
#include <string>

namespace sportsledger::util {

/*
  Central error types.

  Repository backends report portable db::Result codes; the store
  translates them into these. Integrity and immutability violations are
  never swallowed: they always reach the caller.
*/

class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stored content no longer matches its hash.
class HashMismatchError : public IntegrityError {
 public:
  HashMismatchError(std::string entity_type, std::string id, std::string expected, std::string actual)
      : IntegrityError("hash mismatch for " + entity_type + " " + id + ": expected " + expected + ", actual " + actual),
        entity_type_(std::move(entity_type)),
        id_(std::move(id)),
        expected_(std::move(expected)),
        actual_(std::move(actual)) {
  }

  const std::string& entity_type() const {
    return entity_type_;
  }
  const std::string& id() const {
    return id_;
  }
  const std::string& expected() const {
    return expected_;
  }
  const std::string& actual() const {
    return actual_;
  }

 private:
  std::string entity_type_;
  std::string id_;
  std::string expected_;
  std::string actual_;
};

class ImmutabilityViolationError : public std::runtime_error {
 public:
  ImmutabilityViolationError(std::string operation, std::string entity_type)
      : std::runtime_error(operation + " is not permitted on " + entity_type + " records"),
        operation_(std::move(operation)),
        entity_type_(std::move(entity_type)) {
  }

  const std::string& operation() const {
    return operation_;
  }
  const std::string& entity_type() const {
    return entity_type_;
  }

 private:
  std::string operation_;
  std::string entity_type_;
};

class NotFoundError : public std::runtime_error {
 public:
  NotFoundError(std::string entity_type, std::string id)
      : std::runtime_error(entity_type + " not found: " + id), entity_type_(std::move(entity_type)), id_(std::move(id)) {
  }

  const std::string& entity_type() const {
    return entity_type_;
  }
  const std::string& id() const {
    return id_;
  }

 private:
  std::string entity_type_;
  std::string id_;
};

// Insert referenced an id that does not exist (or is inconsistent with the record).
class ReferentialError : public std::runtime_error {
 public:
  ReferentialError(std::string entity_type, std::string id, const std::string& detail)
      : std::runtime_error(entity_type + " " + id + ": " + detail), entity_type_(std::move(entity_type)), id_(std::move(id)) {
  }

  const std::string& entity_type() const {
    return entity_type_;
  }
  const std::string& id() const {
    return id_;
  }

 private:
  std::string entity_type_;
  std::string id_;
};

class UniquenessError : public std::runtime_error {
 public:
  UniquenessError(std::string entity_type, std::string key)
      : std::runtime_error(entity_type + " already exists for " + key), entity_type_(std::move(entity_type)), key_(std::move(key)) {
  }

  const std::string& entity_type() const {
    return entity_type_;
  }
  const std::string& key() const {
    return key_;
  }

 private:
  std::string entity_type_;
  std::string key_;
};

class InvalidTransitionError : public std::runtime_error {
 public:
  InvalidTransitionError(std::string from, std::string to)
      : std::runtime_error("invalid proposal status transition " + from + " -> " + to), from_(std::move(from)), to_(std::move(to)) {
  }

  const std::string& from() const {
    return from_;
  }
  const std::string& to() const {
    return to_;
  }

 private:
  std::string from_;
  std::string to_;
};

} // namespace sportsledger::util
