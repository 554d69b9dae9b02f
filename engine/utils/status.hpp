#pragma once

#include <string>

#include "utils/error.hpp"

namespace geogrid {

using StatusCode = ErrorCode;

class Status {
 public:
  Status(StatusCode code, const std::string& msg);
  Status();
  ~Status();

  Status(const Status& s);

  Status& operator=(const Status& s);

  Status(Status&& s);

  Status& operator=(Status&& s);

  static Status OK() { return Status(); }

  bool ok() const { return code() == 0; }

  bool IsKeyNotFound() const { return code() == GEO_KEY_NOT_FOUND; }

  bool IsInvalidCoordinate() const { return code() == GEO_INVALID_COORDINATE; }

  // A top-N query whose frontier expansion ran out before collecting enough keys.
  bool IsExpansionExhausted() const { return code() == GEO_EXPANSION_EXHAUSTED; }

  StatusCode code() const {
    return (state_ == nullptr) ? 0 : *(StatusCode*)(state_);
  }

  std::string message() const;

  std::string ToString() const;

 private:
  inline void CopyFrom(const Status& s);

  inline void MoveFrom(Status& s);

 private:
  char* state_ = nullptr;
};

}  // namespace geogrid
