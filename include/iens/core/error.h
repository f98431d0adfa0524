#pragma once
// iens/core/error.h
//
// Coded errors for the ensemble/analysis pipeline.
//
// Functions follow the `bool Fn(..., Error* err)` convention: return false on
// failure and fill *err (when non-null) with a code plus a message that names
// the offending path, pattern, slot or run.

#include "iens/core/types.h"

#include <ostream>
#include <string>
#include <string_view>

namespace iens {

enum class ErrorCode : u8 {
  kOk = 0,
  kNotFound = 1,         // template, input or result path does not exist
  kSlotNotFound = 2,     // required substitution target absent from template
  kInvalidSpec = 3,      // bad run count, bin width, range, missing surface_z...
  kFormat = 4,           // result file schema lacks a required column
  kExternalProcess = 5,  // simulator exited non-zero
  kIo = 6,               // filesystem read/write failure
};

inline constexpr std::string_view ToString(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kNotFound: return "not_found";
    case ErrorCode::kSlotNotFound: return "slot_not_found";
    case ErrorCode::kInvalidSpec: return "invalid_spec";
    case ErrorCode::kFormat: return "format";
    case ErrorCode::kExternalProcess: return "external_process";
    case ErrorCode::kIo: return "io";
  }
  return "unknown";
}

struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const noexcept { return code == ErrorCode::kOk; }

  void Clear() {
    code = ErrorCode::kOk;
    message.clear();
  }

  std::string ToString() const {
    std::string out(::iens::ToString(code));
    if (!message.empty()) {
      out += ": ";
      out += message;
    }
    return out;
  }
};

inline std::ostream& operator<<(std::ostream& os, const Error& e) {
  os << e.ToString();
  return os;
}

inline void SetErr(Error* err, ErrorCode code, const std::string& msg) {
  if (!err) return;
  err->code = code;
  err->message = msg;
}

// Prepend context to an error produced by a callee.
inline void AddContext(Error* err, const std::string& ctx) {
  if (!err) return;
  err->message = ctx + ": " + err->message;
}

}  // namespace iens
