// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_STATUS_H_
#define SRC_STATUS_H_

#include <string>

#include "wikicsv_stubs_internal.h"

namespace wikicsv {

// Every failure is fatal for a conversion run, so there is no retry
// classification here, just what went wrong.
enum ErrorCode {
  kOk = 0,
  kMalformedTuple,      // unterminated quote/escape or bad tuple element
  kMalformedStatement,  // broken INSERT structure or truncated statement
  kSchemaMismatch,      // row does not fit the table schema
  kConfigurationError,  // contradictory or invalid filter settings
  kUnsupportedTable,    // no schema for the requested table
  kIoError              // cannot open, read, decompress or write
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
    case kOk:
      return "OK";
    case kMalformedTuple:
      return "MalformedTupleError";
    case kMalformedStatement:
      return "MalformedStatementError";
    case kSchemaMismatch:
      return "SchemaMismatchError";
    case kConfigurationError:
      return "ConfigurationError";
    case kUnsupportedTable:
      return "UnsupportedTableError";
    case kIoError:
      return "IoError";
  }
  return "UnknownError";
}

class Status {
 public:
  Status() : code_(kOk) { }
  Status(ErrorCode code, const string &message)
  : code_(code), message_(message) { }

  static Status OK() { return Status(); }

  bool ok() const { return code_ == kOk; }
  ErrorCode code() const { return code_; }
  const string &message() const { return message_; }

  // "SchemaMismatchError: row 12 has 11 fields, table expects 12"
  string ToString() const {
    if (ok())
      return "OK";
    return string(error_code_name(code_)) + ": " + message_;
  }

 private:
  ErrorCode code_;
  string message_;
};

}  // namespace wikicsv

#endif  // SRC_STATUS_H_
