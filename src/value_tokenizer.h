// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_VALUE_TOKENIZER_H_
#define SRC_VALUE_TOKENIZER_H_

#include <stddef.h>
#include <string>
#include <vector>

#include "status.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

// One decoded SQL value from a tuple.
struct FieldToken {
  enum Type {
    kString = 0,  // 'quoted', text holds the unescaped value
    kNumber = 1,  // unquoted literal, text holds it verbatim
    kNull = 2     // unquoted NULL, text is empty
  };

  FieldToken() : type(kNull) { }
  FieldToken(Type t, const string &s) : type(t), text(s) { }

  static FieldToken String(const string &s) { return FieldToken(kString, s); }
  static FieldToken Number(const string &s) { return FieldToken(kNumber, s); }
  static FieldToken Null() { return FieldToken(kNull, ""); }

  bool is_null() const { return type == kNull; }

  bool operator==(const FieldToken &other) const {
    return type == other.type && text == other.text;
  }
  bool operator!=(const FieldToken &other) const {
    return !(*this == other);
  }

  Type type;
  string text;
};

// Split the interior of one "(...)" tuple into fields, resolving MySQL dump
// escapes. Only backslash escapes exist in dump format: '' is not an
// embedded quote. Elements of *fields are reused between calls.
//
// Example: 1,'It\'s',NULL  ->  Number("1"), String("It's"), Null
Status TokenizeTuple(const char *span, size_t len, vector<FieldToken> *fields);

inline Status TokenizeTuple(const string &span, vector<FieldToken> *fields) {
  return TokenizeTuple(span.data(), span.size(), fields);
}

// Append the token the way mysqldump writes it.
void AppendDumpLiteral(const FieldToken &token, string *out);

// Inverse of TokenizeTuple: "1,'It\\'s',NULL"
string FormatDumpTuple(const vector<FieldToken> &fields);

}  // namespace wikicsv

#endif  // SRC_VALUE_TOKENIZER_H_
