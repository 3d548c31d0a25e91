// Copyright 2011 Emir Habul, see file COPYING

#include "value_tokenizer.h"

#include <cstdio>
#include <cstring>
#include <string>

namespace wikicsv {

namespace {  // unnamed

inline bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// mysqldump escape table; anything else stands for itself
inline char unescape(char c) {
  switch (c) {
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    case '0': return '\0';
    case 'Z': return '\032';
    default: return c;  // \' \" \\ and unknown escapes
  }
}

Status malformed(const char *what, size_t field) {
  char msg[160];
  snprintf(msg, sizeof(msg), "%s (field %zu)", what, field + 1);
  return Status(kMalformedTuple, msg);
}

}  // namespace

Status TokenizeTuple(const char *span, size_t len, vector<FieldToken> *fields) {
  size_t i = 0;
  size_t n = 0;  // fields produced so far

  while (i < len && is_blank(span[i]))
    i++;
  if (i == len) {
    fields->clear();
    return Status::OK();
  }

  while (1) {
    if (n == fields->size())
      fields->push_back(FieldToken());
    FieldToken &tok = (*fields)[n];
    tok.text.clear();

    while (i < len && is_blank(span[i]))
      i++;

    if (i < len && span[i] == '\'') {
      tok.type = FieldToken::kString;
      i++;
      bool closed = false;
      while (i < len) {
        // copy the run up to the next quote or backslash in one go
        size_t run = i;
        while (run < len && span[run] != '\'' && span[run] != '\\')
          run++;
        tok.text.append(span + i, run - i);
        i = run;
        if (i == len)
          break;
        if (span[i] == '\'') {
          i++;
          closed = true;
          break;
        }
        i++;  // backslash
        if (i == len)
          return malformed("escape pending at end of tuple", n);
        tok.text += unescape(span[i++]);
      }
      if (!closed)
        return malformed("unterminated quoted string", n);
      while (i < len && is_blank(span[i]))
        i++;
    } else {
      size_t start = i;
      while (i < len && span[i] != ',') {
        if (span[i] == '\'')
          return malformed("quote inside unquoted value", n);
        i++;
      }
      size_t end = i;
      while (end > start && is_blank(span[end - 1]))
        end--;
      if (end == start)
        return malformed("empty value", n);
      if (end - start == 4 && memcmp(span + start, "NULL", 4) == 0) {
        tok.type = FieldToken::kNull;
      } else {
        tok.type = FieldToken::kNumber;
        tok.text.assign(span + start, end - start);
      }
    }
    n++;

    if (i == len)
      break;
    if (span[i] != ',')
      return malformed("unexpected character after quoted string", n - 1);
    i++;
  }
  fields->resize(n);
  return Status::OK();
}

void AppendDumpLiteral(const FieldToken &token, string *out) {
  switch (token.type) {
    case FieldToken::kNull:
      out->append("NULL");
      return;
    case FieldToken::kNumber:
      out->append(token.text);
      return;
    case FieldToken::kString:
      break;
  }
  out->push_back('\'');
  for (size_t i = 0; i < token.text.size(); i++) {
    char c = token.text[i];
    switch (c) {
      case '\0': out->append("\\0"); break;
      case '\n': out->append("\\n"); break;
      case '\r': out->append("\\r"); break;
      case '\032': out->append("\\Z"); break;
      case '\\': out->append("\\\\"); break;
      case '\'': out->append("\\'"); break;
      case '"': out->append("\\\""); break;
      default: out->push_back(c);
    }
  }
  out->push_back('\'');
}

string FormatDumpTuple(const vector<FieldToken> &fields) {
  string out;
  for (size_t i = 0; i < fields.size(); i++) {
    if (i) out += ",";
    AppendDumpLiteral(fields[i], &out);
  }
  return out;
}

}  // namespace wikicsv
