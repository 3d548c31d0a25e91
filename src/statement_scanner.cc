// Copyright 2011 Emir Habul, see file COPYING

#include "statement_scanner.h"

#include <cctype>
#include <cstdio>
#include <string>

namespace wikicsv {

namespace {  // unnamed

bool is_word_char(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool keyword_equals(const string &word, const char *keyword) {
  size_t len = strlen(keyword);
  if (word.size() != len)
    return false;
  for (size_t i = 0; i < len; i++) {
    if (toupper(static_cast<unsigned char>(word[i])) != keyword[i])
      return false;
  }
  return true;
}

}  // namespace

Status StatementScanner::run() {
  while (!done_) {
    if (eof())
      break;
    char c = get();
    if (isspace(static_cast<unsigned char>(c)) || c == ';')
      continue;
    if (c == '-' && peek() == '-') {  // -- comment
      skip_after('\n');
    } else if (c == '#') {  // # comment
      skip_after('\n');
    } else if (c == '/' && peek() == '*') {
      get();
      skip_after('*', '/');  // also /*!40101 SET ... */ version comments
    } else if (isalpha(static_cast<unsigned char>(c))) {
      string word(1, c);
      word += read_word();
      if (keyword_equals(word, "INSERT")) {
        Status status = insert_command();
        if (!status.ok())
          return status;
      } else {
        skip_command();  // don't care
      }
    } else {
      skip_command();
    }
  }
  return f_->status();
}

// INSERT [IGNORE] INTO `table` [(`col`,...)] VALUES (...),(...);
Status StatementScanner::insert_command() {
  skip_blanks();
  string word = read_word();
  if (keyword_equals(word, "IGNORE")) {
    skip_blanks();
    word = read_word();
  }
  if (!keyword_equals(word, "INTO"))
    return error(kMalformedStatement, "expected INTO after INSERT");

  skip_blanks();
  if (!read_identifier(&table_))
    return error(kMalformedStatement, "missing table name after INSERT INTO");

  columns_.clear();
  skip_blanks();
  if (peek() == '(') {
    get();
    while (1) {
      skip_blanks();
      string column;
      if (!read_identifier(&column))
        return error(kMalformedStatement, "bad column list");
      columns_.push_back(column);
      skip_blanks();
      char c = get();
      if (c == ',')
        continue;
      if (c == ')')
        break;
      return error(kMalformedStatement, "bad column list");
    }
  }

  skip_blanks();
  word = read_word();
  if (!keyword_equals(word, "VALUES"))
    return error(kMalformedStatement, "expected VALUES in INSERT INTO `" +
        table_ + "`");

  if (!options_.table.empty() && table_ != options_.table) {
    skipped_statements_++;
    skip_command();
    return Status::OK();
  }

  statements_++;
  Status status = handler_->begin_statement(table_, columns_);
  if (!status.ok())
    return status;

  while (1) {
    skip_blanks();
    if (eof())
      return error(kMalformedStatement, "input ends inside INSERT statement");
    if (get() != '(')
      return error(kMalformedStatement, "expected '(' to start a tuple");
    status = read_tuple();
    if (!status.ok())
      return status;
    tuples_++;
    status = handler_->tuple(tuple_);
    if (!status.ok())
      return status;

    skip_blanks();
    if (eof())
      return error(kMalformedStatement, "input ends inside INSERT statement");
    char c = get();
    if (c == ',')
      continue;
    if (c == ';')
      break;
    return error(kMalformedStatement, "expected ',' or ';' after a tuple");
  }

  if (options_.max_statements && statements_ >= options_.max_statements)
    done_ = true;
  return Status::OK();
}

// Collects the tuple interior into tuple_. Parentheses and quotes are only
// tracked to find the closing ')'; decoding is left to TokenizeTuple.
Status StatementScanner::read_tuple() {
  tuple_.clear();
  int depth = 1;
  bool in_quote = false;
  bool escaped = false;
  while (1) {
    if (PREDICT_FALSE(eof())) {
      if (!f_->status().ok())
        return f_->status();
      char msg[100];
      snprintf(msg, sizeof(msg), "input ends inside tuple %llu",
          static_cast<unsigned long long>(tuples_ + 1));
      return error(kMalformedTuple, msg);
    }
    char c = get();
    if (in_quote) {
      if (escaped)
        escaped = false;
      else if (c == '\\')
        escaped = true;
      else if (c == '\'')
        in_quote = false;
    } else if (c == '\'') {
      in_quote = true;
    } else if (c == '(') {
      depth++;
    } else if (c == ')') {
      if (--depth == 0)
        break;
    }
    tuple_ += c;
  }
  if (tuple_.size() > peak_tuple_)
    peak_tuple_ = tuple_.size();
  return Status::OK();
}

// `name` (with `` for a literal backtick) or a bare word
bool StatementScanner::read_identifier(string *out) {
  out->clear();
  if (peek() == '`') {
    get();
    while (!eof()) {
      char c = get();
      if (c == '`') {
        if (peek() != '`')
          return !out->empty();
        get();
      }
      *out += c;
    }
    return false;
  }
  *out = read_word();
  return !out->empty();
}

string StatementScanner::read_word() {
  string out;
  while (!eof() && is_word_char(peek()))
    out += get();
  return out;
}

void StatementScanner::skip_blanks() {
  while (!eof() && isspace(static_cast<unsigned char>(peek())))
    get();
}

// Skip to the end of a statement we are not interested in.
void StatementScanner::skip_command() {
  while (!eof()) {
    char c = get();
    if (c == ';')
      break;
    if (c == '\'' || c == '"' || c == '`') {
      skip_quoted(c);
    } else if (c == '-' && peek() == '-') {
      skip_after('\n');
    } else if (c == '/' && peek() == '*') {
      get();
      skip_after('*', '/');
    }
  }
}

// Example: 'It\'s a string\\'
void StatementScanner::skip_quoted(char quote) {
  while (!eof()) {
    char c = get();
    if (c == '\\' && quote != '`')
      get();
    else if (c == quote)
      return;
  }
}

void StatementScanner::skip_after(char c1) {
  while (!eof() && get() != c1) { }
}

void StatementScanner::skip_after(char c1, char c2) {
  char prev = get();
  while (!eof()) {
    char current = get();
    if (prev == c1 && current == c2)
      return;
    prev = current;
  }
}

Status StatementScanner::error(ErrorCode code, const string &what) {
  Status io = f_->status();
  if (!io.ok())
    return io;
  char where[64];
  snprintf(where, sizeof(where), " (line %llu)",
      static_cast<unsigned long long>(line_));
  return Status(code, what + where);
}

}  // namespace wikicsv
