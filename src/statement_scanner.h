// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_STATEMENT_SCANNER_H_
#define SRC_STATEMENT_SCANNER_H_

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "file_io.h"
#include "status.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

// Receives the tuples of every INSERT statement the scanner accepts.
// A non-OK status from either method stops the scan and is returned by
// StatementScanner::run().
class TupleHandler {
 public:
  virtual ~TupleHandler() { }
  // `columns` is empty unless the statement names its columns:
  //   INSERT INTO `page` (`page_id`,...) VALUES ...
  virtual Status begin_statement(const string &table,
                                 const vector<string> &columns) = 0;
  // Interior of one tuple, without the outer parentheses, still escaped.
  virtual Status tuple(const string &span) = 0;
};

struct ScannerOptions {
  ScannerOptions() : max_statements(0) { }
  string table;  // only statements for this table; empty means all
  uint64_t max_statements;  // stop after this many statements; 0 = no limit
};

// Streams a mysqldump file, picking tuples out of
//   INSERT INTO `table` VALUES (...),(...),...;
// and skipping everything else (DDL, LOCK TABLES, comments). Only one tuple
// is held in memory at a time.
class StatementScanner {
 public:
  StatementScanner(FileReader *file, TupleHandler *handler,
                   const ScannerOptions &options)
  : f_(file), handler_(handler), options_(options), line_(1),
    statements_(0), skipped_statements_(0), tuples_(0), peak_tuple_(0),
    done_(false) { }
  ~StatementScanner() { }

  Status run();

  uint64_t lines() const { return line_; }
  // INSERT statements handed to the handler
  uint64_t statements() const { return statements_; }
  // INSERT statements for other tables
  uint64_t skipped_statements() const { return skipped_statements_; }
  uint64_t tuples() const { return tuples_; }
  // Largest tuple span held so far; the scanner never holds more.
  size_t peak_tuple_bytes() const { return peak_tuple_; }

 private:
  char get() {
    char c = f_->read_unit();
    if (c == '\n')
      line_++;
    return c;
  }
  char peek() {
    return f_->peek_unit();
  }
  bool eof() {
    return f_->eof();
  }

  Status insert_command();
  Status read_tuple();
  bool read_identifier(string *out);
  string read_word();
  void skip_blanks();
  void skip_command();
  void skip_quoted(char quote);
  void skip_after(char c1);
  void skip_after(char c1, char c2);
  Status error(ErrorCode code, const string &what);

  FileReader *f_;
  TupleHandler *handler_;
  ScannerOptions options_;
  string tuple_;  // reused for every tuple
  string table_;
  vector<string> columns_;
  uint64_t line_;
  uint64_t statements_;
  uint64_t skipped_statements_;
  uint64_t tuples_;
  size_t peak_tuple_;
  bool done_;

 private:
  DISALLOW_COPY_AND_ASSIGN(StatementScanner);
};

}  // namespace wikicsv

#endif  // SRC_STATEMENT_SCANNER_H_
