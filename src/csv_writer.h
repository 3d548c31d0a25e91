// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_CSV_WRITER_H_
#define SRC_CSV_WRITER_H_

#include <stdint.h>
#include <string>
#include <vector>

#include "file_io.h"
#include "row_filter.h"
#include "status.h"
#include "value_tokenizer.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

struct CsvDialect {
  CsvDialect() : delimiter(','), quote('"'), line_terminator("\n") { }
  char delimiter;
  char quote;
  string line_terminator;
};

// RFC 4180 output with one twist: NULL is an empty cell and the empty
// string is a quoted empty cell (""), so the two survive a round trip.
// Everything else is written exactly, "NaN" and "NULL" included. Output is
// UTF-8: bytes that do not form a valid UTF-8 sequence are dropped.
class CsvWriter {
 public:
  CsvWriter(FileWriter *out, const CsvDialect &dialect)
  : out_(out), dialect_(dialect), rows_(0) { }

  Status write_header(const vector<string> &names);
  Status write_record(const OutputRecord &record);
  Status finish() { return out_->finish(); }

  // Data rows written, header excluded
  uint64_t rows() const { return rows_; }

  // Appends one encoded cell to *line.
  static void encode_cell(const string &value, const CsvDialect &dialect,
                          string *line);

  // Copies value to *out without the bytes that are not valid UTF-8.
  static void strip_invalid_utf8(const string &value, string *out);

 private:
  FileWriter *out_;
  CsvDialect dialect_;
  string line_;  // reused for every record
  uint64_t rows_;
  DISALLOW_COPY_AND_ASSIGN(CsvWriter);
};

}  // namespace wikicsv

#endif  // SRC_CSV_WRITER_H_
