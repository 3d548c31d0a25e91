// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_DUMP_CONVERTER_H_
#define SRC_DUMP_CONVERTER_H_

#include <stdint.h>
#include <string>
#include <vector>

#include "csv_writer.h"
#include "file_io.h"
#include "row_assembler.h"
#include "row_filter.h"
#include "statement_scanner.h"
#include "status.h"
#include "table_schema.h"
#include "value_tokenizer.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

struct ConvertStats {
  ConvertStats()
  : statements(0), tuples(0), rows_written(0), rows_filtered(0),
    seconds(0.0) { }
  uint64_t statements;
  uint64_t tuples;  // rows matched
  uint64_t rows_written;
  uint64_t rows_filtered;  // skipped because of allow/block lists
  double seconds;
};

// Converts the dump of one table to CSV:
// scanner -> tokenizer -> assembler -> filter -> csv writer.
// The first error stops the conversion; rows are never skipped silently.
class DumpConverter : public TupleHandler {
 public:
  DumpConverter(const TableSchema *schema, FileWriter *out,
                const CsvDialect &dialect);
  ~DumpConverter() { }

  // Validates the filter. Call before run().
  Status init(const FilterSpec &spec);

  // Writes the header, then one line per kept row. Statements for other
  // tables are skipped.
  Status run(FileReader *in, const ScannerOptions &options);

  // Print a status line to stderr every `every` tuples.
  void set_print_progress(bool do_print, uint64_t every) {
    print_progress_ = do_print;
    progress_every_ = every ? every : 1;
  }

  const ConvertStats &stats() const { return stats_; }
  const vector<string> &header() const {
    return filter_.output_column_names();
  }

  // TupleHandler
  Status begin_statement(const string &table, const vector<string> &columns);
  Status tuple(const string &span);

 private:
  void print_progress();

  const TableSchema *schema_;
  RowAssembler assembler_;
  RowFilter filter_;
  CsvWriter writer_;
  vector<FieldToken> fields_;
  Row row_;
  OutputRecord record_;
  ConvertStats stats_;
  double start_time_;
  bool initialized_;
  bool print_progress_;
  uint64_t progress_every_;

  DISALLOW_COPY_AND_ASSIGN(DumpConverter);
};

struct ConvertJob {
  ConvertJob() : schema(NULL), print_progress(false) { }
  const TableSchema *schema;
  string input;   // .sql or .sql.gz
  string output;  // "-" for stdout
  FilterSpec filter;
  ScannerOptions scan;
  CsvDialect dialect;
  bool print_progress;
};

// Converts job.input into job.output. The filter is checked and the input
// opened before the output is touched. The CSV goes to job.output + ".tmp",
// which is renamed to job.output on success and removed on failure, so an
// existing output file is only ever replaced by a complete one.
Status ConvertDumpFile(const ConvertJob &job, ConvertStats *stats);

}  // namespace wikicsv

#endif  // SRC_DUMP_CONVERTER_H_
