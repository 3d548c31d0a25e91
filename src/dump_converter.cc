// Copyright 2011 Emir Habul, see file COPYING

#include "dump_converter.h"

#include <errno.h>
#include <string.h>
#include <sys/time.h>
#include <unistd.h>
#include <cstdio>
#include <string>

#include "config.h"

namespace wikicsv {

namespace {  // unnamed

double now_seconds() {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  return tv.tv_sec + tv.tv_usec / 1e6;
}

}  // namespace

DumpConverter::DumpConverter(const TableSchema *schema, FileWriter *out,
                             const CsvDialect &dialect)
  : schema_(schema), assembler_(schema), filter_(schema),
    writer_(out, dialect), start_time_(0.0), initialized_(false),
    print_progress_(false), progress_every_(WIKICSV_PROGRESS_EVERY) {
}

Status DumpConverter::init(const FilterSpec &spec) {
  Status status = filter_.configure(spec);
  initialized_ = status.ok();
  return status;
}

Status DumpConverter::run(FileReader *in, const ScannerOptions &options) {
  if (!initialized_)
    return Status(kConfigurationError, "converter used before init()");

  ScannerOptions scan_options = options;
  if (scan_options.table.empty())
    scan_options.table = schema_->name();  // one table per run

  stats_ = ConvertStats();
  start_time_ = now_seconds();

  Status status = writer_.write_header(filter_.output_column_names());
  if (!status.ok())
    return status;

  StatementScanner scanner(in, this, scan_options);
  status = scanner.run();
  stats_.statements = scanner.statements();
  stats_.seconds = now_seconds() - start_time_;

  // Rows before a failure are complete lines; flush them either way.
  Status flushed = writer_.finish();
  if (!status.ok())
    return status;
  if (print_progress_)
    print_progress();
  return flushed;
}

Status DumpConverter::begin_statement(const string &table,
                                      const vector<string> &columns) {
  return assembler_.check_declared_columns(columns);
}

Status DumpConverter::tuple(const string &span) {
  stats_.tuples++;

  Status status = TokenizeTuple(span, &fields_);
  if (!status.ok()) {
    char where[64];
    snprintf(where, sizeof(where), "row %llu: ",
        static_cast<unsigned long long>(stats_.tuples));
    string shown = span.size() > WIKICSV_MAX_SPAN_IN_ERROR
        ? span.substr(0, WIKICSV_MAX_SPAN_IN_ERROR) + "..." : span;
    return Status(status.code(),
        where + status.message() + ": (" + shown + ")");
  }

  status = assembler_.assemble(&fields_, stats_.tuples, span, &row_);
  if (!status.ok())
    return status;

  if (filter_.passes(row_)) {
    filter_.project(row_, &record_);
    status = writer_.write_record(record_);
    if (!status.ok())
      return status;
    stats_.rows_written++;
  } else {
    stats_.rows_filtered++;
  }

  if (PREDICT_FALSE(print_progress_ && stats_.tuples % progress_every_ == 0))
    print_progress();
  return Status::OK();
}

void DumpConverter::print_progress() {
  double elapsed = now_seconds() - start_time_;
  fprintf(stderr,
      "  time elapsed: %.2fs,  rows matched per second: %.2f,"
      "  rows matched: %llu,  rows written: %llu,"
      "  rows skipped b/c allow/block lists: %llu\n",
      elapsed, elapsed > 0 ? stats_.tuples / elapsed : 0.0,
      static_cast<unsigned long long>(stats_.tuples),
      static_cast<unsigned long long>(stats_.rows_written),
      static_cast<unsigned long long>(stats_.rows_filtered));
}

Status ConvertDumpFile(const ConvertJob &job, ConvertStats *stats) {
  SystemFile out_file;
  bool to_stdout = job.output == "-";
  string tmp_path = job.output + ".tmp";
  Status status;
  {
    BufferedWriter writer(&out_file);
    DumpConverter converter(job.schema, &writer, job.dialect);
    status = converter.init(job.filter);
    if (!status.ok())
      return status;

    GzipFile in_file;  // reads plain .sql as well
    if (!in_file.open(job.input.c_str(), "rb"))
      return Status(kIoError, "cannot open " + job.input + ": " +
          in_file.error_message());

    if (to_stdout) {
      out_file.attach(stdout);
    } else if (!out_file.open(tmp_path.c_str(), "wb")) {
      return Status(kIoError, "cannot open " + tmp_path + ": " +
          out_file.error_message());
    }

    BufferedReader reader(&in_file);
    converter.set_print_progress(job.print_progress, WIKICSV_PROGRESS_EVERY);
    status = converter.run(&reader, job.scan);
    if (stats != NULL)
      *stats = converter.stats();
  }
  if (out_file.close() != 0 && status.ok())
    status = Status(kIoError, "cannot close " +
        (to_stdout ? string("stdout") : tmp_path));
  if (to_stdout)
    return status;

  if (status.ok() && rename(tmp_path.c_str(), job.output.c_str()) != 0) {
    status = Status(kIoError, "cannot rename " + tmp_path + " to " +
        job.output + ": " + strerror(errno));
  }
  if (!status.ok())
    unlink(tmp_path.c_str());
  return status;
}

}  // namespace wikicsv
