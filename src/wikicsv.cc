// Copyright 2011 Emir Habul, see file COPYING

#include <cstdio>

#include <getopt.h>

#include <string>
#include <vector>

#include "cli_args.h"
#include "config.h"
#include "dump_converter.h"
#include "dump_file_name.h"
#include "status.h"
#include "table_schema.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

namespace {  // unnamed

enum {
  OPT_CRLF = 256,
};

struct option long_options[] = {
  {"output", required_argument, 0, 'o'},
  {"table", required_argument, 0, 't'},
  {"keep", required_argument, 0, 'k'},
  {"drop", required_argument, 0, 'd'},
  {"allow", required_argument, 0, 'a'},
  {"block", required_argument, 0, 'b'},
  {"allow-file", required_argument, 0, 'A'},
  {"max-statements", required_argument, 0, 'm'},
  {"crlf", no_argument, 0, OPT_CRLF},
  {"quiet", no_argument, 0, 'q'},
  {"help", no_argument, 0, 'h'},
  {0, 0, 0, 0}
};

void print_help(const char *prg) {
  printf("Usage: %s [options] WIKI-YYYYMMDD-TABLE.sql[.gz]\n", prg);
  printf("\n");
  printf("-o FILE\t\tCSV output file, '-' for stdout,\n"
         "\t\tdefault: WIKI-YYYYMMDD-TABLE.csv\n");
  printf("-t TABLE\tTable schema to use, default: taken from the file name\n");
  printf("-k COLS\t\tComma separated columns to keep\n");
  printf("-d COLS\t\tComma separated columns to drop\n");
  printf("-a COL=V1,V2\tKeep only rows where COL is one of the values\n");
  printf("-b COL=V1,V2\tDrop rows where COL is one of the values\n");
  printf("-A COL=FILE\tAllowlist for COL, one value per line\n");
  printf("-m N\t\tStop after N INSERT statements\n");
  printf("--crlf\t\tEnd CSV lines with \\r\\n\n");
  printf("-q\t\tDo not print progress\n");
  printf("-h\t\tShow this help\n");
  printf("\n");
  printf("Tables: ");
  vector<string> tables = SupportedTableNames();
  for (size_t i = 0; i < tables.size(); i++)
    printf("%s%s", i ? ", " : "", tables[i].c_str());
  printf("\n");
}

int fail(const Status &status) {
  fprintf(stderr, "wikicsv: %s\n", status.ToString().c_str());
  return 1;
}

int usage_error(const Status &status) {
  fprintf(stderr, "wikicsv: %s\n", status.message().c_str());
  return 2;
}

}  // namespace

int main(int argc, char *argv[]) {
  string table;
  ConvertJob job;
  bool quiet = false;

  while (1) {
    int option = getopt_long(argc, argv, "o:t:k:d:a:b:A:m:qh",
                             long_options, NULL);
    if (option == -1)
      break;
    Status status;
    switch (option) {
      case 'o':
        job.output = optarg;
      break;
      case 't':
        table = optarg;
      break;
      case 'k':
        job.filter.keep_column_names = SplitList(optarg, ',');
      break;
      case 'd':
        job.filter.drop_column_names = SplitList(optarg, ',');
      break;
      case 'a':
        status = ParseListArg(optarg, &job.filter.allowlists);
        if (!status.ok())
          return usage_error(status);
      break;
      case 'b':
        status = ParseListArg(optarg, &job.filter.blocklists);
        if (!status.ok())
          return usage_error(status);
      break;
      case 'A':
        status = ReadListFile(optarg, &job.filter.allowlists);
        if (status.code() == kConfigurationError)
          return usage_error(status);
        if (!status.ok())
          return fail(status);
      break;
      case 'm':
        status = ParseCount(optarg, &job.scan.max_statements);
        if (!status.ok())
          return usage_error(status);
      break;
      case OPT_CRLF:
        job.dialect.line_terminator = "\r\n";
      break;
      case 'q':
        quiet = true;
      break;
      case 'h':
        print_help(argv[0]);
        return 0;
      default:
        print_help(argv[0]);
        return 2;
    }
  }
  if (argc != optind + 1) {
    print_help(argv[0]);
    return 2;
  }
  job.input = argv[optind];

  DumpFileName name;
  Status status = ParseDumpFileName(job.input, &name);
  if (!status.ok() && table.empty())
    return fail(status);
  if (table.empty())
    table = name.table;
  if (job.output.empty())
    job.output = status.ok() ? name.csv_name() : job.input + ".csv";

  status = LookupTableSchema(table, &job.schema);
  if (!status.ok())
    return fail(status);

  if (!quiet) {
    fprintf(stderr, "wikicsv %s: %s -> %s (table %s)\n", WIKICSV_VERSION,
        job.input.c_str(), job.output.c_str(), table.c_str());
  }
  job.print_progress = !quiet;
  ConvertStats stats;
  status = ConvertDumpFile(job, &stats);
  if (!status.ok())
    return fail(status);
  if (!quiet) {
    fprintf(stderr, "done: %llu statements, %llu rows matched,"
        " %llu written, %.2fs\n",
        static_cast<unsigned long long>(stats.statements),
        static_cast<unsigned long long>(stats.tuples),
        static_cast<unsigned long long>(stats.rows_written),
        stats.seconds);
  }
  return 0;
}

}  // namespace wikicsv

int main(int argc, char *argv[]) {
  return wikicsv::main(argc, argv);
}
