// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_DUMP_FILE_NAME_H_
#define SRC_DUMP_FILE_NAME_H_

#include <string>

#include "status.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

// Dump files are named WIKI-YYYYMMDD-TABLE.sql or WIKI-YYYYMMDD-TABLE.sql.gz,
// e.g. enwiki-20200901-page.sql.gz
struct DumpFileName {
  DumpFileName() : compressed(false) { }
  string wiki;      // enwiki
  string yyyymmdd;  // 20200901
  string table;     // page
  string basename;  // enwiki-20200901-page
  bool compressed;  // .sql.gz

  // Default CSV output name: enwiki-20200901-page.csv
  string csv_name() const { return basename + ".csv"; }
};

// Accepts a path; only the last component is parsed.
Status ParseDumpFileName(const string &path, DumpFileName *name);

}  // namespace wikicsv

#endif  // SRC_DUMP_FILE_NAME_H_
