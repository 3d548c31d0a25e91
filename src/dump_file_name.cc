// Copyright 2011 Emir Habul, see file COPYING

#include "dump_file_name.h"

#include <cctype>
#include <string>

namespace wikicsv {

namespace {  // unnamed

bool ends_with(const string &s, const char *suffix) {
  size_t len = strlen(suffix);
  return s.size() >= len && s.compare(s.size() - len, len, suffix) == 0;
}

bool all_chars(const string &s, int (*pred)(int)) {
  if (s.empty())
    return false;
  for (size_t i = 0; i < s.size(); i++) {
    if (!pred(static_cast<unsigned char>(s[i])))
      return false;
  }
  return true;
}

int is_table_char(int c) {
  return isalnum(c) || c == '_';
}

}  // namespace

Status ParseDumpFileName(const string &path, DumpFileName *name) {
  string base = path;
  size_t slash = base.rfind('/');
  if (slash != string::npos)
    base = base.substr(slash + 1);

  Status bad(kConfigurationError, "basename of filename " + base +
      " does not match the required pattern WIKI-YYYYMMDD-TABLE_NAME.sql{.gz}");

  DumpFileName out;
  if (ends_with(base, ".sql.gz")) {
    out.compressed = true;
    out.basename = base.substr(0, base.size() - 7);
  } else if (ends_with(base, ".sql")) {
    out.basename = base.substr(0, base.size() - 4);
  } else {
    return bad;
  }

  // wiki-yyyymmdd-table; the table part may contain '_' but not '-'
  size_t first = out.basename.find('-');
  if (first == string::npos)
    return bad;
  size_t second = out.basename.find('-', first + 1);
  if (second == string::npos)
    return bad;
  out.wiki = out.basename.substr(0, first);
  out.yyyymmdd = out.basename.substr(first + 1, second - first - 1);
  out.table = out.basename.substr(second + 1);

  if (!all_chars(out.wiki, islower) || out.yyyymmdd.size() != 8 ||
      !all_chars(out.yyyymmdd, isdigit) ||
      !all_chars(out.table, is_table_char))
    return bad;

  *name = out;
  return Status::OK();
}

}  // namespace wikicsv
