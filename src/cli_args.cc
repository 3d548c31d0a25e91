// Copyright 2011 Emir Habul, see file COPYING

#include "cli_args.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>

namespace wikicsv {

namespace {  // unnamed

// Splits "COL=REST"; false if there is no '=' or no column name.
bool split_assignment(const string &arg, string *column, string *rest) {
  size_t eq = arg.find('=');
  if (eq == string::npos || eq == 0)
    return false;
  *column = arg.substr(0, eq);
  *rest = arg.substr(eq + 1);
  return true;
}

}  // namespace

vector<string> SplitList(const string &s, char sep) {
  vector<string> out;
  size_t start = 0;
  while (1) {
    size_t pos = s.find(sep, start);
    out.push_back(s.substr(start, pos - start));
    if (pos == string::npos)
      break;
    start = pos + 1;
  }
  return out;
}

Status ParseListArg(const string &arg, map<string, vector<string> > *lists) {
  string column, values;
  if (!split_assignment(arg, &column, &values))
    return Status(kConfigurationError, "expected COL=V1,V2,..., got " + arg);
  vector<string> split = SplitList(values, ',');
  vector<string> &list = (*lists)[column];
  list.insert(list.end(), split.begin(), split.end());
  return Status::OK();
}

Status ReadListFile(const string &arg, map<string, vector<string> > *lists) {
  string column, path;
  if (!split_assignment(arg, &column, &path) || path.empty())
    return Status(kConfigurationError, "expected COL=FILE, got " + arg);
  FILE *f = fopen(path.c_str(), "r");
  if (f == NULL)
    return Status(kIoError, "cannot open " + path + ": " + strerror(errno));
  vector<string> &list = (*lists)[column];
  char *line = NULL;
  size_t cap = 0;
  ssize_t len;
  while ((len = getline(&line, &cap, f)) != -1) {
    while (len > 0 && (line[len-1] == '\n' || line[len-1] == '\r'))
      len--;
    if (len > 0)
      list.push_back(string(line, len));
  }
  free(line);
  bool failed = ferror(f);
  fclose(f);
  if (failed)
    return Status(kIoError, "error reading " + path);
  return Status::OK();
}

Status ParseCount(const string &arg, uint64_t *count) {
  // strtoull alone accepts "", " 5", "-1" and "5x"
  if (arg.empty() || arg.find_first_not_of("0123456789") != string::npos)
    return Status(kConfigurationError, "not a count: '" + arg + "'");
  errno = 0;
  unsigned long long value = strtoull(arg.c_str(), NULL, 10);  // NOLINT
  if (errno == ERANGE)
    return Status(kConfigurationError, "count out of range: " + arg);
  *count = value;
  return Status::OK();
}

}  // namespace wikicsv
