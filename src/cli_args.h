// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_CLI_ARGS_H_
#define SRC_CLI_ARGS_H_

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

#include "status.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

// "a,b" -> {"a", "b"}. Empty pieces are kept: "" -> {""}, "a," -> {"a", ""}.
vector<string> SplitList(const string &s, char sep);

// "COL=V1,V2" -> (*lists)[COL] += {V1, V2}. "COL=" adds the empty string,
// which matches empty strings and NULL. A missing column name is a
// kConfigurationError.
Status ParseListArg(const string &arg, map<string, vector<string> > *lists);

// "COL=FILE": one value per line, "\n" or "\r\n" terminated. Blank lines
// are skipped. kIoError if the file cannot be read.
Status ReadListFile(const string &arg, map<string, vector<string> > *lists);

// Decimal count such as the argument of -m. Signs, blanks, trailing
// characters and overflow are kConfigurationError.
Status ParseCount(const string &arg, uint64_t *count);

}  // namespace wikicsv

#endif  // SRC_CLI_ARGS_H_
