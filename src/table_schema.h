// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_TABLE_SCHEMA_H_
#define SRC_TABLE_SCHEMA_H_

#include <string>
#include <vector>

#include "status.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

struct ColumnDef {
  // Only numeric vs string is checked: numbers must be unquoted, strings
  // quoted. kInteger and kFloat are both written to CSV as the dump spells
  // them; the difference documents the MySQL column type.
  enum Kind {
    kInteger = 0,  // int(8) unsigned, tinyint(1), ...
    kFloat = 1,    // double, float
    kString = 2    // varbinary, blob, timestamp, enum: always quoted in dumps
  };
  ColumnDef(const char *n, Kind k, bool null_ok)
  : name(n), kind(k), nullable(null_ok) { }

  bool is_numeric() const { return kind != kString; }

  string name;
  Kind kind;
  bool nullable;
};

// Ordered columns of one MediaWiki table, as they appear in its dump tuples.
class TableSchema {
 public:
  TableSchema(const string &name, const vector<ColumnDef> &columns)
  : name_(name), columns_(columns) { }

  const string &name() const { return name_; }
  size_t size() const { return columns_.size(); }
  const ColumnDef &column(size_t i) const { return columns_[i]; }

  // -1 if there is no such column
  int column_index(const string &column_name) const {
    for (size_t i = 0; i < columns_.size(); i++) {
      if (columns_[i].name == column_name)
        return static_cast<int>(i);
    }
    return -1;
  }

  vector<string> column_names() const {
    vector<string> names;
    for (size_t i = 0; i < columns_.size(); i++)
      names.push_back(columns_[i].name);
    return names;
  }

 private:
  string name_;
  vector<ColumnDef> columns_;
};

// Schemas of the supported dump tables: category, categorylinks, page,
// pagelinks, page_props and redirect. Returned pointers stay valid for the
// life of the process.
Status LookupTableSchema(const string &table_name, const TableSchema **schema);

vector<string> SupportedTableNames();

}  // namespace wikicsv

#endif  // SRC_TABLE_SCHEMA_H_
