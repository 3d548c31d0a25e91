// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_ROW_FILTER_H_
#define SRC_ROW_FILTER_H_

#include <stddef.h>
#include <map>
#include <string>
#include <vector>

#include <google/dense_hash_set>

#include "row_assembler.h"
#include "status.h"
#include "table_schema.h"
#include "value_tokenizer.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

struct FilterSpec {
  // Columns to write; empty keeps all. Output follows schema order.
  vector<string> keep_column_names;
  // Columns to leave out; cannot be combined with keep_column_names.
  vector<string> drop_column_names;
  // A row is kept only if the column value is one of these.
  map<string, vector<string> > allowlists;
  // A row is dropped if the column value is one of these.
  map<string, vector<string> > blocklists;
};

// Retained fields of one row, in output order. Points into the Row.
typedef vector<const FieldToken*> OutputRecord;

struct FNVHash {
  size_t operator()(const string& str) const {
    size_t hash = 2166136261u;
    for (size_t i = 0; i < str.size(); i++) {
      hash = (hash ^ static_cast<unsigned char>(str[i])) * 16777619u;
    }
    return hash;
  }
};

// Row predicates are checked against the full row; projection happens
// afterwards, so a filter may use a column that is not written out.
class RowFilter {
 public:
  explicit RowFilter(const TableSchema *schema);
  ~RowFilter();

  // Validates `spec` against the schema. Must succeed before use.
  Status configure(const FilterSpec &spec);

  bool passes(const Row &row) const;
  void project(const Row &row, OutputRecord *out) const;

  const vector<string> &output_column_names() const { return output_names_; }
  bool has_predicates() const { return !predicates_.empty(); }

 private:
  typedef google::dense_hash_set<string, FNVHash> ValueSet;
  struct Predicate {
    size_t column;
    bool allow;  // allowlist if true, blocklist otherwise
    ValueSet *values;
  };

  void clear();
  Status add_predicates(const map<string, vector<string> > &lists, bool allow);

  const TableSchema *schema_;
  vector<Predicate> predicates_;
  vector<size_t> output_columns_;
  vector<string> output_names_;

  DISALLOW_COPY_AND_ASSIGN(RowFilter);
};

}  // namespace wikicsv

#endif  // SRC_ROW_FILTER_H_
