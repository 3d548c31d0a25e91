// Copyright 2011 Emir Habul, see file COPYING

#include "row_filter.h"

#include <set>
#include <string>

namespace wikicsv {

namespace {  // unnamed

// dense_hash_set needs a key that is never inserted
const char kEmptyKeyBytes[] = "\xff\xfe~__empty_key__~\xfe\xff";
const string kEmptyKey(kEmptyKeyBytes, sizeof(kEmptyKeyBytes) - 1);

Status check_columns(const TableSchema &schema, const vector<string> &names,
                     const char *what) {
  std::set<string> seen;
  for (size_t i = 0; i < names.size(); i++) {
    if (schema.column_index(names[i]) < 0) {
      return Status(kConfigurationError, string(what) + " includes '" +
          names[i] + "' which is not a column of table " + schema.name());
    }
    if (!seen.insert(names[i]).second) {
      return Status(kConfigurationError, string(what) + " includes '" +
          names[i] + "' more than once");
    }
  }
  return Status::OK();
}

}  // namespace

RowFilter::RowFilter(const TableSchema *schema)
  : schema_(schema) {
  for (size_t i = 0; i < schema_->size(); i++) {
    output_columns_.push_back(i);
    output_names_.push_back(schema_->column(i).name);
  }
}

RowFilter::~RowFilter() {
  clear();
}

void RowFilter::clear() {
  for (size_t i = 0; i < predicates_.size(); i++)
    delete predicates_[i].values;
  predicates_.clear();
}

Status RowFilter::configure(const FilterSpec &spec) {
  clear();
  output_columns_.clear();
  output_names_.clear();

  if (!spec.keep_column_names.empty() && !spec.drop_column_names.empty()) {
    return Status(kConfigurationError,
        "keep and drop column lists cannot be used together");
  }
  Status status = check_columns(*schema_, spec.keep_column_names,
      "keep column names");
  if (!status.ok())
    return status;
  status = check_columns(*schema_, spec.drop_column_names,
      "drop column names");
  if (!status.ok())
    return status;

  std::set<string> keep(spec.keep_column_names.begin(),
                        spec.keep_column_names.end());
  std::set<string> drop(spec.drop_column_names.begin(),
                        spec.drop_column_names.end());
  for (size_t i = 0; i < schema_->size(); i++) {
    const string &name = schema_->column(i).name;
    if (!keep.empty() && keep.count(name) == 0)
      continue;
    if (drop.count(name))
      continue;
    output_columns_.push_back(i);
    output_names_.push_back(name);
  }
  if (output_columns_.empty())
    return Status(kConfigurationError, "every column is dropped");

  map<string, vector<string> >::const_iterator it;
  for (it = spec.allowlists.begin(); it != spec.allowlists.end(); ++it) {
    if (spec.blocklists.count(it->first)) {
      return Status(kConfigurationError, "column " + it->first +
          " has both an allowlist and a blocklist");
    }
  }
  status = add_predicates(spec.allowlists, true);
  if (!status.ok())
    return status;
  return add_predicates(spec.blocklists, false);
}

Status RowFilter::add_predicates(const map<string, vector<string> > &lists,
                                 bool allow) {
  const char *what = allow ? "allowlists" : "blocklists";
  map<string, vector<string> >::const_iterator it;
  for (it = lists.begin(); it != lists.end(); ++it) {
    int column = schema_->column_index(it->first);
    if (column < 0) {
      return Status(kConfigurationError, string("column name ") + it->first +
          " in " + what + " is not a column of table " + schema_->name());
    }
    Predicate p;
    p.column = column;
    p.allow = allow;
    p.values = new ValueSet();
    p.values->set_empty_key(kEmptyKey);
    predicates_.push_back(p);  // owned from here on
    for (size_t i = 0; i < it->second.size(); i++) {
      if (it->second[i] == kEmptyKey) {
        return Status(kConfigurationError, string("reserved value in ") +
            what + " for column " + it->first);
      }
      p.values->insert(it->second[i]);
    }
  }
  return Status::OK();
}

// Null compares as the empty string.
bool RowFilter::passes(const Row &row) const {
  for (size_t i = 0; i < predicates_.size(); i++) {
    const Predicate &p = predicates_[i];
    bool found = p.values->find(row.field(p.column).text) != p.values->end();
    if (found != p.allow)
      return false;
  }
  return true;
}

void RowFilter::project(const Row &row, OutputRecord *out) const {
  out->resize(output_columns_.size());
  for (size_t i = 0; i < output_columns_.size(); i++)
    (*out)[i] = &row.field(output_columns_[i]);
}

}  // namespace wikicsv
