// Copyright 2011 Emir Habul, see file COPYING

#include "row_assembler.h"

#include <cstdio>
#include <string>

#include "config.h"

namespace wikicsv {

namespace {  // unnamed

string shorten(const string &span) {
  if (span.size() <= WIKICSV_MAX_SPAN_IN_ERROR)
    return span;
  return span.substr(0, WIKICSV_MAX_SPAN_IN_ERROR) + "...";
}

string row_prefix(uint64_t row_index) {
  char buf[64];
  snprintf(buf, sizeof(buf), "row %llu",
      static_cast<unsigned long long>(row_index));
  return buf;
}

}  // namespace

Status RowAssembler::check_declared_columns(
    const vector<string> &columns) const {
  if (columns.empty())
    return Status::OK();
  if (columns == schema_->column_names())
    return Status::OK();
  string declared;
  for (size_t i = 0; i < columns.size(); i++) {
    if (i) declared += ",";
    declared += columns[i];
  }
  return Status(kSchemaMismatch, "INSERT INTO `" + schema_->name() +
      "` declares columns (" + declared + ") which differ from the schema");
}

Status RowAssembler::assemble(vector<FieldToken> *fields, uint64_t row_index,
                              const string &span, Row *row) const {
  if (fields->size() != schema_->size()) {
    char msg[128];
    snprintf(msg, sizeof(msg), " has %zu fields, table %s expects %zu: ",
        fields->size(), schema_->name().c_str(), schema_->size());
    return Status(kSchemaMismatch,
        row_prefix(row_index) + msg + "(" + shorten(span) + ")");
  }

  for (size_t i = 0; i < fields->size(); i++) {
    const ColumnDef &column = schema_->column(i);
    const FieldToken &tok = (*fields)[i];
    const char *problem = NULL;
    if (tok.type == FieldToken::kNull) {
      if (!column.nullable)
        problem = "NULL in non-nullable column";
    } else if (column.is_numeric() != (tok.type == FieldToken::kNumber)) {
      problem = column.is_numeric() ? "quoted string in numeric column"
                                    : "unquoted value in string column";
    }
    if (problem != NULL) {
      return Status(kSchemaMismatch, row_prefix(row_index) + ": " + problem +
          " " + column.name + ": (" + shorten(span) + ")");
    }
  }

  row->schema_ = schema_;
  row->fields_.swap(*fields);
  return Status::OK();
}

}  // namespace wikicsv
