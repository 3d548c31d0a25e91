// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_ROW_ASSEMBLER_H_
#define SRC_ROW_ASSEMBLER_H_

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "status.h"
#include "table_schema.h"
#include "value_tokenizer.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

// Fields of one tuple bound to the table columns by position.
// Valid until the next tuple is assembled into it.
class Row {
 public:
  Row() : schema_(NULL) { }

  const TableSchema *schema() const { return schema_; }
  size_t size() const { return fields_.size(); }
  const FieldToken &field(size_t i) const { return fields_[i]; }

  // NULL if the schema has no such column
  const FieldToken *get(const string &column_name) const {
    int i = schema_ ? schema_->column_index(column_name) : -1;
    return i < 0 ? NULL : &fields_[i];
  }

 private:
  friend class RowAssembler;
  const TableSchema *schema_;
  vector<FieldToken> fields_;
};

class RowAssembler {
 public:
  explicit RowAssembler(const TableSchema *schema)
  : schema_(schema) { }

  // Statements that name their columns must name exactly the schema's
  // columns, in order.
  Status check_declared_columns(const vector<string> &columns) const;

  // Moves `fields` into `row` (swapping, so buffers are reused). `row_index`
  // is 1-based and `span` is the raw tuple; both only go into error messages.
  Status assemble(vector<FieldToken> *fields, uint64_t row_index,
                  const string &span, Row *row) const;

 private:
  const TableSchema *schema_;
  DISALLOW_COPY_AND_ASSIGN(RowAssembler);
};

}  // namespace wikicsv

#endif  // SRC_ROW_ASSEMBLER_H_
