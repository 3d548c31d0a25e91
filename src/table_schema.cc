// Copyright 2011 Emir Habul, see file COPYING

#include "table_schema.h"

#include <string>
#include <vector>

namespace wikicsv {

namespace {  // unnamed

const ColumnDef::Kind INT = ColumnDef::kInteger;
const ColumnDef::Kind FLOAT = ColumnDef::kFloat;
const ColumnDef::Kind STR = ColumnDef::kString;

struct ColumnEntry {
  const char *name;
  ColumnDef::Kind kind;
  bool nullable;
};

struct TableEntry {
  const char *name;
  const ColumnEntry *columns;
  size_t num_columns;
};

// https://www.mediawiki.org/wiki/Manual:Category_table
const ColumnEntry kCategory[] = {
  {"cat_id", INT, false},  // int(10) unsigned NOT NULL AUTO_INCREMENT
  {"cat_title", STR, false},  // varbinary(255) NOT NULL
  {"cat_pages", INT, false},
  {"cat_subcats", INT, false},
  {"cat_files", INT, false},
};

// https://www.mediawiki.org/wiki/Manual:Redirect_table
const ColumnEntry kRedirect[] = {
  {"rd_from", INT, false},
  {"rd_namespace", INT, false},
  {"rd_title", STR, false},
  {"rd_interwiki", STR, true},
  {"rd_fragment", STR, true},
};

// https://www.mediawiki.org/wiki/Manual:Page_props_table
const ColumnEntry kPageProps[] = {
  {"pp_page", INT, false},
  {"pp_propname", STR, false},
  {"pp_value", STR, false},  // blob NOT NULL
  {"pp_sortkey", FLOAT, true},
};

// https://www.mediawiki.org/wiki/Manual:Page_table
const ColumnEntry kPage[] = {
  {"page_id", INT, false},  // int(8) unsigned NOT NULL AUTO_INCREMENT
  {"page_namespace", INT, false},  // int(11) NOT NULL
  {"page_title", STR, false},  // varbinary(255) NOT NULL
  {"page_restrictions", STR, true},  // tinyblob
  {"page_is_redirect", INT, false},  // tinyint(1) unsigned NOT NULL
  {"page_is_new", INT, false},
  {"page_random", FLOAT, false},  // double unsigned NOT NULL
  {"page_touched", STR, false},  // binary(14) NOT NULL
  {"page_links_updated", STR, true},  // varbinary(14)
  {"page_latest", INT, false},
  {"page_len", INT, false},
  {"page_content_model", STR, true},
  {"page_lang", STR, true},
};

// https://www.mediawiki.org/wiki/Manual:Categorylinks_table
const ColumnEntry kCategoryLinks[] = {
  {"cl_from", INT, false},
  {"cl_to", STR, false},
  {"cl_sortkey", STR, false},  // varbinary(230)
  {"cl_timestamp", STR, false},  // 'yyyy-mm-dd hh:mm:ss'
  {"cl_sortkey_prefix", STR, false},
  {"cl_collation", STR, false},
  {"cl_type", STR, false},  // enum('page','subcat','file')
};

// https://www.mediawiki.org/wiki/Manual:Pagelinks_table
const ColumnEntry kPageLinks[] = {
  {"pl_from", INT, false},
  {"pl_namespace", INT, false},
  {"pl_title", STR, false},
  {"pl_from_namespace", INT, false},
};

#define TABLE_ENTRY(name, cols) {name, cols, sizeof(cols) / sizeof(cols[0])}

const TableEntry kTables[] = {
  TABLE_ENTRY("category", kCategory),
  TABLE_ENTRY("categorylinks", kCategoryLinks),
  TABLE_ENTRY("page", kPage),
  TABLE_ENTRY("pagelinks", kPageLinks),
  TABLE_ENTRY("page_props", kPageProps),
  TABLE_ENTRY("redirect", kRedirect),
};

#undef TABLE_ENTRY

const size_t kNumTables = sizeof(kTables) / sizeof(kTables[0]);

// Built on first use, never freed.
const vector<TableSchema*> &registry() {
  static vector<TableSchema*> *schemas = NULL;
  if (schemas == NULL) {
    schemas = new vector<TableSchema*>();
    for (size_t t = 0; t < kNumTables; t++) {
      vector<ColumnDef> columns;
      for (size_t c = 0; c < kTables[t].num_columns; c++) {
        const ColumnEntry &e = kTables[t].columns[c];
        columns.push_back(ColumnDef(e.name, e.kind, e.nullable));
      }
      schemas->push_back(new TableSchema(kTables[t].name, columns));
    }
  }
  return *schemas;
}

}  // namespace

Status LookupTableSchema(const string &table_name, const TableSchema **schema) {
  const vector<TableSchema*> &schemas = registry();
  for (size_t i = 0; i < schemas.size(); i++) {
    if (schemas[i]->name() == table_name) {
      *schema = schemas[i];
      return Status::OK();
    }
  }
  string known;
  for (size_t i = 0; i < kNumTables; i++) {
    if (i) known += ", ";
    known += kTables[i].name;
  }
  return Status(kUnsupportedTable,
      "table '" + table_name + "' is not supported (known: " + known + ")");
}

vector<string> SupportedTableNames() {
  vector<string> names;
  for (size_t i = 0; i < kNumTables; i++)
    names.push_back(kTables[i].name);
  return names;
}

}  // namespace wikicsv
