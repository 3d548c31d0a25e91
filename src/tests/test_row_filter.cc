// Copyright 2011 Emir Habul, see file COPYING

#include <cstdio>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "row_filter.h"

using ::testing::ElementsAre;

namespace wikicsv {

class RowFilterTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    ASSERT_TRUE(LookupTableSchema("redirect", &schema_).ok());
  }

  // redirect: rd_from, rd_namespace, rd_title, rd_interwiki, rd_fragment
  Row make_row(const string &span) {
    vector<FieldToken> fields;
    EXPECT_TRUE(TokenizeTuple(span, &fields).ok());
    RowAssembler assembler(schema_);
    Row row;
    EXPECT_TRUE(assembler.assemble(&fields, 1, span, &row).ok());
    return row;
  }

  vector<string> one(const string &value) {
    return vector<string>(1, value);
  }

  const TableSchema *schema_;
};

TEST_F(RowFilterTest, no_filter_keeps_everything) {
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(FilterSpec()).ok());
  EXPECT_FALSE(filter.has_predicates());
  EXPECT_EQ(schema_->column_names(), filter.output_column_names());

  Row row = make_row("1,0,'A',NULL,''");
  EXPECT_TRUE(filter.passes(row));
  OutputRecord out;
  filter.project(row, &out);
  ASSERT_EQ(5u, out.size());
  EXPECT_EQ("A", out[2]->text);
  EXPECT_TRUE(out[3]->is_null());
}

TEST_F(RowFilterTest, allowlist) {
  FilterSpec spec;
  spec.allowlists["rd_namespace"] = one("0");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());
  EXPECT_TRUE(filter.has_predicates());

  EXPECT_TRUE(filter.passes(make_row("1,0,'A',NULL,NULL")));
  EXPECT_FALSE(filter.passes(make_row("2,1,'B',NULL,NULL")));
  EXPECT_TRUE(filter.passes(make_row("3,0,'C',NULL,NULL")));
}

TEST_F(RowFilterTest, blocklist) {
  FilterSpec spec;
  spec.blocklists["rd_title"].push_back("Foo");
  spec.blocklists["rd_title"].push_back("Bar");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());

  EXPECT_FALSE(filter.passes(make_row("1,0,'Foo',NULL,NULL")));
  EXPECT_FALSE(filter.passes(make_row("2,0,'Bar',NULL,NULL")));
  EXPECT_TRUE(filter.passes(make_row("3,0,'Baz',NULL,NULL")));
  EXPECT_TRUE(filter.passes(make_row("4,0,'foo',NULL,NULL")));
}

TEST_F(RowFilterTest, lists_on_different_columns_combine) {
  FilterSpec spec;
  spec.allowlists["rd_namespace"] = one("14");
  spec.blocklists["rd_title"] = one("Hidden");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());

  EXPECT_TRUE(filter.passes(make_row("1,14,'Shown',NULL,NULL")));
  EXPECT_FALSE(filter.passes(make_row("2,14,'Hidden',NULL,NULL")));
  EXPECT_FALSE(filter.passes(make_row("3,0,'Shown',NULL,NULL")));
}

TEST_F(RowFilterTest, null_matches_empty_string) {
  FilterSpec spec;
  spec.allowlists["rd_interwiki"] = one("");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());
  EXPECT_TRUE(filter.passes(make_row("1,0,'A',NULL,NULL")));
  EXPECT_TRUE(filter.passes(make_row("1,0,'A','',NULL")));
  EXPECT_FALSE(filter.passes(make_row("1,0,'A','en',NULL")));
}

TEST_F(RowFilterTest, keep_columns_follow_schema_order) {
  FilterSpec spec;
  spec.keep_column_names.push_back("rd_title");
  spec.keep_column_names.push_back("rd_from");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());
  EXPECT_THAT(filter.output_column_names(),
      ElementsAre("rd_from", "rd_title"));

  Row row = make_row("5,0,'X',NULL,NULL");
  OutputRecord out;
  filter.project(row, &out);
  ASSERT_EQ(2u, out.size());
  EXPECT_EQ("5", out[0]->text);
  EXPECT_EQ("X", out[1]->text);
}

TEST_F(RowFilterTest, drop_columns) {
  FilterSpec spec;
  spec.drop_column_names.push_back("rd_interwiki");
  spec.drop_column_names.push_back("rd_fragment");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());
  EXPECT_THAT(filter.output_column_names(),
      ElementsAre("rd_from", "rd_namespace", "rd_title"));
}

TEST_F(RowFilterTest, filter_on_dropped_column) {
  FilterSpec spec;
  spec.drop_column_names.push_back("rd_namespace");
  spec.allowlists["rd_namespace"] = one("0");
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());

  Row row = make_row("1,0,'A',NULL,NULL");
  EXPECT_TRUE(filter.passes(row));
  OutputRecord out;
  filter.project(row, &out);
  EXPECT_EQ(4u, out.size());
  EXPECT_FALSE(filter.passes(make_row("2,1,'B',NULL,NULL")));
}

TEST_F(RowFilterTest, configuration_errors) {
  RowFilter filter(schema_);

  FilterSpec both;
  both.keep_column_names = one("rd_from");
  both.drop_column_names = one("rd_title");
  EXPECT_EQ(kConfigurationError, filter.configure(both).code());

  FilterSpec unknown_keep;
  unknown_keep.keep_column_names = one("page_id");
  EXPECT_EQ(kConfigurationError, filter.configure(unknown_keep).code());

  FilterSpec duplicate;
  duplicate.drop_column_names.push_back("rd_title");
  duplicate.drop_column_names.push_back("rd_title");
  EXPECT_EQ(kConfigurationError, filter.configure(duplicate).code());

  FilterSpec everything;
  everything.drop_column_names = schema_->column_names();
  EXPECT_EQ(kConfigurationError, filter.configure(everything).code());

  FilterSpec unknown_list;
  unknown_list.allowlists["page_namespace"] = one("0");
  Status status = filter.configure(unknown_list);
  EXPECT_EQ(kConfigurationError, status.code());
  EXPECT_NE(string::npos, status.message().find("page_namespace"));

  FilterSpec allow_and_block;
  allow_and_block.allowlists["rd_title"] = one("A");
  allow_and_block.blocklists["rd_title"] = one("B");
  EXPECT_EQ(kConfigurationError, filter.configure(allow_and_block).code());

  // A failed configure can be followed by a good one.
  FilterSpec fine;
  fine.allowlists["rd_title"] = one("A");
  EXPECT_TRUE(filter.configure(fine).ok());
  EXPECT_TRUE(filter.passes(make_row("1,0,'A',NULL,NULL")));
}

TEST_F(RowFilterTest, large_allowlist) {
  FilterSpec spec;
  vector<string> &ids = spec.allowlists["rd_from"];
  char buf[32];
  for (int i = 0; i < 100000; i += 2) {
    snprintf(buf, sizeof(buf), "%d", i);
    ids.push_back(buf);
  }
  RowFilter filter(schema_);
  ASSERT_TRUE(filter.configure(spec).ok());
  EXPECT_TRUE(filter.passes(make_row("99998,0,'A',NULL,NULL")));
  EXPECT_FALSE(filter.passes(make_row("99999,0,'A',NULL,NULL")));
}

TEST(FNVHash, values) {
  FNVHash h;
  EXPECT_EQ(static_cast<size_t>(2166136261u), h(""));
  EXPECT_NE(h("0"), h("1"));
  EXPECT_EQ(h("Main_Page"), h(string("Main_Page")));
}

}  // namespace wikicsv
