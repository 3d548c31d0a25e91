// Copyright 2011 Emir Habul, see file COPYING

#include <ostream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "value_tokenizer.h"

using ::testing::ElementsAre;

namespace wikicsv {

namespace {

FieldToken S(const string &s) { return FieldToken::String(s); }
FieldToken N(const string &s) { return FieldToken::Number(s); }
FieldToken Null() { return FieldToken::Null(); }

vector<FieldToken> tokenize_ok(const string &span) {
  vector<FieldToken> fields;
  Status status = TokenizeTuple(span, &fields);
  EXPECT_TRUE(status.ok()) << status.ToString();
  return fields;
}

}  // namespace

// Lets gtest print tokens in failure messages.
void PrintTo(const FieldToken &tok, std::ostream *os) {
  switch (tok.type) {
    case FieldToken::kString: *os << "String(\"" << tok.text << "\")"; break;
    case FieldToken::kNumber: *os << "Number(" << tok.text << ")"; break;
    case FieldToken::kNull: *os << "Null"; break;
  }
}

TEST(TokenizeTuple, mixed) {
  EXPECT_THAT(tokenize_ok("1,'hello',NULL,'2020-09-01'"),
      ElementsAre(N("1"), S("hello"), Null(), S("2020-09-01")));
}

TEST(TokenizeTuple, escaped_quote) {
  EXPECT_THAT(tokenize_ok("'O\\'Brien'"), ElementsAre(S("O'Brien")));
}

TEST(TokenizeTuple, doubled_quote_is_not_an_escape) {
  vector<FieldToken> fields;
  Status status = TokenizeTuple("'O''Brien'", &fields);
  EXPECT_EQ(kMalformedTuple, status.code());
}

TEST(TokenizeTuple, ambiguous_titles_stay_strings) {
  EXPECT_THAT(tokenize_ok("'NaN','Null','Na','NULL'"),
      ElementsAre(S("NaN"), S("Null"), S("Na"), S("NULL")));
}

TEST(TokenizeTuple, empty_string_is_not_null) {
  vector<FieldToken> fields = tokenize_ok("'',NULL");
  ASSERT_EQ(2u, fields.size());
  EXPECT_EQ(FieldToken::kString, fields[0].type);
  EXPECT_EQ("", fields[0].text);
  EXPECT_TRUE(fields[1].is_null());
}

TEST(TokenizeTuple, escape_table) {
  EXPECT_THAT(tokenize_ok("'a\\nb','\\r\\t','\\\\','\\\"','\\Z'"),
      ElementsAre(S("a\nb"), S("\r\t"), S("\\"), S("\""), S("\032")));
}

TEST(TokenizeTuple, nul_byte) {
  vector<FieldToken> fields = tokenize_ok("'a\\0b'");
  ASSERT_EQ(1u, fields.size());
  EXPECT_EQ(string("a\0b", 3), fields[0].text);
}

TEST(TokenizeTuple, unknown_escape_drops_backslash) {
  EXPECT_THAT(tokenize_ok("'\\%\\_\\q'"), ElementsAre(S("%_q")));
}

TEST(TokenizeTuple, reserved_characters_inside_quotes) {
  EXPECT_THAT(tokenize_ok("'a,b','(x)','line\none'"),
      ElementsAre(S("a,b"), S("(x)"), S("line\none")));
}

TEST(TokenizeTuple, numbers_are_verbatim) {
  EXPECT_THAT(tokenize_ok("-34.254e-2,0.123456789012345678,0x1F,+7,00012"),
      ElementsAre(N("-34.254e-2"), N("0.123456789012345678"), N("0x1F"),
                  N("+7"), N("00012")));
}

TEST(TokenizeTuple, whitespace_around_commas) {
  EXPECT_THAT(tokenize_ok(" 1 ,\t'a' , NULL "),
      ElementsAre(N("1"), S("a"), Null()));
}

TEST(TokenizeTuple, null_is_case_sensitive) {
  EXPECT_THAT(tokenize_ok("null,Null"), ElementsAre(N("null"), N("Null")));
}

TEST(TokenizeTuple, empty_span) {
  vector<FieldToken> fields(3);
  ASSERT_TRUE(TokenizeTuple("", &fields).ok());
  EXPECT_TRUE(fields.empty());
}

TEST(TokenizeTuple, unterminated_quote) {
  vector<FieldToken> fields;
  Status status = TokenizeTuple("1,'abc", &fields);
  EXPECT_EQ(kMalformedTuple, status.code());
  EXPECT_NE(string::npos, status.message().find("field 2"));
}

TEST(TokenizeTuple, escape_pending_at_end) {
  vector<FieldToken> fields;
  EXPECT_EQ(kMalformedTuple, TokenizeTuple("'abc\\", &fields).code());
}

TEST(TokenizeTuple, escaped_quote_at_end_is_unterminated) {
  vector<FieldToken> fields;
  EXPECT_EQ(kMalformedTuple, TokenizeTuple("'abc\\'", &fields).code());
}

TEST(TokenizeTuple, empty_elements) {
  vector<FieldToken> fields;
  EXPECT_EQ(kMalformedTuple, TokenizeTuple("1,,2", &fields).code());
  EXPECT_EQ(kMalformedTuple, TokenizeTuple("1,", &fields).code());
  EXPECT_EQ(kMalformedTuple, TokenizeTuple(",1", &fields).code());
}

TEST(TokenizeTuple, garbage_after_quoted_string) {
  vector<FieldToken> fields;
  EXPECT_EQ(kMalformedTuple, TokenizeTuple("'abc'x,1", &fields).code());
}

TEST(TokenizeTuple, buffers_are_reused) {
  vector<FieldToken> fields;
  ASSERT_TRUE(TokenizeTuple("1,'a',NULL,'b'", &fields).ok());
  ASSERT_TRUE(TokenizeTuple("NULL,'x'", &fields).ok());
  EXPECT_THAT(fields, ElementsAre(Null(), S("x")));
}

TEST(FormatDumpTuple, escapes) {
  vector<FieldToken> fields;
  fields.push_back(N("12"));
  fields.push_back(S("It's \"a\"\\\n"));
  fields.push_back(Null());
  fields.push_back(S(string("\0\032", 2)));
  EXPECT_EQ("12,'It\\'s \\\"a\\\"\\\\\\n',NULL,'\\0\\Z'",
      FormatDumpTuple(fields));
}

TEST(FormatDumpTuple, round_trip) {
  const char *tuples[] = {
    "10,0,'Anarchism','',0,0,0.786172332974311,'20200901050611',NULL",
    "1,'O\\'Brien','C:\\\\path','tab\there','\\r\\n',NULL,-5",
    "'','NaN','Null','Na','a,b','quote\"d','(paren)'",
    "'\\0\\Z\\\\\\''",
  };
  for (size_t i = 0; i < sizeof(tuples) / sizeof(tuples[0]); i++) {
    vector<FieldToken> first = tokenize_ok(tuples[i]);
    vector<FieldToken> second = tokenize_ok(FormatDumpTuple(first));
    EXPECT_EQ(first, second) << tuples[i];
  }
}

}  // namespace wikicsv
