// Copyright 2011 Emir Habul, see file COPYING

#include "csv_writer.h"

#include <string>

namespace wikicsv {

namespace {  // unnamed

// Length of the well-formed UTF-8 sequence at p, or 0 if it is not one.
// Overlong forms, surrogates and code points above U+10FFFF are rejected.
size_t utf8_sequence_length(const unsigned char *p, size_t left) {
  unsigned char c = p[0];
  if (c < 0x80)
    return 1;
  size_t len;
  unsigned char lo = 0x80, hi = 0xBF;  // range of the second byte
  if (c >= 0xC2 && c <= 0xDF) {
    len = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
    if (c == 0xE0)
      lo = 0xA0;
    else if (c == 0xED)
      hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
    if (c == 0xF0)
      lo = 0x90;
    else if (c == 0xF4)
      hi = 0x8F;
  } else {
    return 0;
  }
  if (left < len || p[1] < lo || p[1] > hi)
    return 0;
  for (size_t i = 2; i < len; i++) {
    if ((p[i] & 0xC0) != 0x80)
      return 0;
  }
  return len;
}

bool is_valid_utf8(const string &value) {
  const unsigned char *p = reinterpret_cast<const unsigned char*>(value.data());
  size_t left = value.size();
  while (left > 0) {
    size_t n = utf8_sequence_length(p, left);
    if (n == 0)
      return false;
    p += n;
    left -= n;
  }
  return true;
}

}  // namespace

void CsvWriter::strip_invalid_utf8(const string &value, string *out) {
  out->clear();
  const unsigned char *p = reinterpret_cast<const unsigned char*>(value.data());
  size_t left = value.size();
  while (left > 0) {
    size_t n = utf8_sequence_length(p, left);
    if (n == 0) {
      n = 1;  // drop one byte and resynchronize
    } else {
      out->append(reinterpret_cast<const char*>(p), n);
    }
    p += n;
    left -= n;
  }
}

void CsvWriter::encode_cell(const string &input, const CsvDialect &dialect,
                            string *line) {
  string cleaned;
  const string *pv = &input;
  if (PREDICT_FALSE(!is_valid_utf8(input))) {
    strip_invalid_utf8(input, &cleaned);
    pv = &cleaned;
  }
  const string &value = *pv;

  bool needs_quotes = value.empty();
  for (size_t i = 0; i < value.size() && !needs_quotes; i++) {
    char c = value[i];
    if (c == dialect.delimiter || c == dialect.quote || c == '\n' || c == '\r')
      needs_quotes = true;
  }
  if (!needs_quotes) {
    line->append(value);
    return;
  }
  line->push_back(dialect.quote);
  for (size_t i = 0; i < value.size(); i++) {
    if (value[i] == dialect.quote)
      line->push_back(dialect.quote);
    line->push_back(value[i]);
  }
  line->push_back(dialect.quote);
}

Status CsvWriter::write_header(const vector<string> &names) {
  line_.clear();
  for (size_t i = 0; i < names.size(); i++) {
    if (i) line_.push_back(dialect_.delimiter);
    encode_cell(names[i], dialect_, &line_);
  }
  line_.append(dialect_.line_terminator);
  return out_->write(line_.data(), line_.size());
}

Status CsvWriter::write_record(const OutputRecord &record) {
  line_.clear();
  for (size_t i = 0; i < record.size(); i++) {
    if (i) line_.push_back(dialect_.delimiter);
    if (!record[i]->is_null())
      encode_cell(record[i]->text, dialect_, &line_);
  }
  line_.append(dialect_.line_terminator);
  Status status = out_->write(line_.data(), line_.size());
  if (status.ok())
    rows_++;
  return status;
}

}  // namespace wikicsv
