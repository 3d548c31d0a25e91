// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_WIKICSV_STUBS_INTERNAL_H_
#define SRC_WIKICSV_STUBS_INTERNAL_H_

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&);               \
  void operator=(const TypeName&)

#if defined(__GNUC__)
#define PREDICT_FALSE(x) (__builtin_expect(!!(x), 0))
#else
#define PREDICT_FALSE(x) (x)
#endif

namespace wikicsv {

using std::map;
using std::pair;
using std::string;
using std::vector;

}  // namespace wikicsv

#endif  // SRC_WIKICSV_STUBS_INTERNAL_H_
