// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_CONFIG_H_
#define SRC_CONFIG_H_

// Size of the buffers used by BufferedReader and BufferedWriter
#define WIKICSV_BUFFER_SIZE (1024 * 1024)

// Print a progress line after this many tuples (when progress is enabled)
#define WIKICSV_PROGRESS_EVERY 500000

// Longest raw span quoted back in error messages
#define WIKICSV_MAX_SPAN_IN_ERROR 200

#define WIKICSV_VERSION "0.3.0"

#endif  // SRC_CONFIG_H_
