// Copyright 2011 Emir Habul, see file COPYING

#ifndef SRC_FILE_IO_H_
#define SRC_FILE_IO_H_

#include <errno.h>
#include <fcntl.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <zlib.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include "config.h"
#include "status.h"
#include "wikicsv_stubs_internal.h"

namespace wikicsv {

const unsigned int kBufferSize = WIKICSV_BUFFER_SIZE;

class File {
 public:
  virtual ~File() { }
  virtual bool open(const char *path, const char *mode) = 0;
  virtual size_t write(const void *ptr, size_t size, size_t nmemb) = 0;
  virtual size_t read(void *ptr, size_t size, size_t nmemb) = 0;
  virtual int close() = 0;
  virtual off_t tell() = 0;
  virtual int eof() = 0;
  // Non-zero after a failed read or write
  virtual int error() = 0;
  virtual string error_message() = 0;
  // Only useful when reading files
  virtual double get_progress() = 0;
};

class SystemFile : public File {
 public:
  SystemFile() : f_(NULL), file_size_(0), errno_(0), borrowed_(false) { }
  ~SystemFile() {
    close();
  }
  bool open(const char *path, const char *mode) {
    file_size_ = 0;
    errno_ = 0;
    f_ = ::fopen(path, mode);
    if (f_ == NULL)
      errno_ = errno;
    return f_ != NULL;
  }
  // Wrap stdin/stdout; the stream is not closed by close().
  void attach(FILE *stream) {
    f_ = stream;
    borrowed_ = true;
  }
  size_t write(const void *ptr, size_t size, size_t nmemb) {
    size_t res = ::fwrite(ptr, size, nmemb, f_);
    if (res != nmemb)
      errno_ = errno;
    return res;
  }
  size_t read(void *ptr, size_t size, size_t nmemb) {
    return ::fread(ptr, size, nmemb, f_);
  }
  int close() {
    if (f_ == NULL)
      return 0;
    int ret = borrowed_ ? ::fflush(f_) : ::fclose(f_);
    f_ = NULL;
    return ret;
  }
  off_t tell() {
    return ::ftello(f_);
  }
  int eof() {
    return ::feof(f_);
  }
  int error() {
    return errno_ != 0 || (f_ != NULL && ::ferror(f_));
  }
  string error_message() {
    return errno_ ? string(strerror(errno_)) : string("stream error");
  }
  double get_progress() {
    if (!file_size_)
      file_size_ = file_size();
    if (file_size_ <= 0)
      return 0.0;
    return 100.0 * tell() / file_size_;
  }
 private:
  off_t file_size() {
    struct stat file_info;
    if (fstat(fileno(f_), &file_info) != 0)
      return 0;
    return file_info.st_size;
  }
  FILE *f_;
  off_t file_size_;
  int errno_;
  bool borrowed_;
  DISALLOW_COPY_AND_ASSIGN(SystemFile);
};

// Read-only gzip stream. zlib reads non-gzip input transparently, so this
// also works for plain .sql files.
class GzipFile : public File {
 public:
  GzipFile() : f_(NULL), fd_(-1), file_size_(0), errno_(0) { }
  ~GzipFile() {
    close();
  }
  bool open(const char *path, const char *mode) {
    file_size_ = 0;
    errno_ = 0;
    if (mode[0] != 'r') {
      errno_ = EINVAL;  // not interested in writing gz files
      return false;
    }
    fd_ = ::open(path, O_RDONLY);
    if (fd_ < 0) {
      errno_ = errno;
      return false;
    }
    f_ = ::gzdopen(fd_, mode);
    if (f_ == Z_NULL) {
      errno_ = errno ? errno : ENOMEM;
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    ::gzbuffer(f_, 256 * 1024);
    return true;
  }
  size_t write(const void *ptr, size_t size, size_t nmemb) {
    errno_ = EBADF;
    return 0;
  }
  size_t read(void *ptr, size_t size, size_t nmemb) {
    int ret = ::gzread(f_, ptr, size * nmemb);
    if (ret < 0)
      return 0;  // error() reports it
    return static_cast<size_t>(ret) / size;
  }
  int close() {
    if (f_ == NULL)
      return 0;
    int ret = ::gzclose(f_);  // also closes fd_
    f_ = NULL;
    fd_ = -1;
    return ret == Z_OK ? 0 : -1;
  }
  off_t tell() {
    return ::gztell(f_);
  }
  int eof() {
    return ::gzeof(f_);
  }
  int error() {
    if (errno_)
      return 1;
    int errnum = Z_OK;
    ::gzerror(f_, &errnum);
    return errnum != Z_OK;  // Z_BUF_ERROR: truncated input
  }
  string error_message() {
    if (errno_)
      return string(strerror(errno_));
    int errnum = Z_OK;
    const char *msg = ::gzerror(f_, &errnum);
    if (errnum == Z_ERRNO)
      return string(strerror(errno));
    return string(msg);
  }
  double get_progress() {
    if (!file_size_)
      file_size_ = file_size();
    if (file_size_ <= 0)
      return 0.0;
    // Position of the compressed file, read ahead by zlib's buffer.
    return 100.0 * lseek(fd_, 0, SEEK_CUR) / file_size_;
  }
 private:
  off_t file_size() {
    struct stat file_info;
    if (fstat(fd_, &file_info) != 0)
      return 0;
    return file_info.st_size;
  }
  gzFile f_;
  int fd_;
  off_t file_size_;
  int errno_;
  DISALLOW_COPY_AND_ASSIGN(GzipFile);
};

// Input served from memory. The data is not copied.
class MemoryFile : public File {
 public:
  MemoryFile(const char *data, size_t len)
  : data_(data), size_(len), pos_(0) { }
  bool open(const char *path, const char *mode) {
    pos_ = 0;
    return true;
  }
  size_t write(const void *ptr, size_t size, size_t nmemb) {
    return 0;
  }
  size_t read(void *vptr, size_t size, size_t nmemb) {
    size_t want = size * nmemb;
    size_t left = size_ - pos_;
    if (want > left)
      want = left - left % size;
    memcpy(vptr, data_ + pos_, want);
    pos_ += want;
    return want / size;
  }
  int close() {
    return 0;
  }
  off_t tell() {
    return pos_;
  }
  int eof() {
    return pos_ >= size_;
  }
  int error() {
    return 0;
  }
  string error_message() {
    return string();
  }
  double get_progress() {
    return size_ ? 100.0 * pos_ / size_ : 100.0;
  }
 private:
  const char *data_;
  size_t size_;
  size_t pos_;
  DISALLOW_COPY_AND_ASSIGN(MemoryFile);
};

class FileWriter {
 public:
  virtual ~FileWriter() { }
  virtual Status finish() = 0;
  virtual Status write(const char *ptr, size_t len) = 0;
};

class BufferedWriter : public FileWriter {
 public:
  explicit BufferedWriter(File *f, size_t buffer_size = kBufferSize)
      :file_(f), size_(buffer_size), pos_(0), bytes_written_(0) {
    buffer_ = new char[size_];
  }

  ~BufferedWriter() {
    finish();
    delete[] buffer_;
  }

  Status flush() {
    if (pos_ == 0)
      return Status::OK();
    if (file_ == NULL)
      return Status(kIoError, "write after finish");
    size_t res = file_->write(buffer_, 1, pos_);
    if (res != pos_) {
      pos_ = 0;
      return Status(kIoError, "write failed: " + file_->error_message());
    }
    bytes_written_ += pos_;
    pos_ = 0;
    return Status::OK();
  }

  // Flush buffered bytes. The file itself stays open.
  Status finish() {
    if (file_ == NULL)
      return Status::OK();
    Status status = flush();
    file_ = NULL;
    return status;
  }

  Status write(const char *ptr, size_t len) {
    while (len > 0) {
      if (PREDICT_FALSE(pos_ == size_)) {
        Status status = flush();
        if (!status.ok())
          return status;
      }
      size_t n = size_ - pos_;
      if (n > len)
        n = len;
      memcpy(buffer_ + pos_, ptr, n);
      pos_ += n;
      ptr += n;
      len -= n;
    }
    return Status::OK();
  }

  Status put(char c) {
    if (PREDICT_FALSE(pos_ == size_)) {
      Status status = flush();
      if (!status.ok())
        return status;
    }
    buffer_[pos_++] = c;
    return Status::OK();
  }

  uint64_t bytes_written() const { return bytes_written_ + pos_; }

 private:
  File *file_;
  char *buffer_;  // [size_]
  size_t size_;
  size_t pos_;
  uint64_t bytes_written_;

 private:
  DISALLOW_COPY_AND_ASSIGN(BufferedWriter);
};

class FileReader {
 public:
  virtual ~FileReader() { }
  virtual bool eof() = 0;
  virtual char read_unit() = 0;
  virtual char peek_unit() = 0;
  // Non-OK once the underlying file failed; reads then behave as eof.
  virtual Status status() = 0;
};

class BufferedReader : public FileReader {
 public:
  explicit BufferedReader(File *f, size_t buffer_size = kBufferSize)
      :file_(f), size_(buffer_size), read_size_(0), index_(0),
       failed_(false) {
    buffer_ = new char[size_];
  }

  ~BufferedReader() {
    delete[] buffer_;
  }

  bool eof() {
    if (PREDICT_FALSE(index_ >= read_size_))
      read_buffer();
    return index_ >= read_size_;
  }

  // Returns '\0' at end of input; check eof() to tell it from a NUL byte.
  char read_unit() {
    if (PREDICT_FALSE(index_ >= read_size_)) {
      read_buffer();
      if (index_ >= read_size_)
        return 0;
    }
    return buffer_[index_++];
  }

  char peek_unit() {
    if (PREDICT_FALSE(index_ >= read_size_)) {
      read_buffer();
      if (index_ >= read_size_)
        return 0;
    }
    return buffer_[index_];
  }

  Status status() {
    if (failed_)
      return Status(kIoError, "read failed: " + file_->error_message());
    return Status::OK();
  }
 private:
  void read_buffer() {
    index_ = 0;
    read_size_ = 0;
    if (failed_)
      return;
    read_size_ = file_->read(buffer_, 1, size_);
    if (read_size_ == 0 && file_->error())
      failed_ = true;
  }

  File *file_;
  char *buffer_;  // [size_]
  size_t size_;
  size_t read_size_;
  size_t index_;
  bool failed_;

 private:
  DISALLOW_COPY_AND_ASSIGN(BufferedReader);
};

}  // namespace wikicsv

#endif  // SRC_FILE_IO_H_
