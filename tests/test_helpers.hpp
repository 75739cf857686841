#pragma once

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

inline std::string fixture_path(const char *name) {
  return std::string(TEST_DATA_DIR) + "/" + name;
}

inline std::string read_fixture(const char *name) {
  std::ifstream in(fixture_path(name), std::ios::binary);
  if (!in)
    throw std::runtime_error(std::string("Missing fixture: ") + name);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class TempFile {
  std::string path_;

public:
  explicit TempFile(const std::string &content) {
    char tmpl[] = "/tmp/schemasniff_test_XXXXXX";
    int fd = mkstemp(tmpl);
    if (fd < 0)
      throw std::runtime_error("Failed to create temp file");
    path_ = tmpl;
    ssize_t written = ::write(fd, content.data(), content.size());
    ::close(fd);
    if (written != static_cast<ssize_t>(content.size()))
      throw std::runtime_error("Failed to write temp file");
  }

  ~TempFile() { std::remove(path_.c_str()); }

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  const char *path() const { return path_.c_str(); }
};

struct CaptureStdout {
  std::ostringstream captured;
  std::streambuf *original;

  CaptureStdout() : original(std::cout.rdbuf(captured.rdbuf())) {}
  ~CaptureStdout() { std::cout.rdbuf(original); }

  std::string str() const { return captured.str(); }
};
