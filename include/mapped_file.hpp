#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Read-only view of a whole file (mmap) or of stdin ("-").
class MappedFile {
private:
  int fd_ = -1;
  size_t size_ = 0;
  void *addr_ = nullptr;

  std::string stdin_buf_; // buffer for stdin data

  void handle_mmap();
  void read_stdin();

public:
  MappedFile() = delete;
  explicit MappedFile(const char *file_name);
  ~MappedFile();
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  const char *data() const { return static_cast<const char *>(addr_); }
  size_t size() const { return size_; }
  std::string_view view() const { return {data(), size_}; }
};
