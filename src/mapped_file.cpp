#include "include/mapped_file.hpp"
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

MappedFile::MappedFile(const char *file_name) {
  if (std::strcmp(file_name, "-") == 0) {
    read_stdin();
    return;
  }

  fd_ = open(file_name, O_RDONLY);
  if (fd_ < 0)
    throw std::runtime_error(std::string("Failed to open file: ") +
                             file_name);

  struct stat sbuf;
  if (fstat(fd_, &sbuf) < 0) {
    close(fd_);
    throw std::runtime_error("Failed to get length of the file");
  }
  size_ = static_cast<size_t>(sbuf.st_size);

  if (size_ > 0)
    handle_mmap();

  spdlog::debug("mapped {} ({} bytes)", file_name, size_);
}

void MappedFile::read_stdin() {
  // Read all of stdin into a buffer
  constexpr size_t chunk = 1 << 16; // 64KB
  char buf[chunk];
  ssize_t n;
  while ((n = ::read(STDIN_FILENO, buf, chunk)) > 0)
    stdin_buf_.append(buf, static_cast<size_t>(n));
  if (n < 0)
    throw std::runtime_error("Failed to read stdin");
  if (stdin_buf_.empty())
    throw std::runtime_error("No data on stdin");
  size_ = stdin_buf_.size();
  addr_ = stdin_buf_.data();
}

void MappedFile::handle_mmap() {
  addr_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (addr_ == MAP_FAILED) {
    addr_ = nullptr;
    close(fd_);
    fd_ = -1;
    throw std::runtime_error("Failed to MMAP file");
  }
}

MappedFile::~MappedFile() {
  if (!stdin_buf_.empty()) {
    // stdin data owned by stdin_buf_, no munmap needed
    addr_ = nullptr;
  }
  if (addr_)
    munmap(addr_, size_);
  if (fd_ >= 0)
    close(fd_);
}
