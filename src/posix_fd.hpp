#pragma once
/*
 * PosixFd
 *
 * Purpose: RAII owners for a file descriptor and a read-only mapping.
 */
#include <cstddef>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
private:
  int fd_ = -1;
};

class ReadOnlyMapping {
public:
  ReadOnlyMapping(int fd, size_t len) : len_(len) {
    void* p = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) addr_ = p;
  }
  ReadOnlyMapping(const ReadOnlyMapping&) = delete;
  ReadOnlyMapping& operator=(const ReadOnlyMapping&) = delete;
  ~ReadOnlyMapping() { if (addr_) ::munmap(addr_, len_); }
  bool valid() const { return addr_ != nullptr; }
  const char* data() const { return static_cast<const char*>(addr_); }
  size_t size() const { return len_; }
private:
  void* addr_ = nullptr;
  size_t len_ = 0;
};
