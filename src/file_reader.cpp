#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <fcntl.h>
#include <sys/stat.h>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = "not a regular file: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = "opened empty file: " + path.string(); return true; }

  ReadOnlyMapping map(fd.get(), n);
  if (!map.valid()) { msg = "can not mmap file: " + path.string(); return false; }
  const char* data = map.data();

  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
    start = i + 1;
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }
  msg = "opened file: " + path.string();
  return true;
}
