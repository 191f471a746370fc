#include "file_io.hpp"
#include "config.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <algorithm>

namespace {
class UniqueFd {
public:
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // close now and report whether close succeeded
  bool reset() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }
private:
  int fd_;
};

class Mapping {
public:
  Mapping(void* mem, size_t n) : mem_(mem), n_(n) {}
  Mapping(const Mapping&) = delete;
  Mapping& operator=(const Mapping&) = delete;
  ~Mapping() { if (mem_ != MAP_FAILED) ::munmap(mem_, n_); }
  const char* data() const { return static_cast<const char*>(mem_); }
private:
  void* mem_;
  size_t n_;
};
}

static std::string open_error(const std::filesystem::path& path, int err) {
  std::string m = "Unable to open " + path.string() + ".";
  if (err == ENOENT) m += " The file does not exist.";
  else if (err == EACCES) m += " You do not have permission to open the file.";
  return m;
}

bool read_file_text(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = open_error(path, errno); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = open_error(path, errno); return false; }
  if (S_ISDIR(st.st_mode)) { msg = "Unable to open " + path.string() + ". It is a directory."; return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = "File " + path.string() + " open"; return true; }
  Mapping map(::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0), n);
  if (map.data() == MAP_FAILED) { msg = open_error(path, errno); return false; }
  (void)::madvise(const_cast<char*>(map.data()), n, MADV_SEQUENTIAL);
  const char* data = map.data();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\r' && i + 1 < n && data[i + 1] == '\n') continue;
    out.push_back(data[i]);
  }
  msg = "File " + path.string() + " open";
  return true;
}

bool read_file_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg) {
  out_lines.clear();
  std::string text;
  if (!read_file_text(path, text, msg)) return false;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find('\n', st);
    if (pos == std::string::npos) { out_lines.emplace_back(text.substr(st)); break; }
    out_lines.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return true;
}

static bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    size_t chunk = std::min<size_t>(len, WR_WRITE_CHUNK_SIZE);
    ssize_t w = ::write(fd, p, chunk);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}

bool write_file_text(const std::filesystem::path& path, std::string_view text, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  const std::string fail = "Unable to save " + path.string();
  UniqueFd fd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!fd.valid()) { msg = fail; return false; }
  if (!write_all(fd.get(), text.data(), text.size())) { msg = fail; return false; }
#if defined(__APPLE__)
  if (::fsync(fd.get()) != 0) { msg = fail; return false; }
#else
  if (::fdatasync(fd.get()) != 0) { msg = fail; return false; }
#endif
  if (!fd.reset()) { msg = fail; return false; }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = fail; std::filesystem::remove(tmp, ec); return false; }
  msg = "File " + path.string() + " saved";
  return true;
}
