#include "util/file.hpp"

#include <stdlib.h>
#include <string.h>

#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}


bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
#ifdef __APPLE__
  *tmp = path + ".";
  do {
    *tmp += 'a' + rand() % 26;
    int fd = open(tmp->c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);
    if (fd == -1 && errno == EEXIST) continue;
    return fd;
  } while (true);
#else
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp->c_str()), &free};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
#endif
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    int error = errno;
    remove(src.c_str());
    return error;
  }
  return remove(src.c_str()) != -1 ? 0 : errno;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const std::string& content) {
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.c_str() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

// Reads from the current position of fd until EOF.
int OsReadAll(int fd, std::string* content) {
  char buf[util::kChunkSize];
  ssize_t amount;
  while ((amount = read(fd, buf, util::kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) return errno;
    content->append(buf, amount);
  }
  return 0;
}

int OsRead(const std::string& path, size_t max_tail, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  if (max_tail) {
    off_t size = lseek(fd, 0, SEEK_END);
    off_t start = size > static_cast<off_t>(max_tail) ? size - max_tail : 0;
    if (size == -1 || lseek(fd, start, SEEK_SET) == -1) {
      int error = errno;
      close(fd);
      return error;
    }
  }
  int err = OsReadAll(fd, content);
  if (err) {
    close(fd);
    return err;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  int err = OsWriteAll(fd, content);
  if (err) {
    close(fd);
    remove(temp_file.c_str());
    return err;
  }
  if (close(fd) == -1) return errno;
  return OsAtomicMove(temp_file, path, overwrite);
}

int OsAppend(const std::string& path, const std::string& content) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
  if (fd == -1) return errno;
  int err = OsWriteAll(fd, content);
  if (err) {
    close(fd);
    return err;
  }
  return close(fd) == -1 ? errno : 0;
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path) {
  std::string content;
  int err = OsRead(path, 0, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

std::string File::ReadTail(const std::string& path, size_t max_bytes) {
  std::string content;
  if (max_bytes == 0) return content;
  int err = OsRead(path, max_bytes, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    throw file_exists("Write " + path);
  }
  int err = OsWrite(path, content, overwrite);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::Append(const std::string& path, const std::string& content) {
  MakeDirs(BaseDir(path));
  int err = OsAppend(path, content);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (first.empty()) return second;
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
