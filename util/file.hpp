#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Reads at most the last max_bytes bytes of the file.
  static std::string ReadTail(const std::string& path, size_t max_bytes);

  // Writes content to path. The file is written to a temporary file first
  // and then moved into place.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false);

  // Appends content to path, creating the file if needed.
  static void Append(const std::string& path, const std::string& content);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
