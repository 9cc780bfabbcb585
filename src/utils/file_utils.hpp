#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

struct FileInfo {
  FileInfo() : fd(-1), size(0), content_type() {}

  int fd;
  off_t size;
  std::string content_type;
};

namespace file_utils {

// Result of probing a filesystem path with stat().
enum PathKind {
  PATH_MISSING,  // ENOENT, ENOTDIR, ENAMETOOLONG
  PATH_FILE,
  PATH_DIRECTORY,
  PATH_OTHER,  // exists but is neither a regular file nor a directory
  PATH_ERROR   // any other stat() failure; errno is reported via `err`
};

PathKind probePath(const std::string& path, int& err);

// Content type for a file name, looked up by its (case-insensitive)
// extension. Unknown extensions map to application/octet-stream.
std::string guessMime(const std::string& path);

// Lexically normalize an absolute path: collapse "//", "." and "..".
// ".." never climbs above "/".
std::string normalizePath(const std::string& path);

// Make `path` absolute against the current working directory.
std::string absolutePath(const std::string& path);

// Resolve `path` against `base` the way a shell would: absolute paths are
// only normalized, relative ones are appended to `base` first.
std::string resolvePath(const std::string& base, const std::string& path);

// Join a request path onto `root_dir` without ever leaving it.
// Returns false (forbidden) when the request climbs above the root, contains
// a NUL byte, or the joined path does not lie under the root. Both '/' and
// '\\' count as separators in `request_path`.
bool safeJoin(const std::string& root_dir, const std::string& request_path,
              std::string& out);

// Search below `root` for regular files called `name`. Symlinks are not
// followed and directories named in `skip_dirs` are not entered. At most
// `max_matches` candidates are collected; the shortest path among them wins
// (ties broken lexically). Returns false when nothing matches.
bool findFile(const std::string& root, const std::string& name,
              const std::vector<std::string>& skip_dirs, size_t max_matches,
              std::string& out);

bool openFile(const std::string& path, FileInfo& out);
void closeFile(FileInfo& fi);

// Stream [offset, max_offset) of file_fd to sock_fd with sendfile().
// Returns 0 when done, 1 when the socket would block, -1 on error.
int streamToSocket(int sock_fd, int file_fd, off_t& offset, off_t max_offset);

}  // namespace file_utils
