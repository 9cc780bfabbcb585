#include "file_utils.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/sendfile.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <map>
#include <vector>

#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace file_utils {

namespace {

typedef std::map<std::string, std::string> MimeMap;

MimeMap createExtToMimeMap() {
  MimeMap m;
  // Text types
  m["html"] = "text/html; charset=utf-8";
  m["htm"] = "text/html; charset=utf-8";
  m["txt"] = "text/plain; charset=utf-8";
  m["css"] = "text/css";
  m["csv"] = "text/csv";
  // Application types
  m["js"] = "application/javascript";
  m["mjs"] = "application/javascript";
  m["json"] = "application/json";
  m["map"] = "application/json";
  m["xml"] = "application/xml";
  m["pdf"] = "application/pdf";
  m["zip"] = "application/zip";
  m["wasm"] = "application/wasm";
  // Image types
  m["jpg"] = "image/jpeg";
  m["jpeg"] = "image/jpeg";
  m["png"] = "image/png";
  m["gif"] = "image/gif";
  m["ico"] = "image/x-icon";
  m["svg"] = "image/svg+xml";
  m["webp"] = "image/webp";
  // Fonts
  m["woff"] = "font/woff";
  m["woff2"] = "font/woff2";
  m["ttf"] = "font/ttf";
  return m;
}

const MimeMap& extToMime() {
  static MimeMap instance = createExtToMimeMap();
  return instance;
}

// Split on '/', dropping empty and "." segments. ".." pops the previous
// segment; when there is nothing left to pop, `clamp` decides between
// ignoring it (true) and reporting an escape (false).
bool splitSegments(const std::string& path, bool clamp,
                   std::vector<std::string>& out) {
  std::string::size_type start = 0;
  while (start <= path.size()) {
    std::string::size_type slash = path.find('/', start);
    if (slash == std::string::npos) {
      slash = path.size();
    }
    std::string seg = path.substr(start, slash - start);
    if (seg == "..") {
      if (!out.empty()) {
        out.pop_back();
      } else if (!clamp) {
        return false;
      }
    } else if (!seg.empty() && seg != ".") {
      out.push_back(seg);
    }
    start = slash + 1;
  }
  return true;
}

std::string joinSegments(const std::vector<std::string>& segments) {
  std::string result;
  for (size_t i = 0; i < segments.size(); ++i) {
    result += "/";
    result += segments[i];
  }
  return result.empty() ? "/" : result;
}

bool isSkipped(const std::string& entry,
               const std::vector<std::string>& skip_dirs) {
  return std::find(skip_dirs.begin(), skip_dirs.end(), entry) !=
         skip_dirs.end();
}

void collectMatches(const std::string& dir, const std::string& name,
                    const std::vector<std::string>& skip_dirs,
                    size_t max_matches, std::vector<std::string>& matches) {
  DIR* d = opendir(dir.c_str());
  if (!d) {
    LOG_PERROR(DEBUG, "file_utils: cannot list '" << dir << "'");
    return;
  }
  std::vector<std::string> subdirs;
  struct dirent* ent;
  while ((ent = readdir(d)) != NULL && matches.size() < max_matches) {
    std::string entry = ent->d_name;
    if (entry == "." || entry == "..") {
      continue;
    }
    std::string full = dir == "/" ? "/" + entry : dir + "/" + entry;
    struct stat st;
    if (lstat(full.c_str(), &st) != 0) {
      continue;
    }
    if (S_ISDIR(st.st_mode)) {
      if (!isSkipped(entry, skip_dirs)) {
        subdirs.push_back(full);
      }
    } else if (S_ISREG(st.st_mode) && entry == name) {
      matches.push_back(full);
    }
  }
  closedir(d);

  std::sort(subdirs.begin(), subdirs.end());
  for (size_t i = 0; i < subdirs.size() && matches.size() < max_matches;
       ++i) {
    collectMatches(subdirs[i], name, skip_dirs, max_matches, matches);
  }
}

bool shorterPath(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return a.size() < b.size();
  }
  return a < b;
}

}  // anonymous namespace

PathKind probePath(const std::string& path, int& err) {
  err = 0;
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    err = errno;
    if (err == ENOENT || err == ENOTDIR || err == ENAMETOOLONG) {
      return PATH_MISSING;
    }
    return PATH_ERROR;
  }
  if (S_ISREG(st.st_mode)) {
    return PATH_FILE;
  }
  if (S_ISDIR(st.st_mode)) {
    return PATH_DIRECTORY;
  }
  return PATH_OTHER;
}

std::string guessMime(const std::string& path) {
  static const std::string kDefaultMime = "application/octet-stream";

  std::size_t slash = path.rfind('/');
  std::size_t pos = path.rfind('.');
  if (pos == std::string::npos ||
      (slash != std::string::npos && pos < slash)) {
    return kDefaultMime;
  }

  std::string ext = to_lower_copy(path.substr(pos + 1));
  const MimeMap& m = extToMime();
  MimeMap::const_iterator it = m.find(ext);
  if (it != m.end()) {
    return it->second;
  }
  return kDefaultMime;
}

std::string normalizePath(const std::string& path) {
  std::vector<std::string> segments;
  splitSegments(path, true, segments);
  return joinSegments(segments);
}

std::string absolutePath(const std::string& path) {
  if (!path.empty() && path[0] == '/') {
    return normalizePath(path);
  }
  char buf[PATH_MAX];
  if (getcwd(buf, sizeof(buf)) == NULL) {
    LOG_PERROR(ERROR, "file_utils: getcwd failed");
    return normalizePath("/" + path);
  }
  return normalizePath(std::string(buf) + "/" + path);
}

std::string resolvePath(const std::string& base, const std::string& path) {
  if (!path.empty() && path[0] == '/') {
    return normalizePath(path);
  }
  return absolutePath(base + "/" + path);
}

bool safeJoin(const std::string& root_dir, const std::string& request_path,
              std::string& out) {
  if (request_path.find('\0') != std::string::npos) {
    LOG(DEBUG) << "safeJoin: NUL byte in request path";
    return false;
  }

  std::string unified(request_path.empty() ? "/" : request_path);
  for (std::string::size_type i = 0; i < unified.size(); ++i) {
    if (unified[i] == '\\') {
      unified[i] = '/';
    }
  }

  std::vector<std::string> segments;
  if (!splitSegments(unified, false, segments)) {
    LOG(DEBUG) << "safeJoin: '" << request_path << "' climbs above the root";
    return false;
  }

  std::string root = absolutePath(root_dir);
  std::string candidate = root;
  for (size_t i = 0; i < segments.size(); ++i) {
    if (candidate[candidate.size() - 1] != '/') {
      candidate += "/";
    }
    candidate += segments[i];
  }

  std::string root_lower = to_lower_copy(root);
  std::string cand_lower = to_lower_copy(candidate);
  if (cand_lower == root_lower) {
    out = candidate;
    return true;
  }
  std::string prefix =
      root_lower[root_lower.size() - 1] == '/' ? root_lower : root_lower + "/";
  if (cand_lower.compare(0, prefix.size(), prefix) != 0) {
    LOG(DEBUG) << "safeJoin: DENIED '" << candidate << "' is outside '"
               << root << "'";
    return false;
  }
  out = candidate;
  return true;
}

bool findFile(const std::string& root, const std::string& name,
              const std::vector<std::string>& skip_dirs, size_t max_matches,
              std::string& out) {
  std::vector<std::string> matches;
  collectMatches(absolutePath(root), name, skip_dirs,
                 max_matches, matches);
  if (matches.empty()) {
    return false;
  }
  std::sort(matches.begin(), matches.end(), shorterPath);
  LOG(DEBUG) << "file_utils: " << matches.size() << " match(es) for '" << name
             << "' under '" << root << "', using " << matches[0];
  out = matches[0];
  return true;
}

bool openFile(const std::string& path, FileInfo& out) {
  out.fd = -1;
  out.size = 0;
  out.content_type.clear();

  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    LOG_PERROR(ERROR, "file_utils: openFile failed for '" << path << "'");
    return false;
  }

  struct stat st;
  if (fstat(fd, &st) < 0) {
    LOG_PERROR(ERROR, "file_utils: fstat failed for '" << path << "'");
    close(fd);
    return false;
  }

  out.fd = fd;
  out.size = st.st_size;
  out.content_type = guessMime(path);
  LOG(DEBUG) << "file_utils: opened '" << path << "' fd=" << out.fd
             << " size=" << out.size << " type=" << out.content_type;
  return true;
}

void closeFile(FileInfo& fi) {
  if (fi.fd >= 0) {
    LOG(DEBUG) << "file_utils: closing fd=" << fi.fd;
    close(fi.fd);
    fi.fd = -1;
  }
  fi.size = 0;
  fi.content_type.clear();
}

int streamToSocket(int sock_fd, int file_fd, off_t& offset, off_t max_offset) {
  while (offset < max_offset) {
    size_t to_send = static_cast<size_t>(max_offset - offset);
    if (to_send > WRITE_BUF_SIZE) {
      to_send = WRITE_BUF_SIZE;
    }

    ssize_t s = sendfile(sock_fd, file_fd, &offset, to_send);
    if (s < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return 1;
      }
      LOG_PERROR(ERROR, "file_utils: sendfile error");
      return -1;
    }
    if (s == 0) {
      // file shrank underneath us; nothing more to send
      LOG(DEBUG) << "file_utils: sendfile returned 0 at offset=" << offset;
      return -1;
    }
  }
  return 0;
}

}  // namespace file_utils
