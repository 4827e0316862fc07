// Repository: Capkit-recorder
// Component: Segment Manifest
// Purpose: manifest.json serialization and atomic persistence.
// Copyright (c) 2025 Capkit

#include "capkit/mux/Manifest.hpp"

#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <unistd.h>

namespace capkit::mux {

namespace {

std::mutex g_fault_mutex;
std::function<bool(AtomicWriteStage)> g_fault_hook;

bool FaultAt(AtomicWriteStage stage) {
  std::lock_guard<std::mutex> lock(g_fault_mutex);
  return g_fault_hook && g_fault_hook(stage);
}

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

std::string FormatSeconds(double seconds) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(6) << seconds;
  return o.str();
}

void SkipSpace(const std::string& s, size_t* pos) {
  while (*pos < s.size() && std::isspace(static_cast<unsigned char>(s[*pos]))) ++(*pos);
}

// Position of the first character of the value for "key", or npos.
size_t FindValue(const std::string& s, const std::string& key) {
  const std::string search = "\"" + key + "\"";
  size_t at = s.find(search);
  while (at != std::string::npos) {
    size_t pos = at + search.size();
    SkipSpace(s, &pos);
    if (pos < s.size() && s[pos] == ':') {
      ++pos;
      SkipSpace(s, &pos);
      return pos;
    }
    at = s.find(search, at + 1);
  }
  return std::string::npos;
}

// Index one past the bracket matching the opener at start ('{' or '[').
size_t MatchBracket(const std::string& s, size_t start) {
  const char open = s[start];
  const char close = open == '{' ? '}' : ']';
  int depth = 0;
  for (size_t i = start; i < s.size(); ++i) {
    if (s[i] == '"') {
      ++i;
      while (i < s.size() && s[i] != '"') {
        if (s[i] == '\\') ++i;
        ++i;
      }
      continue;
    }
    if (s[i] == open) ++depth;
    else if (s[i] == close && --depth == 0) return i + 1;
  }
  return std::string::npos;
}

bool ParseString(const std::string& s, const std::string& key, std::string* out) {
  size_t pos = FindValue(s, key);
  if (pos == std::string::npos || s[pos] != '"') return false;
  out->clear();
  for (size_t i = pos + 1; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == '"') *out += '"';
      else if (n == '\\') *out += '\\';
      else if (n == 'n') *out += '\n';
      else if (n == 'r') *out += '\r';
      else if (n == 't') *out += '\t';
      else *out += n;
      ++i;
      continue;
    }
    if (s[i] == '"') return true;
    *out += s[i];
  }
  return false;
}

bool ParseNumber(const std::string& s, const std::string& key, double* out) {
  size_t pos = FindValue(s, key);
  if (pos == std::string::npos) return false;
  const char* begin = s.c_str() + pos;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(begin, &end);
  if (end == begin || errno == ERANGE) return false;
  *out = v;
  return true;
}

bool ParseUint64(const std::string& s, const std::string& key, uint64_t* out) {
  size_t pos = FindValue(s, key);
  if (pos == std::string::npos) return false;
  size_t end = pos;
  while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) ++end;
  if (end == pos) return false;
  try {
    *out = static_cast<uint64_t>(std::stoull(s.substr(pos, end - pos)));
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseBool(const std::string& s, const std::string& key, bool* out) {
  size_t pos = FindValue(s, key);
  if (pos == std::string::npos) return false;
  if (s.compare(pos, 4, "true") == 0) {
    *out = true;
    return true;
  }
  if (s.compare(pos, 5, "false") == 0) {
    *out = false;
    return true;
  }
  return false;
}

bool IsNull(const std::string& s, const std::string& key) {
  size_t pos = FindValue(s, key);
  return pos != std::string::npos && s.compare(pos, 4, "null") == 0;
}

bool ParseSegment(const std::string& obj, ManifestSegment* out, std::string* error) {
  uint64_t index = 0;
  if (!ParseString(obj, "path", &out->path)) {
    *error = "segment entry missing path";
    return false;
  }
  if (!ParseUint64(obj, "index", &index) || index > 0xFFFFFFFFu) {
    *error = "segment entry missing index";
    return false;
  }
  out->index = static_cast<uint32_t>(index);
  if (!ParseNumber(obj, "duration", &out->duration)) {
    *error = "segment entry missing duration";
    return false;
  }
  if (!ParseBool(obj, "is_complete", &out->is_complete)) {
    *error = "segment entry missing is_complete";
    return false;
  }
  uint64_t size = 0;
  if (ParseUint64(obj, "file_size", &size)) {
    out->file_size = size;
  }
  return true;
}

bool WriteAll(int fd, const char* data, size_t len) {
  while (len > 0) {
    const ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

}  // namespace

std::string ManifestToJson(const Manifest& manifest) {
  std::ostringstream o;
  o << "{\n";
  o << "  \"version\": " << manifest.version << ",\n";
  o << "  \"type\": \"" << JsonEscape(manifest.type) << "\",\n";
  if (manifest.init_segment) {
    o << "  \"init_segment\": \"" << JsonEscape(*manifest.init_segment) << "\",\n";
  }
  o << "  \"segments\": [";
  for (size_t i = 0; i < manifest.segments.size(); ++i) {
    const auto& seg = manifest.segments[i];
    o << (i == 0 ? "\n" : ",\n");
    o << "    {\n";
    o << "      \"path\": \"" << JsonEscape(seg.path) << "\",\n";
    o << "      \"index\": " << seg.index << ",\n";
    o << "      \"duration\": " << FormatSeconds(seg.duration) << ",\n";
    o << "      \"is_complete\": " << (seg.is_complete ? "true" : "false");
    if (seg.file_size) {
      o << ",\n      \"file_size\": " << *seg.file_size;
    }
    o << "\n    }";
  }
  o << (manifest.segments.empty() ? "],\n" : "\n  ],\n");
  if (manifest.total_duration) {
    o << "  \"total_duration\": " << FormatSeconds(*manifest.total_duration) << ",\n";
  }
  o << "  \"is_complete\": " << (manifest.is_complete ? "true" : "false") << "\n";
  o << "}\n";
  return o.str();
}

bool ParseManifest(const std::string& json, Manifest* out, std::string* error) {
  std::string scratch;
  if (!error) error = &scratch;

  size_t begin = 0;
  SkipSpace(json, &begin);
  if (begin >= json.size() || json[begin] != '{') {
    *error = "not a JSON object";
    return false;
  }
  const size_t end = MatchBracket(json, begin);
  if (end == std::string::npos) {
    *error = "truncated document";
    return false;
  }
  size_t tail = end;
  SkipSpace(json, &tail);
  if (tail != json.size()) {
    *error = "trailing data after document";
    return false;
  }
  std::string doc = json.substr(begin, end - begin);

  // Split the segment array out so top-level keys are not confused with
  // the per-segment ones.
  const size_t arr = FindValue(doc, "segments");
  if (arr == std::string::npos || doc[arr] != '[') {
    *error = "missing segments array";
    return false;
  }
  const size_t arr_end = MatchBracket(doc, arr);
  if (arr_end == std::string::npos) {
    *error = "unterminated segments array";
    return false;
  }
  const std::string segments = doc.substr(arr, arr_end - arr);
  std::string top = doc;
  top.replace(arr, arr_end - arr, "[]");

  Manifest m;
  double version = 0;
  if (!ParseNumber(top, "version", &version)) {
    *error = "missing version";
    return false;
  }
  m.version = static_cast<int>(version);
  if (!ParseString(top, "type", &m.type)) {
    *error = "missing type";
    return false;
  }
  std::string init;
  if (ParseString(top, "init_segment", &init)) {
    m.init_segment = init;
  }
  double total = 0;
  if (!IsNull(top, "total_duration") && ParseNumber(top, "total_duration", &total)) {
    m.total_duration = total;
  }
  if (!ParseBool(top, "is_complete", &m.is_complete)) {
    *error = "missing is_complete";
    return false;
  }

  size_t pos = 1;
  while (pos < segments.size()) {
    const size_t obj = segments.find('{', pos);
    if (obj == std::string::npos) break;
    const size_t obj_end = MatchBracket(segments, obj);
    if (obj_end == std::string::npos) {
      *error = "unterminated segment entry";
      return false;
    }
    ManifestSegment seg;
    if (!ParseSegment(segments.substr(obj, obj_end - obj), &seg, error)) {
      return false;
    }
    m.segments.push_back(std::move(seg));
    pos = obj_end;
  }

  *out = std::move(m);
  return true;
}

bool ReadManifestFile(const std::filesystem::path& path, Manifest* out, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = "cannot open " + path.string();
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ParseManifest(ss.str(), out, error);
}

bool AtomicWriteFile(const std::filesystem::path& path, const std::string& contents,
                     std::string* error) {
  std::string scratch;
  if (!error) error = &scratch;
  const std::string tmp_path = path.string() + ".tmp";

  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    *error = "cannot create " + tmp_path + ": " + std::strerror(errno);
    return false;
  }
  if (FaultAt(AtomicWriteStage::kTempOpened)) {
    ::close(fd);
    *error = "write interrupted";
    return false;
  }

  const size_t half = contents.size() / 2;
  if (!WriteAll(fd, contents.data(), half)) {
    *error = "write failed for " + tmp_path + ": " + std::strerror(errno);
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return false;
  }
  if (FaultAt(AtomicWriteStage::kTempHalfWritten)) {
    ::close(fd);
    *error = "write interrupted";
    return false;
  }
  if (!WriteAll(fd, contents.data() + half, contents.size() - half)) {
    *error = "write failed for " + tmp_path + ": " + std::strerror(errno);
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return false;
  }
  if (::fsync(fd) != 0) {
    *error = "fsync failed for " + tmp_path + ": " + std::strerror(errno);
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return false;
  }
  ::close(fd);

  if (FaultAt(AtomicWriteStage::kBeforeRename)) {
    *error = "write interrupted";
    return false;
  }
  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    *error = "rename to " + path.string() + " failed: " + std::strerror(errno);
    ::unlink(tmp_path.c_str());
    return false;
  }

  std::string dir = path.parent_path().string();
  if (dir.empty()) dir = ".";
  const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd >= 0) {
    (void)::fsync(dir_fd);
    ::close(dir_fd);
  }
  return true;
}

void SetAtomicWriteFaultHook(std::function<bool(AtomicWriteStage)> hook) {
  std::lock_guard<std::mutex> lock(g_fault_mutex);
  g_fault_hook = std::move(hook);
}

}  // namespace capkit::mux
