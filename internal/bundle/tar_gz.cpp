#include "tar_gz.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>
#include <zlib.h>

#include <algorithm>
#include <fstream>
#include <functional>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/fs.hpp"

namespace canary::bundle {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

// ------------------------------------------------------------
// gzFile owner
// ------------------------------------------------------------

class GzFile {
 public:
  static GzFile Open(const fs::path& path, const char* mode) {
    gzFile f = ::gzopen(path.c_str(), mode);
    if (f == nullptr) {
      throw util::StorageError("gzopen failed: " + path.string());
    }
    return GzFile(f, path);
  }

  ~GzFile() {
    if (file_ != nullptr) {
      ::gzclose(file_);
    }
  }

  GzFile(GzFile&& other) noexcept : file_(other.file_), path_(std::move(other.path_)) {
    other.file_ = nullptr;
  }

  GzFile(const GzFile&)            = delete;
  GzFile& operator=(const GzFile&) = delete;
  GzFile& operator=(GzFile&&)      = delete;

  void Write(const void* data, std::size_t size) {
    if (size == 0) return;
    int written = ::gzwrite(file_, data, static_cast<unsigned>(size));
    if (written <= 0 || static_cast<std::size_t>(written) != size) {
      throw util::StorageError("gzwrite failed: " + path_.string() + ": " + ErrorText());
    }
  }

  // Short count only at end of stream.
  std::size_t Read(void* data, std::size_t size) {
    std::size_t total = 0;
    auto*       out   = static_cast<char*>(data);
    while (total < size) {
      int got = ::gzread(file_, out + total, static_cast<unsigned>(size - total));
      if (got < 0) {
        throw util::IntegrityFailure("corrupt gzip stream: " + path_.string() + ": " + ErrorText());
      }
      if (got == 0) break;
      total += static_cast<std::size_t>(got);
    }
    return total;
  }

  // Flushes; a failed close on a writer means the data is not intact.
  void Close() {
    gzFile f = file_;
    file_    = nullptr;
    if (::gzclose(f) != Z_OK) {
      throw util::StorageError("gzclose failed: " + path_.string());
    }
  }

 private:
  GzFile(gzFile f, fs::path path) : file_(f), path_(std::move(path)) {
  }

  std::string ErrorText() const {
    int         errnum = 0;
    const char* msg    = ::gzerror(file_, &errnum);
    return msg ? msg : "unknown";
  }

  gzFile   file_ = nullptr;
  fs::path path_;
};

// Runs write(tmp) then fsync + rename over path; tmp is removed on failure.
void DurableWrite(const fs::path& path, const std::function<void(const fs::path&)>& write) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  auto tmp = path;
  tmp += ".tmp";

  std::error_code ec;
  try {
    write(tmp);
    util::SyncFile(tmp);
    fs::rename(tmp, path);
    util::SyncDirectory(path.parent_path());
  } catch (...) {
    fs::remove(tmp, ec);
    throw;
  }
}

// ------------------------------------------------------------
// libarchive handles
// ------------------------------------------------------------

struct ReadFree {
  void operator()(::archive* a) const {
    ::archive_read_free(a);
  }
};
struct WriteFree {
  void operator()(::archive* a) const {
    ::archive_write_free(a);
  }
};
struct EntryFree {
  void operator()(archive_entry* e) const {
    ::archive_entry_free(e);
  }
};

using ReadArchive  = std::unique_ptr<::archive, ReadFree>;
using WriteArchive = std::unique_ptr<::archive, WriteFree>;
using Entry        = std::unique_ptr<archive_entry, EntryFree>;

std::string ArchiveError(::archive* a) {
  const char* msg = ::archive_error_string(a);
  return msg ? msg : "unknown libarchive error";
}

ReadArchive OpenForRead(const fs::path& archive_path) {
  std::error_code ec;
  if (!fs::is_regular_file(archive_path, ec)) {
    throw util::NotFound("No such archive: " + archive_path.string());
  }

  ReadArchive a(::archive_read_new());
  if (!a) {
    throw util::StorageError("archive_read_new failed");
  }
  ::archive_read_support_filter_gzip(a.get());
  ::archive_read_support_format_tar(a.get());
  if (::archive_read_open_filename(a.get(), archive_path.c_str(), kChunkSize) != ARCHIVE_OK) {
    throw util::IntegrityFailure("unreadable archive: " + archive_path.string() + ": " + ArchiveError(a.get()));
  }
  return a;
}

// false at end of archive; throws on a damaged stream.
bool NextHeader(::archive* a, archive_entry** entry, const fs::path& archive_path) {
  const int rc = ::archive_read_next_header(a, entry);
  if (rc == ARCHIVE_EOF) return false;
  if (rc == ARCHIVE_WARN) {
    CANARY_LOG_WARN("archive warning", {observability::StringField("archive", archive_path.string()),
                                        observability::StringField("detail", ArchiveError(a))});
    return true;
  }
  if (rc != ARCHIVE_OK) {
    throw util::IntegrityFailure("corrupt archive: " + archive_path.string() + ": " + ArchiveError(a));
  }
  return true;
}

// Strips "./" and trailing '/'.
std::string EntryName(archive_entry* entry) {
  const char* raw  = ::archive_entry_pathname(entry);
  std::string name = raw ? raw : "";
  while (name.rfind("./", 0) == 0) {
    name.erase(0, 2);
  }
  while (name.size() > 1 && name.back() == '/') {
    name.pop_back();
  }
  return name == "." ? std::string() : name;
}

// Throws on absolute names and ".." components.
void RejectEscapes(const std::string& name, const fs::path& archive_path) {
  const fs::path p(name);
  if (p.is_absolute() || (!name.empty() && name.front() == '/')) {
    throw util::IntegrityFailure("absolute path in archive " + archive_path.string() + ": " + name);
  }
  for (const auto& part : p) {
    if (part == "..") {
      throw util::IntegrityFailure("path escapes extraction root in " + archive_path.string() + ": " + name);
    }
  }
}

void AppendFile(::archive* a, const TarEntry& entry, const fs::path& archive_path) {
  struct stat st {};
  if (::stat(entry.source.c_str(), &st) != 0) {
    throw util::NotFound("Cannot stat " + entry.source.string());
  }

  Entry e(::archive_entry_new());
  ::archive_entry_set_pathname(e.get(), entry.name.c_str());
  ::archive_entry_set_filetype(e.get(), AE_IFREG);
  ::archive_entry_set_perm(e.get(), st.st_mode & 07777);
  ::archive_entry_set_size(e.get(), st.st_size);
  ::archive_entry_set_mtime(e.get(), st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
  if (::archive_write_header(a, e.get()) != ARCHIVE_OK) {
    throw util::StorageError("cannot add " + entry.name + " to " + archive_path.string() + ": " + ArchiveError(a));
  }

  std::ifstream in(entry.source, std::ios::binary);
  if (!in) {
    throw util::NotFound("Cannot open " + entry.source.string());
  }

  std::vector<char> buf(kChunkSize);
  auto              remaining = static_cast<uint64_t>(st.st_size);
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buf.size()));
    in.read(buf.data(), want);
    if (in.gcount() != want) {
      throw util::StorageError("File changed while archiving: " + entry.source.string());
    }
    if (::archive_write_data(a, buf.data(), static_cast<std::size_t>(want)) != want) {
      throw util::StorageError("write failed for " + archive_path.string() + ": " + ArchiveError(a));
    }
    remaining -= static_cast<uint64_t>(want);
  }
}

void AppendDirectory(::archive* a, const TarEntry& entry, const fs::path& archive_path) {
  Entry e(::archive_entry_new());
  ::archive_entry_set_pathname(e.get(), entry.name.c_str());
  ::archive_entry_set_filetype(e.get(), AE_IFDIR);
  ::archive_entry_set_perm(e.get(), 0755);
  if (::archive_write_header(a, e.get()) != ARCHIVE_OK) {
    throw util::StorageError("cannot add " + entry.name + " to " + archive_path.string() + ": " + ArchiveError(a));
  }
}

// Streams the current entry's data into the disk writer.
void CopyData(::archive* in, ::archive* out, const fs::path& archive_path) {
  const void* buf    = nullptr;
  std::size_t size   = 0;
  la_int64_t  offset = 0;
  while (true) {
    const int rc = ::archive_read_data_block(in, &buf, &size, &offset);
    if (rc == ARCHIVE_EOF) return;
    if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
      throw util::IntegrityFailure("corrupt archive: " + archive_path.string() + ": " + ArchiveError(in));
    }
    if (::archive_write_data_block(out, buf, size, offset) != ARCHIVE_OK) {
      throw util::StorageError("extraction write failed: " + ArchiveError(out));
    }
  }
}

bool IsExcluded(const fs::path& path, const std::vector<fs::path>& exclude) {
  if (exclude.empty()) return false;
  const auto normal = fs::absolute(path).lexically_normal();
  for (const auto& e : exclude) {
    if (e.empty()) continue;
    if (fs::absolute(e).lexically_normal() == normal) return true;
  }
  return false;
}

} // namespace

void AddTree(std::vector<TarEntry>* entries, const fs::path& root, const std::string& prefix,
             const std::vector<fs::path>& exclude) {
  std::error_code ec;
  if (!fs::exists(root, ec) || IsExcluded(root, exclude)) {
    return;
  }

  if (fs::is_regular_file(root, ec)) {
    entries->push_back(TarEntry{prefix, root, false});
    return;
  }

  if (!prefix.empty()) {
    entries->push_back(TarEntry{prefix, root, true});
  }

  std::vector<fs::path> children;
  for (const auto& entry : fs::directory_iterator(root)) {
    children.push_back(entry.path());
  }
  std::sort(children.begin(), children.end());

  for (const auto& child : children) {
    const auto name = prefix.empty() ? child.filename().string() : prefix + "/" + child.filename().string();
    if (fs::is_directory(child, ec)) {
      AddTree(entries, child, name, exclude);
    } else if (fs::is_regular_file(child, ec) && !IsExcluded(child, exclude)) {
      entries->push_back(TarEntry{name, child, false});
    }
  }
}

void WriteTarGz(const fs::path& archive_path, const std::vector<TarEntry>& entries) {
  DurableWrite(archive_path, [&](const fs::path& tmp) {
    WriteArchive a(::archive_write_new());
    if (!a) {
      throw util::StorageError("archive_write_new failed");
    }
    if (::archive_write_add_filter_gzip(a.get()) != ARCHIVE_OK ||
        ::archive_write_set_format_pax_restricted(a.get()) != ARCHIVE_OK ||
        ::archive_write_open_filename(a.get(), tmp.c_str()) != ARCHIVE_OK) {
      throw util::StorageError("cannot open " + tmp.string() + ": " + ArchiveError(a.get()));
    }

    for (const auto& entry : entries) {
      if (entry.directory) {
        AppendDirectory(a.get(), entry, archive_path);
      } else {
        AppendFile(a.get(), entry, archive_path);
      }
    }

    // Flushes the gzip trailer; a failed close leaves an unusable archive.
    if (::archive_write_close(a.get()) != ARCHIVE_OK) {
      throw util::StorageError("cannot finish " + tmp.string() + ": " + ArchiveError(a.get()));
    }
  });
}

std::vector<std::string> ListTarGz(const fs::path& archive_path) {
  auto a = OpenForRead(archive_path);

  std::vector<std::string> names;
  archive_entry*           entry = nullptr;
  while (NextHeader(a.get(), &entry, archive_path)) {
    const auto type = ::archive_entry_filetype(entry);
    if (type == AE_IFREG || type == AE_IFDIR) {
      names.push_back(EntryName(entry));
    }
    if (::archive_read_data_skip(a.get()) != ARCHIVE_OK) {
      throw util::IntegrityFailure("corrupt archive: " + archive_path.string() + ": " + ArchiveError(a.get()));
    }
  }
  return names;
}

std::vector<std::string> ExtractTarGz(const fs::path& archive_path, const fs::path& destination) {
  auto a = OpenForRead(archive_path);

  fs::create_directories(destination);
  // Resolved so the symlink check only sees links inside the extracted tree.
  const auto root = fs::canonical(destination);

  WriteArchive disk(::archive_write_disk_new());
  if (!disk) {
    throw util::StorageError("archive_write_disk_new failed");
  }
  // Entry names are re-rooted under an absolute destination below, so the
  // absolute-path refusal happens in RejectEscapes on the stored name.
  ::archive_write_disk_set_options(disk.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                   ARCHIVE_EXTRACT_SECURE_SYMLINKS);
  ::archive_write_disk_set_standard_lookup(disk.get());

  std::vector<std::string> extracted;
  archive_entry*           entry = nullptr;
  while (NextHeader(a.get(), &entry, archive_path)) {
    const auto name = EntryName(entry);
    RejectEscapes(name, archive_path);

    const auto type    = ::archive_entry_filetype(entry);
    const bool regular = type == AE_IFDIR || (type == AE_IFREG && ::archive_entry_hardlink(entry) == nullptr);
    if (name.empty() || !regular) {
      if (!name.empty()) {
        CANARY_LOG_WARN("skipping non-regular archive entry", {observability::StringField("archive", archive_path.string()),
                                                               observability::StringField("entry", name)});
      }
      if (::archive_read_data_skip(a.get()) != ARCHIVE_OK) {
        throw util::IntegrityFailure("corrupt archive: " + archive_path.string() + ": " + ArchiveError(a.get()));
      }
      continue;
    }

    const auto target = (root / name).string();
    ::archive_entry_set_pathname(entry, target.c_str());
    if (type == AE_IFREG) {
      ::archive_entry_set_perm(entry, (::archive_entry_perm(entry) & 0777) | 0600);
    }

    if (::archive_write_header(disk.get(), entry) < ARCHIVE_WARN) {
      throw util::IntegrityFailure("refused archive entry " + name + ": " + ArchiveError(disk.get()));
    }
    if (type == AE_IFREG) {
      CopyData(a.get(), disk.get(), archive_path);
    }
    if (::archive_write_finish_entry(disk.get()) < ARCHIVE_WARN) {
      throw util::StorageError("extraction failed for " + name + ": " + ArchiveError(disk.get()));
    }
    extracted.push_back(name);
  }

  if (::archive_write_close(disk.get()) < ARCHIVE_WARN) {
    throw util::StorageError("extraction failed: " + ArchiveError(disk.get()));
  }
  return extracted;
}

void WriteGzipFile(const fs::path& path, const std::string& data) {
  DurableWrite(path, [&](const fs::path& tmp) {
    auto gz = GzFile::Open(tmp, "wb6");
    for (std::size_t off = 0; off < data.size(); off += kChunkSize) {
      gz.Write(data.data() + off, std::min(kChunkSize, data.size() - off));
    }
    gz.Close();
  });
}

std::string ReadGzipFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw util::NotFound("No such file: " + path.string());
  }

  auto              gz = GzFile::Open(path, "rb");
  std::string       out;
  std::vector<char> buf(kChunkSize);
  while (true) {
    const auto got = gz.Read(buf.data(), buf.size());
    out.append(buf.data(), got);
    if (got < buf.size()) break;
  }
  return out;
}

} // namespace canary::bundle
