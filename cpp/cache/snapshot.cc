#include <cache/snapshot.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <string.h>
#include <unistd.h>

#include <filesystem>
#include <system_error>
#include <vector>

namespace fifocache {
namespace cache::snapshot {

std::expected<int, fifocache::serr::Error> Writer::WriteHeader(
    int64_t capacity, uint32_t nshard) {
  SnapshotHeader hdr;
  hdr.set_capacity(capacity);
  hdr.set_nshard(nshard);
  return write(hdr, "header");
}

std::expected<int, fifocache::serr::Error> Writer::WriteCount(
    int64_t total_entries) {
  SnapshotCount cnt;
  cnt.set_total_entries(total_entries);
  return write(cnt, "entry count");
}

std::expected<int, fifocache::serr::Error> Writer::WriteEntry(
    const std::string &key, const std::string &val) {
  SnapshotEntry e;
  e.set_key(key);
  e.set_value(val);
  return write(e, "entry");
}

std::expected<int, fifocache::serr::Error> Writer::Close() {
  if (_closed) {
    return 0;
  }
  _closed = true;
  if (!_gz.Close()) {
    const char *zmsg = _gz.ZlibErrorMessage();
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot close gzip writer: {}",
                    zmsg == nullptr ? "write failed" : zmsg)));
  }
  return 0;
}

std::expected<int, fifocache::serr::Error> Writer::write(
    const google::protobuf::MessageLite &msg, const std::string &what) {
  if (_closed) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrClosed, fmt::format("write {}", what)));
  }
  if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(msg, &_gz)) {
    const char *zmsg = _gz.ZlibErrorMessage();
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot encode {}: {}", what,
                    zmsg == nullptr ? "write failed" : zmsg)));
  }
  return 0;
}

std::expected<SnapshotHeader, fifocache::serr::Error> Reader::ReadHeader() {
  SnapshotHeader hdr;
  {
    auto res = read(&hdr, "header");
    if (!res.has_value()) {
      return std::unexpected(res.error());
    }
  }
  if (hdr.capacity() <= 0) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrCorrupt,
        fmt::format("bad capacity {}", hdr.capacity())));
  }
  if (hdr.nshard() > MAX_NSHARD) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrCorrupt,
        fmt::format("bad nshard {}", hdr.nshard())));
  }
  return hdr;
}

std::expected<int64_t, fifocache::serr::Error> Reader::ReadCount() {
  SnapshotCount cnt;
  {
    auto res = read(&cnt, "entry count");
    if (!res.has_value()) {
      return std::unexpected(res.error());
    }
  }
  if (cnt.total_entries() < 0) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrCorrupt,
        fmt::format("bad entry count {}", cnt.total_entries())));
  }
  return cnt.total_entries();
}

std::expected<int, fifocache::serr::Error> Reader::ReadEntry(SnapshotEntry &e) {
  return read(&e, "entry");
}

std::expected<int, fifocache::serr::Error> Reader::read(
    google::protobuf::MessageLite *msg, const std::string &what) {
  bool clean_eof = false;
  if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(msg, &_gz,
                                                                &clean_eof)) {
    const char *zmsg = _gz.ZlibErrorMessage();
    std::string reason;
    if (zmsg != nullptr) {
      reason = fmt::format("zlib: {}", zmsg);
    } else if (clean_eof) {
      reason = "unexpected end of stream";
    } else {
      reason = "malformed message";
    }
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrCorrupt,
        fmt::format("cannot decode {}: {}", what, reason)));
  }
  return 0;
}

std::expected<std::unique_ptr<TmpFile>, fifocache::serr::Error> TmpFile::Create(
    const std::string &dst) {
  std::filesystem::path dir = std::filesystem::path(dst).parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    log(SNAPSHOT_ERR, "Error create_directories {}: {}", dir.string(),
        ec.message());
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot create dir {}: {}", dir.string(), ec.message())));
  }
  std::string tmpl = (dir / (TMP_PREFIX + "XXXXXX")).string();
  std::vector<char> pn(tmpl.begin(), tmpl.end());
  pn.push_back('\0');
  int fd = mkstemp(pn.data());
  if (fd < 0) {
    int err = errno;
    log(SNAPSHOT_ERR, "Error mkstemp {}: {}", tmpl, strerror(err));
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot create temporary file in {}: {}", dir.string(),
                    strerror(err))));
  }
  log(SNAPSHOT, "Created temporary file {} for {}", pn.data(), dst);
  return std::unique_ptr<TmpFile>(new TmpFile(dst, std::string(pn.data()), fd));
}

TmpFile::~TmpFile() {
  if (_open) {
    _open = false;
    if (!_out->Close()) {
      log(SNAPSHOT_ERR, "Error close {}: {}", _path,
          strerror(_out->GetErrno()));
    }
  }
  if (!_committed) {
    if (unlink(_path.c_str()) != 0) {
      log(SNAPSHOT_ERR, "Error remove {}: {}", _path, strerror(errno));
    } else {
      log(SNAPSHOT, "Removed temporary file {}", _path);
    }
  }
}

std::expected<int, fifocache::serr::Error> TmpFile::Commit() {
  if (!_out->Flush()) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot write {}: {}", _path, strerror(_out->GetErrno()))));
  }
  if (fsync(_fd) != 0) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot sync {}: {}", _path, strerror(errno))));
  }
  // Close releases the descriptor even when it fails.
  _open = false;
  if (!_out->Close()) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot close {}: {}", _path, strerror(_out->GetErrno()))));
  }
  std::error_code ec;
  std::filesystem::rename(_path, _dst, ec);
  if (ec) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO, fmt::format("cannot rename {} to {}: {}",
                                             _path, _dst, ec.message())));
  }
  _committed = true;
  log(SNAPSHOT, "Renamed {} to {}", _path, _dst);
  return 0;
}

std::expected<std::unique_ptr<google::protobuf::io::FileInputStream>,
              fifocache::serr::Error>
OpenFile(const std::string &path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    int err = errno;
    if (err == ENOENT) {
      return std::unexpected(
          fifocache::serr::Error(fifocache::serr::TErrNotfound, path));
    }
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrIO,
        fmt::format("cannot open {}: {}", path, strerror(err))));
  }
  auto in = std::make_unique<google::protobuf::io::FileInputStream>(fd);
  in->SetCloseOnDelete(true);
  return in;
}

};  // namespace cache::snapshot
};  // namespace fifocache
