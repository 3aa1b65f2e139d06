#pragma once

#include <cache/proto/snapshot.pb.h>
#include <google/protobuf/io/gzip_stream.h>
#include <google/protobuf/io/zero_copy_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/message_lite.h>
#include <serr/serr.h>
#include <util/log/log.h>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace fifocache {
namespace cache::snapshot {

const std::string SNAPSHOT = "SNAPSHOT";
const std::string SNAPSHOT_ERR = SNAPSHOT + fifocache::util::log::ERR;

// Largest shard count a snapshot header may carry.
const uint32_t MAX_NSHARD = 1 << 16;

// Temporary files are created beside the destination with this prefix.
const std::string TMP_PREFIX = "fifocache.tmp.";

// Writes the snapshot framing through a gzip compressor into raw. Close must
// be called once everything is written; until then the compressed stream is
// missing its trailing bytes.
class Writer {
 public:
  explicit Writer(google::protobuf::io::ZeroCopyOutputStream *raw)
      : _gz(raw), _closed(false) {}
  ~Writer() {}

  std::expected<int, fifocache::serr::Error> WriteHeader(int64_t capacity,
                                                         uint32_t nshard);
  std::expected<int, fifocache::serr::Error> WriteCount(int64_t total_entries);
  std::expected<int, fifocache::serr::Error> WriteEntry(const std::string &key,
                                                        const std::string &val);
  std::expected<int, fifocache::serr::Error> Close();

 private:
  google::protobuf::io::GzipOutputStream _gz;
  bool _closed;

  std::expected<int, fifocache::serr::Error> write(
      const google::protobuf::MessageLite &msg, const std::string &what);
};

// Reads what a Writer wrote. Any framing, decompression or truncation problem
// is reported as TErrCorrupt.
class Reader {
 public:
  explicit Reader(google::protobuf::io::ZeroCopyInputStream *raw)
      : _gz(raw) {}
  ~Reader() {}

  std::expected<SnapshotHeader, fifocache::serr::Error> ReadHeader();
  std::expected<int64_t, fifocache::serr::Error> ReadCount();
  std::expected<int, fifocache::serr::Error> ReadEntry(SnapshotEntry &e);

 private:
  google::protobuf::io::GzipInputStream _gz;

  std::expected<int, fifocache::serr::Error> read(
      google::protobuf::MessageLite *msg, const std::string &what);
};

// A file created next to its final destination. Commit makes it durable and
// renames it over the destination; if Commit is never reached or fails, the
// destructor removes it and the destination keeps its old contents.
class TmpFile {
 public:
  static std::expected<std::unique_ptr<TmpFile>, fifocache::serr::Error> Create(
      const std::string &dst);
  ~TmpFile();

  google::protobuf::io::ZeroCopyOutputStream *Stream() { return _out.get(); }
  std::expected<int, fifocache::serr::Error> Commit();

 private:
  TmpFile(std::string dst, std::string path, int fd)
      : _dst(dst),
        _path(path),
        _fd(fd),
        _out(std::make_unique<google::protobuf::io::FileOutputStream>(fd)),
        _open(true),
        _committed(false) {}

  std::string _dst;
  std::string _path;
  int _fd;
  std::unique_ptr<google::protobuf::io::FileOutputStream> _out;
  bool _open;
  bool _committed;
};

// Opens path for reading. A missing file is TErrNotfound.
std::expected<std::unique_ptr<google::protobuf::io::FileInputStream>,
              fifocache::serr::Error>
OpenFile(const std::string &path);

};  // namespace cache::snapshot
};  // namespace fifocache
