#pragma once

#include <google/protobuf/message_lite.h>
#include <serr/serr.h>

#include <bit>
#include <concepts>
#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <type_traits>

namespace fifocache {
namespace util::codec {

// Little-endian fixed-width integer packing, as in Go's encoding/binary.
uint64_t bytes_to_uint64(const unsigned char *b);
void uint64_to_bytes(unsigned char *b, uint64_t i);

// Codec<T> converts a cached key or value to bytes and back. Encode appends
// nothing; it overwrites b. Decode must reject bytes that were not produced by
// Encode for the same T with TErrBadEncoding.
//
// Specializations cover integers, floating point, std::string and protobuf
// messages. Other types provide their own specialization.
template <typename T>
struct Codec;

template <typename T>
  requires std::integral<T>
struct Codec<T> {
  static std::expected<int, fifocache::serr::Error> Encode(const T &v,
                                                           std::string &b) {
    b.resize(sizeof(uint64_t));
    uint64_to_bytes(reinterpret_cast<unsigned char *>(b.data()),
                    static_cast<uint64_t>(v));
    return 0;
  }
  static std::expected<T, fifocache::serr::Error> Decode(const std::string &b) {
    if (b.size() != sizeof(uint64_t)) {
      return std::unexpected(fifocache::serr::Error(
          fifocache::serr::TErrBadEncoding,
          fmt::format("integer of {} bytes", b.size())));
    }
    uint64_t u =
        bytes_to_uint64(reinterpret_cast<const unsigned char *>(b.data()));
    if constexpr (std::is_signed_v<T>) {
      int64_t i = static_cast<int64_t>(u);
      if (i < std::numeric_limits<T>::min() ||
          i > std::numeric_limits<T>::max()) {
        return std::unexpected(fifocache::serr::Error(
            fifocache::serr::TErrBadEncoding,
            fmt::format("integer {} out of range", i)));
      }
      return static_cast<T>(i);
    } else {
      if (u > std::numeric_limits<T>::max()) {
        return std::unexpected(fifocache::serr::Error(
            fifocache::serr::TErrBadEncoding,
            fmt::format("integer {} out of range", u)));
      }
      return static_cast<T>(u);
    }
  }
};

template <typename T>
  requires std::floating_point<T>
struct Codec<T> {
  static std::expected<int, fifocache::serr::Error> Encode(const T &v,
                                                           std::string &b) {
    b.resize(sizeof(uint64_t));
    uint64_to_bytes(reinterpret_cast<unsigned char *>(b.data()),
                    std::bit_cast<uint64_t>(static_cast<double>(v)));
    return 0;
  }
  static std::expected<T, fifocache::serr::Error> Decode(const std::string &b) {
    if (b.size() != sizeof(uint64_t)) {
      return std::unexpected(fifocache::serr::Error(
          fifocache::serr::TErrBadEncoding,
          fmt::format("float of {} bytes", b.size())));
    }
    uint64_t u =
        bytes_to_uint64(reinterpret_cast<const unsigned char *>(b.data()));
    return static_cast<T>(std::bit_cast<double>(u));
  }
};

template <>
struct Codec<std::string> {
  static std::expected<int, fifocache::serr::Error> Encode(const std::string &v,
                                                           std::string &b) {
    b = v;
    return 0;
  }
  static std::expected<std::string, fifocache::serr::Error> Decode(
      const std::string &b) {
    return b;
  }
};

// Any protobuf message is stored in its wire format.
template <typename T>
  requires std::derived_from<T, google::protobuf::MessageLite>
struct Codec<T> {
  static std::expected<int, fifocache::serr::Error> Encode(const T &v,
                                                           std::string &b) {
    b.clear();
    if (!v.SerializeToString(&b)) {
      return std::unexpected(fifocache::serr::Error(
          fifocache::serr::TErrBadEncoding,
          fmt::format("serialize {}", v.GetTypeName())));
    }
    return 0;
  }
  static std::expected<T, fifocache::serr::Error> Decode(const std::string &b) {
    T v;
    if (!v.ParseFromString(b)) {
      return std::unexpected(fifocache::serr::Error(
          fifocache::serr::TErrBadEncoding,
          fmt::format("parse {}", v.GetTypeName())));
    }
    return v;
  }
};

};  // namespace util::codec
};  // namespace fifocache
