#pragma once

#include <fmt/format.h>

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace fifocache {
namespace serr {

enum Terror : int {
  TErrNoError = 0,
  TErrNotfound = 1,
  TErrIO = 2,

  //
  // snapshot stream errors
  //

  TErrCorrupt = 3,
  TErrBadEncoding = 4,
  TErrClosed = 5,

  //
  // To propagate non-cache errors.
  // Must be *last*
  //
  TErrError = 6,
};

std::string TerrorToString(Terror e);

class Error {
 public:
  Error(Terror err, std::string msg) : _err(err), _msg(msg) {}
  ~Error() {}

  Terror GetError() const { return _err; }
  std::string GetMsg() const { return _msg; }
  bool IsErrNotfound() const { return _err == TErrNotfound; }
  std::string String() const {
    std::ostringstream out;
    out << "{Err: \"" << fifocache::serr::TerrorToString(_err) << "\" Obj: \""
        << _msg << "\"}";
    return out.str();
  }

 private:
  Terror _err;
  std::string _msg;
};

};  // namespace serr
};  // namespace fifocache

template <>
struct fmt::formatter<fifocache::serr::Error>
    : fmt::formatter<std::string_view> {
  template <class FmtContext>
  auto format(const fifocache::serr::Error &e, FmtContext &ctx) const {
    return fmt::formatter<std::string_view>::format(e.String(), ctx);
  }
};
