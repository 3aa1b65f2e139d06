#include <serr/serr.h>

namespace fifocache {
namespace serr {

std::string TerrorToString(Terror e) {
  switch (e) {
    case TErrNoError:
      return "No error";
    case TErrNotfound:
      return "file not found";
    case TErrIO:
      return "i/o error";

    // snapshot stream
    case TErrCorrupt:
      return "corrupt snapshot";
    case TErrBadEncoding:
      return "bad encoding";
    case TErrClosed:
      return "closed";

    // for passing non-cache errors through
    case TErrError:
      return "Non-cache error";

    default:
      return "unknown error";
  }
}

};  // namespace serr
};  // namespace fifocache
