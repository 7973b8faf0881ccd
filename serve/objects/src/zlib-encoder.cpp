#include "serve/zlib-encoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "serve/zlib-stream-raii.hpp"

namespace serve {

void ZlibEncoder::encodeFull(std::string_view data, std::string& out) {
  ZStreamRAII zs(_variant, _level);

  auto& zstream = zs.stream;

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zstream.avail_in = static_cast<uInt>(data.size());

  const auto oldSize = out.size();
  const auto maxCompressedSize = static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size())));

  int rc = Z_OK;
  out.resize_and_overwrite(oldSize + maxCompressedSize, [&](char* buf, std::size_t) {
    zstream.next_out = reinterpret_cast<unsigned char*>(buf + oldSize);
    zstream.avail_out = static_cast<uInt>(maxCompressedSize);

    rc = deflate(&zstream, Z_FINISH);
    return rc == Z_STREAM_END ? oldSize + (maxCompressedSize - zstream.avail_out) : oldSize;
  });
  if (rc != Z_STREAM_END) {
    throw std::runtime_error(
        std::format("Error {} during {} compression", rc, _variant == ZStreamRAII::Variant::gzip ? "gzip" : "deflate"));
  }
}

}  // namespace serve
