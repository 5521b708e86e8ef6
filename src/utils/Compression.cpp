/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Compression.hpp"
#include "core/Logger.hpp"

#include <zlib.h>

#include <array>
#include <cstring>
#include <format>

namespace Realmforge::Compression {

namespace {
constexpr size_t CHUNK_SIZE = 32768;
// windowBits + 16 selects the gzip header/trailer instead of raw zlib
constexpr int GZIP_WINDOW_BITS = MAX_WBITS | 16;
constexpr int DEFAULT_MEM_LEVEL = 8;
} // namespace

bool gzipCompress(const std::string &input, std::string &output, int level) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));

  if (deflateInit2(&zs, level, Z_DEFLATED, GZIP_WINDOW_BITS,
                   DEFAULT_MEM_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK) {
    SAVEGAME_ERROR("Compression::gzipCompress - deflateInit2 failed");
    return false;
  }

  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  zs.avail_in = static_cast<uInt>(input.size());

  std::string result;
  std::array<char, CHUNK_SIZE> outbuffer;
  int ret;
  do {
    zs.next_out = reinterpret_cast<Bytef *>(outbuffer.data());
    zs.avail_out = static_cast<uInt>(outbuffer.size());

    ret = deflate(&zs, Z_FINISH);
    if (ret == Z_STREAM_ERROR) {
      break;
    }
    result.append(outbuffer.data(), outbuffer.size() - zs.avail_out);
  } while (ret == Z_OK);

  deflateEnd(&zs);

  if (ret != Z_STREAM_END) {
    SAVEGAME_ERROR(std::format(
        "Compression::gzipCompress - deflate failed with code {}", ret));
    return false;
  }

  output = std::move(result);
  return true;
}

bool gzipDecompress(const std::string &input, std::string &output) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));

  if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) {
    SAVEGAME_ERROR("Compression::gzipDecompress - inflateInit2 failed");
    return false;
  }

  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  zs.avail_in = static_cast<uInt>(input.size());

  std::string result;
  std::array<char, CHUNK_SIZE> outbuffer;
  int ret;

  // Inflate blockwise until the stream ends or zlib reports an error
  do {
    zs.next_out = reinterpret_cast<Bytef *>(outbuffer.data());
    zs.avail_out = static_cast<uInt>(outbuffer.size());

    ret = inflate(&zs, Z_NO_FLUSH);
    result.append(outbuffer.data(), outbuffer.size() - zs.avail_out);
  } while (ret == Z_OK);

  const std::string message = zs.msg ? zs.msg : "no detail";
  inflateEnd(&zs);

  if (ret != Z_STREAM_END) {
    SAVEGAME_ERROR(std::format(
        "Compression::gzipDecompress - inflate failed ({}): {}", ret, message));
    return false;
  }

  output = std::move(result);
  return true;
}

bool isGzipData(const std::string &data) {
  return data.size() >= 2 && static_cast<unsigned char>(data[0]) == 0x1f &&
         static_cast<unsigned char>(data[1]) == 0x8b;
}

} // namespace Realmforge::Compression
