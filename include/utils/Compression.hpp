/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <string>

namespace Realmforge::Compression {

/**
 * @brief Compresses a buffer into a gzip stream (zlib, gzip wrapper)
 * @param input Raw bytes
 * @param output Receives the gzip bytes; untouched on failure
 * @param level zlib compression level, -1 for the library default
 * @return false if zlib reports an error
 */
bool gzipCompress(const std::string &input, std::string &output,
                  int level = -1);

/**
 * @brief Inflates a gzip stream produced by gzipCompress or the gzip tool
 * @return false on corrupt or truncated input
 */
bool gzipDecompress(const std::string &input, std::string &output);

// True when the buffer starts with the gzip magic bytes 0x1f 0x8b
bool isGzipData(const std::string &data);

} // namespace Realmforge::Compression

#endif // COMPRESSION_HPP
