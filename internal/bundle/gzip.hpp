#pragma once

#include <string>

namespace runvault::bundle {

// gzip framing (RFC 1952) through zlib.
std::string GzipCompress(const std::string& data, int level = 6);
std::string GzipDecompress(const std::string& data);

} // namespace runvault::bundle
