#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace digiplayer::util {

/*
  Message digests (OpenSSL EVP), rendered as lower-case hex.
*/

std::string Md5Hex(std::string_view data);
std::string Sha256Hex(std::string_view data);

// Streams the file; throws StorageError when it cannot be read.
std::string Sha256FileHex(const std::filesystem::path& file);

} // namespace digiplayer::util
