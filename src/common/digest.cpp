#include "transloom/common/digest.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace transloom::common {

namespace {

template <typename Bytes> std::string to_hex(const Bytes &bytes) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : bytes) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

} // namespace

std::string sha256_hex(const std::string &data) {
  std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest.data());
  return to_hex(digest);
}

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed");
  }
  return Result<std::string>::success(to_hex(data));
}

} // namespace transloom::common
