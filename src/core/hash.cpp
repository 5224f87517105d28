#include <fixtree/core/hash.hpp>
#include <fixtree/core/errors.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <span>
#include <sstream>
#include <vector>

namespace fixtree::core {

  namespace {

    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    [[noreturn]] void throw_openssl_error(const std::string& context) {
      unsigned long err = ERR_get_error();
      char err_buf[256]{0};
      ERR_error_string_n(err, err_buf, sizeof(err_buf));
      throw HashError(context + ": " + err_buf);
    }
  }

  auto toHex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    Hash256 out{};
    EVP_MD_CTX_Ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw_openssl_error("EVP_MD_CTX_new");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
      throw_openssl_error("EVP_DigestInit_ex");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
      throw_openssl_error("EVP_DigestUpdate");
    }
    unsigned int len = static_cast<unsigned int>(out.size());
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
      throw_openssl_error("EVP_DigestFinal_ex");
    }
    return out;
  }

  auto hash_concat(std::span<const uint8_t> left, std::span<const uint8_t> right) -> Hash256 {
    std::vector<uint8_t> combined;
    combined.reserve(left.size() + right.size());
    combined.insert(combined.end(), left.begin(), left.end());
    combined.insert(combined.end(), right.begin(), right.end());
    return sha256(std::span<const uint8_t>(combined.data(), combined.size()));
  }
}
