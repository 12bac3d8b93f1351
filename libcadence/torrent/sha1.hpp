#pragma once
/********************************************************************************
 *                               Cadence Project                                *
 *                         Lossless Source Verification                         *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <libcadence/common/error.hpp>
#include <libcadence/common/types.hpp>
#include <format>
#include <openssl/evp.h>
#include <span>
#include <string>

namespace libcadence::torrent
{

// Incremental SHA-1 over OpenSSL's EVP interface
class Sha1Hasher
{
public:
  Sha1Hasher() : m_ctx(EVP_MD_CTX_new())
  {
    if (!m_ctx || EVP_DigestInit_ex(m_ctx, EVP_sha1(), nullptr) != 1)
    {
      EVP_MD_CTX_free(m_ctx);
      throw Error(ErrorKind::Torrent, "Unable to initialise SHA-1 digest");
    }
  }

  ~Sha1Hasher() { EVP_MD_CTX_free(m_ctx); }

  Sha1Hasher(const Sha1Hasher&)                    = delete;
  auto operator=(const Sha1Hasher&) -> Sha1Hasher& = delete;

  void update(std::span<const ui8> bytes)
  {
    if (EVP_DigestUpdate(m_ctx, bytes.data(), bytes.size()) != 1)
      throw Error(ErrorKind::Torrent, "SHA-1 update failed");
  }

  // Finalises the digest; the hasher is re-armed for the next input
  auto finish() -> Sha1Digest
  {
    Sha1Digest   digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(m_ctx, digest.data(), &digest_len) != 1 || digest_len != SHA1Size)
      throw Error(ErrorKind::Torrent, "SHA-1 finalisation failed");
    if (EVP_DigestInit_ex(m_ctx, EVP_sha1(), nullptr) != 1)
      throw Error(ErrorKind::Torrent, "Unable to initialise SHA-1 digest");
    return digest;
  }

  static auto digest(std::span<const ui8> bytes) -> Sha1Digest
  {
    Sha1Hasher hasher;
    hasher.update(bytes);
    return hasher.finish();
  }

private:
  EVP_MD_CTX* m_ctx;
};

inline auto to_hex(const Sha1Digest& digest) -> std::string
{
  std::string out;
  out.reserve(digest.size() * 2);
  for (auto byte : digest)
    out += std::format("{:02x}", byte);
  return out;
}

} // namespace libcadence::torrent
