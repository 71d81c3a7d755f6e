#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace shipit {

// Raw 20-byte SHA-1 digest
using digest = std::array<std::uint8_t, 20>;

/** Compute SHA-1 of arbitrary bytes. */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert a digest to 40-char lowercase hex. */
std::string to_hex(const digest &d);

/**
 * Signature the review service expects with AUTH:
 *   hex(sha1(token + certificate))
 * The certificate itself never goes over the wire.
 */
inline std::string auth_signature(std::string_view token, std::string_view certificate) {
  std::string buf;
  buf.reserve(token.size() + certificate.size());
  buf.append(token);
  buf.append(certificate);
  return to_hex(sha1(buf));
}

} // namespace shipit
