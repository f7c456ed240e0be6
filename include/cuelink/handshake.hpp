#pragma once
/**
 * @file handshake.hpp
 * @brief Line-based handshake codec (build + parse, no I/O).
 *
 * @details
 * ## Wire form
 * ```
 *  initiator -> responder   CB/<major>[ auth=<scheme>][ nonce=<n>][ features=<csv>][ ts=<epoch>][ name=<string>]\n
 *  responder -> initiator   OK/<major> hmac=<opaque>\n
 *
 *  legacy                   CB/1 HELLO\n   ->   CB/1 HELLO_ACK\n
 * ```
 *
 * ## Parsing policy
 * - Trailing CR/LF and surrounding whitespace are trimmed first.
 * - The line must start with `CB/`. Anything else is a malformed handshake;
 *   the caller drops the line and keeps waiting until its timeout.
 * - The first token's numeric major is mandatory. Majors outside
 *   [MIN_MAJOR, MAX_MAJOR] are reported as unsupported-version.
 * - Unknown `key=value` tokens (and bare words other than `HELLO`) are
 *   ignored so that newer peers can add fields.
 * - `name=` carries the peer label. `display_name()` strips `.local`.
 *
 * ## Authentication
 * `auth=` and `hmac=` are carried through untouched and never verified. The
 * reply always has an empty `hmac=` value. They mark where a real
 * challenge/response would plug in.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cuelink/errors.hpp"

namespace cuelink {

struct HandshakeRequest {
  int                      major{2};
  bool                     legacy{false};  // "CB/1 HELLO"
  std::string              auth;           // scheme, e.g. "psk1"
  std::string              nonce;
  std::vector<std::string> features;
  std::optional<int64_t>   ts;
  std::string              name;           // raw, may end in ".local"
};

struct HandshakeReply {
  int         major{2};
  bool        legacy{false};               // "CB/1 HELLO_ACK"
  std::string hmac;
};

class HandshakeCodec {
public:
  static constexpr int MIN_MAJOR = 1;
  static constexpr int MAX_MAJOR = 2;
  static constexpr const char* DEFAULT_AUTH = "psk1";

  static bool is_supported(int major) { return major >= MIN_MAJOR && major <= MAX_MAJOR; }

  // ---------- build ----------
  static std::string build_request(const HandshakeRequest& req);
  static std::string build_reply(int major);
  static std::string build_legacy_request();
  static std::string build_legacy_reply();
  /// Reply matching the request's form (legacy ack or `OK/<major> hmac=`).
  static std::string reply_for(const HandshakeRequest& req);

  // ---------- parse ----------
  /**
   * @brief Parse an initiator line.
   * @param why set to the ProtocolError when nullopt is returned.
   */
  static std::optional<HandshakeRequest> parse_request(const std::string& line, ProtocolError& why);

  /// Parse a responder line (`OK/<major> ...` or the legacy ack).
  static std::optional<HandshakeReply> parse_reply(const std::string& line, ProtocolError& why);

  /// Peer label for UI: trailing ".local" removed.
  static std::string display_name(const std::string& raw);
};

} // namespace cuelink
