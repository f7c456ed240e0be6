// -----------------------------------------------------------------------------
// handshake.cpp — HandshakeCodec implementation
//
// API & wire grammar:
//   see include/cuelink/handshake.hpp
//
// NOTE: parsing is pure string work. The transport decides what a rejected
// line means (drop and keep waiting until the handshake timer fires).
// -----------------------------------------------------------------------------
#include "cuelink/handshake.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace cuelink {

namespace {

constexpr const char* REQUEST_PREFIX = "CB/";
constexpr const char* REPLY_PREFIX   = "OK/";
constexpr const char* LEGACY_HELLO   = "HELLO";
constexpr const char* LEGACY_ACK     = "HELLO_ACK";
constexpr const char* LOCAL_SUFFIX   = ".local";

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool starts_with(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    const size_t pos = s.find(sep, start);
    const size_t end = (pos == std::string::npos) ? s.size() : pos;
    if (end > start) out.emplace_back(s.substr(start, end - start));  // collapse runs of sep
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return out;
}

// "2" -> 2, "2.1" -> 2 (minor ignored), "" / "x" -> nullopt
std::optional<int> parse_major(const std::string& tok) {
  size_t n = 0;
  while (n < tok.size() && std::isdigit(static_cast<unsigned char>(tok[n]))) ++n;
  if (n == 0 || n > 6) return std::nullopt;
  if (n < tok.size() && tok[n] != '.' && tok[n] != '/') return std::nullopt;
  return std::atoi(tok.substr(0, n).c_str());
}

std::optional<int64_t> parse_epoch(const std::string& v) {
  if (v.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double d = std::strtod(v.c_str(), &end);
  if (errno != 0 || end == v.c_str() || *end != '\0') return std::nullopt;
  // PRE: finite and inside int64 before the cast (NaN fails both comparisons)
  if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) return std::nullopt;
  return static_cast<int64_t>(d);
}

} // namespace

// ---------- build ----------

std::string HandshakeCodec::build_request(const HandshakeRequest& req) {
  if (req.legacy) return build_legacy_request();
  std::string line = REQUEST_PREFIX + std::to_string(req.major);
  if (!req.auth.empty())  line += " auth=" + req.auth;
  if (!req.nonce.empty()) line += " nonce=" + req.nonce;
  if (!req.features.empty()) {
    line += " features=";
    for (size_t i = 0; i < req.features.size(); ++i) {
      if (i) line += ',';
      line += req.features[i];
    }
  }
  if (req.ts)               line += " ts=" + std::to_string(*req.ts);
  if (!req.name.empty())    line += " name=" + req.name;  // last: may contain spaces
  line += '\n';
  return line;
}

std::string HandshakeCodec::build_reply(int major) {
  return REPLY_PREFIX + std::to_string(major) + " hmac=\n";
}

std::string HandshakeCodec::build_legacy_request() { return "CB/1 HELLO\n"; }
std::string HandshakeCodec::build_legacy_reply()   { return "CB/1 HELLO_ACK\n"; }

std::string HandshakeCodec::reply_for(const HandshakeRequest& req) {
  return req.legacy ? build_legacy_reply() : build_reply(req.major);
}

// ---------- parse ----------

std::optional<HandshakeRequest> HandshakeCodec::parse_request(const std::string& line,
                                                              ProtocolError& why) {
  why = ProtocolError::None;
  const std::string s = trim(line);
  if (!starts_with(s, REQUEST_PREFIX)) {          // PRE: only CB/ lines are handshakes
    why = ProtocolError::MalformedHandshake;
    return std::nullopt;
  }

  const auto parts = split(s.substr(3), ' ');
  if (parts.empty()) { why = ProtocolError::MalformedHandshake; return std::nullopt; }

  const auto major = parse_major(parts[0]);
  if (!major) { why = ProtocolError::MalformedHandshake; return std::nullopt; }
  if (!is_supported(*major)) { why = ProtocolError::UnsupportedVersion; return std::nullopt; }

  HandshakeRequest req;
  req.major = *major;

  bool in_name = false;                           // name= swallows following bare words
  for (size_t i = 1; i < parts.size(); ++i) {
    const std::string& p = parts[i];
    const auto eq = p.find('=');
    if (eq == std::string::npos) {
      if (in_name)              { req.name += ' '; req.name += p; continue; }
      if (p == LEGACY_HELLO)    { req.legacy = true; }
      continue;                                   // unknown bare word: ignore
    }
    in_name = false;
    const std::string key = p.substr(0, eq);
    const std::string val = p.substr(eq + 1);
    if      (key == "auth")     req.auth = val;
    else if (key == "nonce")    req.nonce = val;
    else if (key == "features") req.features = split(val, ',');
    else if (key == "ts")       req.ts = parse_epoch(val);
    else if (key == "name")     { req.name = val; in_name = true; }
    // else: forward-compatible, ignored
  }

  // Legacy form is exactly "CB/1 HELLO"; a HELLO word on a v2 line is just noise.
  if (req.legacy && req.major != 1) req.legacy = false;
  return req;
}

std::optional<HandshakeReply> HandshakeCodec::parse_reply(const std::string& line,
                                                          ProtocolError& why) {
  why = ProtocolError::None;
  const std::string s = trim(line);

  if (starts_with(s, REQUEST_PREFIX)) {           // legacy ack lives in the CB/ namespace
    const auto parts = split(s.substr(3), ' ');
    if (parts.size() >= 2 && parse_major(parts[0]) == 1 && parts[1] == LEGACY_ACK) {
      HandshakeReply r;
      r.major  = 1;
      r.legacy = true;
      return r;
    }
    why = ProtocolError::MalformedHandshake;
    return std::nullopt;
  }

  if (!starts_with(s, REPLY_PREFIX)) {
    why = ProtocolError::MalformedHandshake;
    return std::nullopt;
  }

  const auto parts = split(s.substr(3), ' ');
  if (parts.empty()) { why = ProtocolError::MalformedHandshake; return std::nullopt; }
  const auto major = parse_major(parts[0]);
  if (!major) { why = ProtocolError::MalformedHandshake; return std::nullopt; }
  if (!is_supported(*major)) { why = ProtocolError::UnsupportedVersion; return std::nullopt; }

  HandshakeReply r;
  r.major = *major;
  for (size_t i = 1; i < parts.size(); ++i) {
    if (starts_with(parts[i], "hmac=")) r.hmac = parts[i].substr(5);
  }
  return r;
}

std::string HandshakeCodec::display_name(const std::string& raw) {
  const std::string suffix = LOCAL_SUFFIX;
  if (raw.size() > suffix.size() &&
      raw.compare(raw.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return raw.substr(0, raw.size() - suffix.size());
  }
  return raw;
}

} // namespace cuelink
