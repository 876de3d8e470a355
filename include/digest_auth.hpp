#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fritz {

// Parameters of a "WWW-Authenticate: Digest ..." challenge.
struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string opaque;
    std::string qop;        // "auth" if offered, empty for RFC 2069 style
    std::string algorithm;  // Only MD5 is supported
    bool stale = false;
};

// HTTP Digest access authentication (RFC 2617, MD5, qop=auth).
class DigestAuth {
public:
    DigestAuth(std::string username, std::string password);

    // Parses a WWW-Authenticate header value. Returns nullopt for non-Digest schemes.
    static std::optional<DigestChallenge> parse_challenge(const std::string& header);

    static std::string md5_hex(const std::string& data);

    /**
     * Computes the request digest:
     * MD5(HA1:nonce:nc:cnonce:qop:HA2), or MD5(HA1:nonce:HA2) without qop.
     */
    static std::string compute_response(const std::string& ha1, const std::string& nonce,
                                        const std::string& nc, const std::string& cnonce,
                                        const std::string& qop, const std::string& ha2);

    // Stores a new challenge and resets the nonce count.
    void set_challenge(const DigestChallenge& challenge);

    bool has_challenge() const { return challenge_.has_value(); }

    /**
     * Builds the Authorization header value for the next request under the current
     * challenge, incrementing the nonce count. Throws TransportError without a challenge.
     */
    std::string authorization(const std::string& method, const std::string& uri);

private:
    std::string username_;
    std::string password_;
    std::optional<DigestChallenge> challenge_;
    uint32_t nonce_count_ = 0;

    static std::string make_cnonce();
};

}
