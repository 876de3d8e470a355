#include "digest_auth.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fritz {

DigestAuth::DigestAuth(std::string username, std::string password)
    : username_(std::move(username)), password_(std::move(password))
{}

std::optional<DigestChallenge> DigestAuth::parse_challenge(const std::string& header) {
    std::string value = InputValidator::trim(header);
    if (value.size() < 6 || InputValidator::to_lower(value.substr(0, 6)) != "digest") {
        return std::nullopt;
    }

    DigestChallenge challenge;
    size_t pos = 6;

    // key=value or key="quoted value", separated by commas
    while (pos < value.size()) {
        while (pos < value.size() && (value[pos] == ',' || std::isspace(static_cast<unsigned char>(value[pos])))) {
            ++pos;
        }
        size_t eq = value.find('=', pos);
        if (eq == std::string::npos) break;

        std::string key = InputValidator::to_lower(InputValidator::trim(value.substr(pos, eq - pos)));
        pos = eq + 1;

        std::string param;
        if (pos < value.size() && value[pos] == '"') {
            ++pos;
            while (pos < value.size() && value[pos] != '"') {
                if (value[pos] == '\\' && pos + 1 < value.size()) ++pos;
                param += value[pos++];
            }
            ++pos;
        } else {
            size_t end = value.find(',', pos);
            if (end == std::string::npos) end = value.size();
            param = InputValidator::trim(value.substr(pos, end - pos));
            pos = end;
        }

        if (key == "realm") challenge.realm = param;
        else if (key == "nonce") challenge.nonce = param;
        else if (key == "opaque") challenge.opaque = param;
        else if (key == "algorithm") challenge.algorithm = param;
        else if (key == "stale") challenge.stale = InputValidator::to_lower(param) == "true";
        else if (key == "qop") {
            // Offered qop is a list, e.g. "auth,auth-int"
            std::stringstream options(param);
            std::string option;
            while (std::getline(options, option, ',')) {
                if (InputValidator::trim(option) == "auth") {
                    challenge.qop = "auth";
                }
            }
        }
    }

    if (challenge.nonce.empty()) {
        return std::nullopt;
    }
    return challenge;
}

std::string DigestAuth::md5_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_md5(), nullptr) != 1) {
        throw TransportError("MD5 digest computation failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    return ss.str();
}

std::string DigestAuth::compute_response(const std::string& ha1, const std::string& nonce,
                                         const std::string& nc, const std::string& cnonce,
                                         const std::string& qop, const std::string& ha2) {
    if (qop.empty()) {
        return md5_hex(ha1 + ":" + nonce + ":" + ha2);
    }
    return md5_hex(ha1 + ":" + nonce + ":" + nc + ":" + cnonce + ":" + qop + ":" + ha2);
}

void DigestAuth::set_challenge(const DigestChallenge& challenge) {
    if (!challenge.algorithm.empty() && InputValidator::to_lower(challenge.algorithm) != "md5") {
        throw TransportError("Unsupported digest algorithm: " + challenge.algorithm);
    }
    challenge_ = challenge;
    nonce_count_ = 0;
}

std::string DigestAuth::authorization(const std::string& method, const std::string& uri) {
    if (!challenge_) {
        throw TransportError("No digest challenge received yet");
    }
    const auto& c = *challenge_;

    ++nonce_count_;
    std::stringstream nc_ss;
    nc_ss << std::hex << std::setw(8) << std::setfill('0') << nonce_count_;
    std::string nc = nc_ss.str();
    std::string cnonce = make_cnonce();

    std::string ha1 = md5_hex(username_ + ":" + c.realm + ":" + password_);
    std::string ha2 = md5_hex(method + ":" + uri);
    std::string response = compute_response(ha1, c.nonce, nc, cnonce, c.qop, ha2);

    std::stringstream ss;
    ss << "Digest username=\"" << username_ << "\""
       << ", realm=\"" << c.realm << "\""
       << ", nonce=\"" << c.nonce << "\""
       << ", uri=\"" << uri << "\""
       << ", algorithm=MD5"
       << ", response=\"" << response << "\"";
    if (!c.opaque.empty()) {
        ss << ", opaque=\"" << c.opaque << "\"";
    }
    if (!c.qop.empty()) {
        ss << ", qop=" << c.qop << ", nc=" << nc << ", cnonce=\"" << cnonce << "\"";
    }
    return ss.str();
}

std::string DigestAuth::make_cnonce() {
    unsigned char b[8];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw TransportError("CSPRNG failure while generating digest cnonce");
    }
    std::stringstream ss;
    for (unsigned char byte : b) ss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    return ss.str();
}

}
