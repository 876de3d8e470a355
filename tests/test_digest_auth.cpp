#include <gtest/gtest.h>
#include "digest_auth.hpp"
#include "errors.hpp"

using namespace fritz;

TEST(DigestAuthTest, Md5Hex) {
    EXPECT_EQ(DigestAuth::md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(DigestAuth::md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

// Worked example from RFC 2617 section 3.5
TEST(DigestAuthTest, Rfc2617Example) {
    std::string ha1 = DigestAuth::md5_hex("Mufasa:testrealm@host.com:Circle Of Life");
    std::string ha2 = DigestAuth::md5_hex("GET:/dir/index.html");
    std::string response = DigestAuth::compute_response(
        ha1, "dcd98b7102dd2f0e8b11d0f600bfb0c093", "00000001", "0a4f113b", "auth", ha2);
    EXPECT_EQ(response, "6629fae49393a05397450978507c4ef1");
}

TEST(DigestAuthTest, ParsesChallenge) {
    auto challenge = DigestAuth::parse_challenge(
        R"(Digest realm="F!Box SOAP-Auth", nonce="B5B6E3E8B6E4C1C5", algorithm=MD5, qop="auth,auth-int", opaque="xyz")");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->realm, "F!Box SOAP-Auth");
    EXPECT_EQ(challenge->nonce, "B5B6E3E8B6E4C1C5");
    EXPECT_EQ(challenge->algorithm, "MD5");
    EXPECT_EQ(challenge->qop, "auth");
    EXPECT_EQ(challenge->opaque, "xyz");
    EXPECT_FALSE(challenge->stale);

    auto stale = DigestAuth::parse_challenge(R"(digest realm="r", nonce="n2", stale=TRUE)");
    ASSERT_TRUE(stale.has_value());
    EXPECT_TRUE(stale->stale);
    EXPECT_TRUE(stale->qop.empty());
}

TEST(DigestAuthTest, RejectsOtherSchemes) {
    EXPECT_FALSE(DigestAuth::parse_challenge(R"(Basic realm="x")").has_value());
    EXPECT_FALSE(DigestAuth::parse_challenge("").has_value());
    EXPECT_FALSE(DigestAuth::parse_challenge(R"(Digest realm="no nonce")").has_value());
}

TEST(DigestAuthTest, AuthorizationHeader) {
    DigestAuth auth("admin", "secret");
    EXPECT_FALSE(auth.has_challenge());
    EXPECT_THROW(auth.authorization("POST", "/upnp/control/deviceinfo"), TransportError);

    auth.set_challenge(*DigestAuth::parse_challenge(R"(Digest realm="F!Box SOAP-Auth", nonce="abc", qop="auth")"));
    ASSERT_TRUE(auth.has_challenge());

    std::string first = auth.authorization("POST", "/upnp/control/deviceinfo");
    EXPECT_EQ(first.rfind("Digest username=\"admin\"", 0), 0u);
    EXPECT_NE(first.find("realm=\"F!Box SOAP-Auth\""), std::string::npos);
    EXPECT_NE(first.find("nonce=\"abc\""), std::string::npos);
    EXPECT_NE(first.find("uri=\"/upnp/control/deviceinfo\""), std::string::npos);
    EXPECT_NE(first.find("qop=auth"), std::string::npos);
    EXPECT_NE(first.find("nc=00000001"), std::string::npos);

    std::string second = auth.authorization("POST", "/upnp/control/deviceinfo");
    EXPECT_NE(second.find("nc=00000002"), std::string::npos);

    // A new challenge restarts the nonce count
    auth.set_challenge(*DigestAuth::parse_challenge(R"(Digest realm="F!Box SOAP-Auth", nonce="def", qop="auth")"));
    EXPECT_NE(auth.authorization("POST", "/x").find("nc=00000001"), std::string::npos);
}

TEST(DigestAuthTest, UnsupportedAlgorithm) {
    DigestAuth auth("admin", "secret");
    auto challenge = DigestAuth::parse_challenge(R"(Digest realm="r", nonce="n", algorithm=SHA-256)");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_THROW(auth.set_challenge(*challenge), TransportError);
}
