#include "sigv4.h"
#include "../util.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <map>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace bme {

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& msg){
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int outlen = 0;
    unsigned char* r = HMAC(EVP_sha256(), key.data(), (int)key.size(),
                            reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
                            out.data(), &outlen);
    if(!r) throw std::runtime_error("HMAC-SHA256 failed");
    out.resize(outlen);
    return out;
}

std::string sha256_hex(const std::string& data){
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int n = 0;
    if(EVP_Digest(data.data(), data.size(), md, &n, EVP_sha256(), nullptr) != 1){
        throw std::runtime_error("SHA-256 failed");
    }
    return hex(md, n);
}

std::vector<uint8_t> sigv4_signing_key(const std::string& secret,
                                       const std::string& date,
                                       const std::string& region,
                                       const std::string& service)
{
    const std::string k = "AWS4" + secret;
    std::vector<uint8_t> key(k.begin(), k.end());
    key = hmac_sha256(key, date);
    key = hmac_sha256(key, region);
    key = hmac_sha256(key, service);
    return hmac_sha256(key, "aws4_request");
}

std::string amz_timestamp(int64_t ms){
    std::time_t tt = (std::time_t)(ms / 1000);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buf[20];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

// RFC 3986 unreserved characters pass, '/' kept as the segment separator
static std::string uri_encode_path(const std::string& path){
    std::string out;
    for(unsigned char c : path){
        if((c>='A'&&c<='Z') || (c>='a'&&c<='z') || (c>='0'&&c<='9') ||
           c=='-' || c=='_' || c=='.' || c=='~' || c=='/'){
            out += (char)c;
        } else {
            char b[4]; std::snprintf(b, sizeof(b), "%%%02X", c); out += b;
        }
    }
    return out.empty() ? std::string("/") : out;
}

static std::string collapse_spaces(const std::string& v){
    std::string t = trim(v), out;
    bool sp = false;
    for(char c : t){
        if(c==' '){ if(!sp) out += c; sp = true; }
        else { out += c; sp = false; }
    }
    return out;
}

std::string sigv4_sign(HttpRequest& req, const AwsCredentials& creds, const std::string& amz_date){
    const std::string payload_hash = sha256_hex(req.body);
    req.headers.emplace_back("x-amz-date", amz_date);
    req.headers.emplace_back("x-amz-content-sha256", payload_hash);

    std::map<std::string, std::string> canon;  // sorted by lower-cased name
    canon["host"] = http_host_header(req);
    for(const auto& h : req.headers) canon[to_lower(h.first)] = collapse_spaces(h.second);

    std::string canonical_headers, signed_headers;
    for(const auto& kv : canon){
        canonical_headers += kv.first + ":" + kv.second + "\n";
        if(!signed_headers.empty()) signed_headers += ";";
        signed_headers += kv.first;
    }

    std::string path = req.path, query;
    auto q = path.find('?');
    if(q != std::string::npos){ query = path.substr(q + 1); path = path.substr(0, q); }

    const std::string canonical_request =
        req.method + "\n" +
        uri_encode_path(path) + "\n" +
        query + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        payload_hash;

    const std::string date = amz_date.substr(0, 8);
    const std::string scope = date + "/" + creds.region + "/" + creds.service + "/aws4_request";
    const std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" + sha256_hex(canonical_request);

    const auto key = sigv4_signing_key(creds.secret_key, date, creds.region, creds.service);
    const std::string signature = hex(hmac_sha256(key, string_to_sign));

    const std::string auth = "AWS4-HMAC-SHA256 Credential=" + creds.access_key + "/" + scope +
                             ",SignedHeaders=" + signed_headers + ",Signature=" + signature;
    req.headers.emplace_back("Authorization", auth);
    return auth;
}

}
