#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "http_client.h"

namespace bme {

struct AwsCredentials {
    std::string access_key;
    std::string secret_key;
    std::string region;
    std::string service{"s3"};
};

std::string sha256_hex(const std::string& data);

// kSigning = HMAC(HMAC(HMAC(HMAC("AWS4"+secret, date), region), service), "aws4_request")
std::vector<uint8_t> sigv4_signing_key(const std::string& secret,
                                       const std::string& date_yyyymmdd,
                                       const std::string& region,
                                       const std::string& service);

// "YYYYMMDDTHHMMSSZ" for a ms timestamp (UTC).
std::string amz_timestamp(int64_t ms);

// Signs `req` in place with AWS Signature Version 4: adds x-amz-date,
// x-amz-content-sha256 and Authorization. Every header already on the
// request, plus Host, is signed. `amz_date` is "YYYYMMDDTHHMMSSZ".
// Returns the Authorization value.
std::string sigv4_sign(HttpRequest& req, const AwsCredentials& creds, const std::string& amz_date);

}
