#include "s3_store.h"
#include "sigv4.h"
#include "../constants.h"
#include "../ledger_codec.h"
#include "../log.h"

#include <stdexcept>

namespace bme {

S3Store::S3Store(RemoteConfig cfg, HttpSender send)
    : cfg_(std::move(cfg)), send_(std::move(send))
{
    if(!send_) send_ = http_request;
}

std::string S3Store::host() const {
    if(!cfg_.endpoint.empty()) return cfg_.endpoint;
    return "s3." + cfg_.region + ".amazonaws.com";
}

std::string S3Store::describe() const {
    return std::string(cfg_.use_tls ? "https://" : "http://") + host() + "/" + cfg_.bucket_name + "/" + DATA_FILE_NAME;
}

HttpRequest S3Store::make_request(const std::string& method, const std::string& path, std::string body) const {
    HttpRequest req;
    req.method = method;
    req.host = host();
    req.port = cfg_.port;
    req.tls = cfg_.use_tls;
    req.path = path;
    req.body = std::move(body);
    req.timeout_ms = BME_S3_TIMEOUT_MS;

    AwsCredentials creds;
    creds.access_key = cfg_.access_key;
    creds.secret_key = cfg_.secret_key;
    creds.region = cfg_.region;
    sigv4_sign(req, creds, amz_timestamp(now_ms()));
    return req;
}

std::optional<Ledger> S3Store::fetch(){
    HttpRequest req = make_request("GET", "/" + cfg_.bucket_name + "/" + DATA_FILE_NAME, "");
    HttpResponse resp;
    std::string err;
    if(!send_(req, resp, err)){
        log_warn(LogCategory::STORAGE, "fetch from " + describe() + " failed (" + err + "), treating as empty");
        return std::nullopt;
    }
    if(resp.code == 404){
        BME_LOG_DEBUG(LogCategory::STORAGE, "no ledger at " + describe());
        return std::nullopt;
    }
    if(resp.code != 200){
        log_warn(LogCategory::STORAGE, "fetch from " + describe() + " returned HTTP " +
                 std::to_string(resp.code) + ", treating as empty");
        return std::nullopt;
    }

    Ledger l;
    if(!decode_ledger(resp.body, l, err)){
        throw std::runtime_error(describe() + ": " + err);
    }
    return l;
}

bool S3Store::ensure_bucket(std::string& err){
    if(bucket_ready_) return true;

    std::string body;
    if(cfg_.region != DEFAULT_REGION){
        body = "<CreateBucketConfiguration xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
               "<LocationConstraint>" + cfg_.region + "</LocationConstraint>"
               "</CreateBucketConfiguration>";
    }
    HttpRequest req = make_request("PUT", "/" + cfg_.bucket_name, body);
    HttpResponse resp;
    if(!send_(req, resp, err)){
        err = "create bucket " + cfg_.bucket_name + ": " + err;
        return false;
    }
    const bool owned = resp.code == 409 && resp.body.find("BucketAlreadyOwnedByYou") != std::string::npos;
    if(resp.code != 200 && !owned){
        err = "create bucket " + cfg_.bucket_name + ": HTTP " + std::to_string(resp.code);
        return false;
    }
    bucket_ready_ = true;
    return true;
}

bool S3Store::store(const Ledger& ledger, std::string& err){
    if(!ensure_bucket(err)) return false;

    HttpRequest req = make_request("PUT", "/" + cfg_.bucket_name + "/" + DATA_FILE_NAME, encode_ledger(ledger));
    HttpResponse resp;
    if(!send_(req, resp, err)){
        err = "put " + describe() + ": " + err;
        return false;
    }
    if(resp.code < 200 || resp.code >= 300){
        err = "put " + describe() + ": HTTP " + std::to_string(resp.code);
        return false;
    }
    BME_LOG_DEBUG(LogCategory::STORAGE, "wrote " + describe());
    return true;
}

}
