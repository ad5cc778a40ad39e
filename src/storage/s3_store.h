#pragma once
#include <functional>
#include <string>
#include "ledger_store.h"
#include "http_client.h"
#include "../config.h"

namespace bme {

using HttpSender = std::function<bool(const HttpRequest&, HttpResponse&, std::string&)>;

// Ledger kept as <bucket>/data.json in an S3-compatible object store.
// Requests are path-style and signed with SigV4.
class S3Store : public LedgerStore {
public:
    // `send` defaults to http_request(); tests substitute a fake transport.
    explicit S3Store(RemoteConfig cfg, HttpSender send = HttpSender());

    // 404 or an unreachable endpoint is reported as "no ledger".
    std::optional<Ledger> fetch() override;

    // Creates the bucket once per instance (already-owned is fine), then
    // PUTs the document.
    bool store(const Ledger& ledger, std::string& err) override;

    std::string describe() const override;

    std::string host() const;

private:
    HttpRequest make_request(const std::string& method, const std::string& path, std::string body) const;
    bool ensure_bucket(std::string& err);

    RemoteConfig cfg_;
    HttpSender   send_;
    bool         bucket_ready_{false};
};

}
