// S3 ledger store against a scripted transport
#include "../src/history.h"
#include "../src/ledger.h"
#include "../src/ledger_codec.h"
#include "../src/log.h"
#include "../src/storage/s3_store.h"
#include <cassert>
#include <cstdio>
#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bme;

struct FakeS3 {
    struct Reply { bool ok; int code; std::string body; };
    std::deque<Reply> replies;
    std::vector<HttpRequest> seen;

    HttpSender sender() {
        return [this](const HttpRequest& req, HttpResponse& resp, std::string& err) {
            seen.push_back(req);
            assert(!replies.empty());
            Reply r = replies.front();
            replies.pop_front();
            if (!r.ok) { err = "connection refused"; return false; }
            resp.code = r.code;
            resp.body = r.body;
            return true;
        };
    }
};

static bool has_header(const HttpRequest& r, const std::string& name){
    for (const auto& h : r.headers) if (h.first == name) return true;
    return false;
}

static RemoteConfig test_config(){
    RemoteConfig c;
    c.access_key = "AKIDEXAMPLE";
    c.secret_key = "secret";
    c.bucket_name = "bucket-test1234";
    return c;
}

int main() {
    log_set_level(LogLevel::NONE);
    printf("Testing S3 store...\n");

    {
        RemoteConfig c = test_config();
        S3Store s(c);
        assert(s.host() == "s3.us-east-1.amazonaws.com");
        assert(s.describe() == "https://s3.us-east-1.amazonaws.com/bucket-test1234/data.json");
        c.endpoint = "minio.local";
        c.use_tls = false;
        S3Store m(c);
        assert(m.host() == "minio.local");
        assert(m.describe() == "http://minio.local/bucket-test1234/data.json");
        printf("  [PASS] host and describe\n");
    }

    // Missing object and unreachable endpoint are misses
    {
        FakeS3 fake;
        fake.replies = {{true, 404, "<Error><Code>NoSuchKey</Code></Error>"}, {false, 0, ""}, {true, 500, ""}};
        S3Store s(test_config(), fake.sender());
        assert(!s.fetch());
        assert(!s.fetch());
        assert(!s.fetch());
        const HttpRequest& r = fake.seen[0];
        assert(r.method == "GET");
        assert(r.path == "/bucket-test1234/data.json");
        assert(r.host == "s3.us-east-1.amazonaws.com");
        assert(r.tls && r.port == 443);
        assert(has_header(r, "Authorization"));
        assert(has_header(r, "x-amz-date"));
        printf("  [PASS] fetch misses\n");
    }

    // Stored document is decoded; garbage throws
    {
        Ledger l = Ledger::fresh(1000);
        spend(l, 2.0, "tea", std::nullopt, false, 1001);
        FakeS3 fake;
        fake.replies = {{true, 200, encode_ledger(l)}, {true, 200, "<html>"}};
        S3Store s(test_config(), fake.sender());
        auto got = s.fetch();
        assert(got && *got == l);
        bool threw = false;
        try { s.fetch(); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        printf("  [PASS] fetch decodes\n");
    }

    // Bucket is created once, already-owned is fine
    {
        FakeS3 fake;
        fake.replies = {{true, 409, "<Error><Code>BucketAlreadyOwnedByYou</Code></Error>"},
                        {true, 200, ""},
                        {true, 200, ""}};
        S3Store s(test_config(), fake.sender());
        Ledger l = Ledger::fresh(5);
        std::string err;
        assert(s.store(l, err));
        assert(s.store(l, err));
        assert(fake.seen.size() == 3);
        assert(fake.seen[0].method == "PUT" && fake.seen[0].path == "/bucket-test1234");
        assert(fake.seen[0].body.empty());
        assert(fake.seen[1].method == "PUT" && fake.seen[1].path == "/bucket-test1234/data.json");
        Ledger back;
        assert(decode_ledger(fake.seen[1].body, back, err));
        assert(back == l);
        assert(fake.seen[2].path == "/bucket-test1234/data.json");
        printf("  [PASS] store creates bucket once\n");
    }

    // Regions outside us-east-1 send a location constraint
    {
        FakeS3 fake;
        fake.replies = {{true, 200, ""}, {true, 200, ""}};
        RemoteConfig c = test_config();
        c.region = "eu-west-1";
        S3Store s(c, fake.sender());
        std::string err;
        assert(s.store(Ledger::fresh(5), err));
        assert(fake.seen[0].host == "s3.eu-west-1.amazonaws.com");
        assert(fake.seen[0].body.find("<LocationConstraint>eu-west-1</LocationConstraint>") != std::string::npos);
        printf("  [PASS] location constraint\n");
    }

    // Failures
    {
        FakeS3 fake;
        fake.replies = {{true, 409, "<Error><Code>BucketAlreadyExists</Code></Error>"}};
        S3Store s(test_config(), fake.sender());
        std::string err;
        assert(!s.store(Ledger::fresh(5), err));
        assert(err.find("HTTP 409") != std::string::npos);

        FakeS3 fake2;
        fake2.replies = {{true, 200, ""}, {true, 403, "AccessDenied"}};
        S3Store s2(test_config(), fake2.sender());
        err.clear();
        assert(!s2.store(Ledger::fresh(5), err));
        assert(err.find("HTTP 403") != std::string::npos);

        FakeS3 fake3;
        fake3.replies = {{true, 200, ""}, {false, 0, ""}};
        S3Store s3(test_config(), fake3.sender());
        err.clear();
        assert(!s3.store(Ledger::fresh(5), err));
        assert(err.find("connection refused") != std::string::npos);
        printf("  [PASS] store failures reported\n");
    }

    printf("All S3 store tests passed.\n");
    return 0;
}
