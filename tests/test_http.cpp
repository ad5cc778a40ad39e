// HTTP response parsing
#include "../src/storage/http_client.h"
#include <cassert>
#include <cstdio>
#include <string>

using namespace bme;

int main() {
    printf("Testing http...\n");

    {
        HttpResponse r;
        assert(http_parse_response("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\nhello world", r));
        assert(r.code == 200);
        assert(r.body == "hello");
        assert(r.headers["content-type"] == "text/plain");
        printf("  [PASS] content-length body\n");
    }

    {
        HttpResponse r;
        assert(http_parse_response("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n", r));
        assert(r.body == "Wikipedia");
        printf("  [PASS] chunked body\n");
    }

    {
        HttpResponse r;
        assert(http_parse_response("HTTP/1.1 404 Not Found\r\n\r\n<Error><Code>NoSuchKey</Code></Error>", r));
        assert(r.code == 404);
        assert(r.body.find("NoSuchKey") != std::string::npos);
        printf("  [PASS] error status\n");
    }

    {
        HttpResponse r;
        assert(!http_parse_response("", r));
        assert(!http_parse_response("garbage\r\n\r\n", r));
        assert(!http_parse_response("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n", r));
        printf("  [PASS] malformed responses rejected\n");
    }

    printf("All http tests passed.\n");
    return 0;
}
