#include "http_client.h"
#include "../log.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#ifdef _WIN32
  #ifndef NOMINMAX
  #define NOMINMAX 1
  #endif
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "Ws2_32.lib")
  using socklen_t = int;
  using sock_t = SOCKET;
  static bool wsa_inited = false;
  static void wsa_ensure(){ if(!wsa_inited){ WSADATA w; WSAStartup(MAKEWORD(2,2), &w); wsa_inited=true; } }
  static const sock_t BAD_SOCK = INVALID_SOCKET;
#else
  #include <sys/types.h>
  #include <sys/socket.h>
  #include <sys/time.h>
  #include <netdb.h>
  #include <unistd.h>
  #include <arpa/inet.h>
  using sock_t = int;
  #define closesocket ::close
  static const sock_t BAD_SOCK = -1;
#endif

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace bme {

static bool set_timeout(sock_t fd, int ms){
#ifdef _WIN32
    DWORD tv = (DWORD)ms;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv))==0
        && setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, (const char*)&tv, sizeof(tv))==0;
#else
    timeval tv; tv.tv_sec = ms/1000; tv.tv_usec = (ms%1000)*1000;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv))==0
        && setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv))==0;
#endif
}

static sock_t connect_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& err){
#ifdef _WIN32
    wsa_ensure();
#endif
    addrinfo hints{}; hints.ai_family=AF_UNSPEC; hints.ai_socktype=SOCK_STREAM;
    char portbuf[16]; std::snprintf(portbuf, sizeof(portbuf), "%u", (unsigned)port);
    addrinfo* res=nullptr;
    int rc = getaddrinfo(host.c_str(), portbuf, &hints, &res);
    if(rc!=0){ err = "cannot resolve " + host + ": " + gai_strerror(rc); return BAD_SOCK; }

    sock_t fd = BAD_SOCK;
    for(addrinfo* ai=res; ai; ai=ai->ai_next){
        fd = (sock_t)socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if(fd==BAD_SOCK) continue;
        if(!set_timeout(fd, timeout_ms)){ closesocket(fd); fd = BAD_SOCK; continue; }
        if(connect(fd, ai->ai_addr, (socklen_t)ai->ai_addrlen)==0) break;
        closesocket(fd);
        fd = BAD_SOCK;
    }
    freeaddrinfo(res);
    if(fd==BAD_SOCK) err = "cannot connect to " + host + ":" + portbuf;
    return fd;
}

static std::string ssl_error_string(){
    unsigned long e = ERR_get_error();
    if(e==0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

// Transport over a connected socket, optionally wrapped in TLS.
class Conn {
public:
    explicit Conn(sock_t fd) : fd_(fd) {}
    ~Conn(){
        if(ssl_){ SSL_shutdown(ssl_); SSL_free(ssl_); }
        if(ctx_) SSL_CTX_free(ctx_);
        if(fd_!=BAD_SOCK) closesocket(fd_);
    }
    Conn(const Conn&) = delete;
    Conn& operator=(const Conn&) = delete;

    bool start_tls(const std::string& host, std::string& err){
        ctx_ = SSL_CTX_new(TLS_client_method());
        if(!ctx_){ err = "SSL_CTX_new: " + ssl_error_string(); return false; }
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        if(SSL_CTX_set_default_verify_paths(ctx_)!=1){ err = "no CA store: " + ssl_error_string(); return false; }

        ssl_ = SSL_new(ctx_);
        if(!ssl_){ err = "SSL_new: " + ssl_error_string(); return false; }
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        if(SSL_set1_host(ssl_, host.c_str())!=1){ err = "SSL_set1_host: " + ssl_error_string(); return false; }
        SSL_set_fd(ssl_, (int)fd_);
        if(SSL_connect(ssl_)!=1){ err = "TLS handshake with " + host + " failed: " + ssl_error_string(); return false; }
        return true;
    }

    bool write_all(const std::string& data){
        const char* p = data.data(); size_t left = data.size();
        while(left){
            int n;
            if(ssl_){
                n = SSL_write(ssl_, p, (int)std::min<size_t>(left, 1 << 20));
            } else {
#ifdef _WIN32
                n = send(fd_, p, (int)left, 0);
#else
                n = (int)::send(fd_, p, left, 0);
#endif
            }
            if(n<=0) return false;
            p += n; left -= (size_t)n;
        }
        return true;
    }

    // Reads until the peer closes.
    bool read_all(std::string& out){
        char tmp[4096];
        for(;;){
            int n;
            if(ssl_){
                n = SSL_read(ssl_, tmp, (int)sizeof(tmp));
                if(n<=0){
                    int e = SSL_get_error(ssl_, n);
                    // Many servers close without close_notify once the body is sent
                    return e==SSL_ERROR_ZERO_RETURN || e==SSL_ERROR_SYSCALL || !out.empty();
                }
            } else {
#ifdef _WIN32
                n = recv(fd_, tmp, (int)sizeof(tmp), 0);
#else
                n = (int)::recv(fd_, tmp, sizeof(tmp), 0);
#endif
                if(n<0) return !out.empty();
                if(n==0) return true;
            }
            out.append(tmp, tmp+n);
        }
    }

private:
    sock_t   fd_;
    SSL_CTX* ctx_{nullptr};
    SSL*     ssl_{nullptr};
};

static bool decode_chunked(const std::string& in, std::string& out){
    size_t pos = 0;
    out.clear();
    for(;;){
        size_t nl = in.find("\r\n", pos);
        if(nl==std::string::npos) return false;
        unsigned long len = std::strtoul(in.substr(pos, nl-pos).c_str(), nullptr, 16);
        pos = nl + 2;
        if(len==0) return true;
        if(pos + len > in.size()) return false;
        out.append(in, pos, len);
        pos += len + 2;
    }
}

bool http_parse_response(const std::string& buf, HttpResponse& out){
    size_t pos = buf.find("\r\n");
    if(pos==std::string::npos) return false;
    std::string status = buf.substr(0,pos);
    if(status.rfind("HTTP/",0)!=0) return false;
    int code = 0; {
        size_t sp = status.find(' ');
        if(sp!=std::string::npos) code = std::atoi(status.c_str()+sp+1);
    }
    size_t hdr_end = buf.find("\r\n\r\n");
    if(hdr_end==std::string::npos) return false;
    std::map<std::string,std::string> hdrs;
    size_t cur = pos+2;
    while(cur < hdr_end){
        size_t nl = buf.find("\r\n", cur);
        if(nl==std::string::npos || nl>hdr_end) nl = hdr_end;
        std::string line = buf.substr(cur, nl-cur);
        cur = nl+2;
        size_t c = line.find(':');
        if(c!=std::string::npos){
            std::string k = line.substr(0,c);
            std::string v = line.substr(c+1);
            while(!v.empty() && (v.front()==' '||v.front()=='\t')) v.erase(v.begin());
            while(!v.empty() && (v.back()==' '||v.back()=='\t')) v.pop_back();
            std::transform(k.begin(), k.end(), k.begin(), [](unsigned char x){return (char)std::tolower(x);});
            hdrs[k] = v;
        }
    }
    std::string body = buf.substr(hdr_end+4);
    auto te = hdrs.find("transfer-encoding");
    if(te!=hdrs.end() && te->second.find("chunked")!=std::string::npos){
        std::string decoded;
        if(!decode_chunked(body, decoded)) return false;
        body.swap(decoded);
    } else {
        auto cl = hdrs.find("content-length");
        if(cl!=hdrs.end()){
            size_t n = (size_t)std::strtoull(cl->second.c_str(), nullptr, 10);
            if(body.size() > n) body.resize(n);
        }
    }

    out.code = code;
    out.body = std::move(body);
    out.headers = std::move(hdrs);
    return true;
}

std::string http_host_header(const HttpRequest& req){
    const bool default_port = (req.tls && req.port==443) || (!req.tls && req.port==80);
    return default_port ? req.host : req.host + ":" + std::to_string(req.port);
}

bool http_request(const HttpRequest& req, HttpResponse& out, std::string& err){
    sock_t fd = connect_tcp(req.host, req.port, req.timeout_ms, err);
    if(fd==BAD_SOCK) return false;
    Conn conn(fd);
    if(req.tls && !conn.start_tls(req.host, err)) return false;

    std::string wire;
    wire.reserve(256 + req.body.size());
    wire += req.method + " " + (req.path.empty()?std::string("/") : req.path) + " HTTP/1.1\r\n";
    wire += "Host: " + http_host_header(req) + "\r\n";
    wire += "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
    for(const auto& h: req.headers){
        wire += h.first; wire += ": "; wire += h.second; wire += "\r\n";
    }
    wire += "Connection: close\r\n\r\n";
    wire += req.body;

    if(!conn.write_all(wire)){ err = "send to " + req.host + " failed"; return false; }

    std::string buf; buf.reserve(4096);
    if(!conn.read_all(buf)){ err = "receive from " + req.host + " failed"; return false; }
    if(!http_parse_response(buf, out)){ err = "malformed HTTP response from " + req.host; return false; }

    BME_LOG_DEBUG(LogCategory::NET, req.method + " " + req.host + req.path + " -> " + std::to_string(out.code));
    return true;
}

}
