#include "util.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#ifndef _WIN32
#include <sys/stat.h>
#include <unistd.h>  // for fsync
#endif

namespace fs = std::filesystem;

namespace bme {

std::string hex(const uint8_t* p, size_t n) {
    std::ostringstream o;
    o << std::hex << std::setfill('0');
    for (size_t i = 0; i < n; ++i) o << std::setw(2) << (int)p[i];
    return o.str();
}

std::string hex(const std::vector<uint8_t>& v) {
    return hex(v.data(), v.size());
}

std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool read_file_all(const std::string& path, std::string& out){
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return false;
    std::string buf;
    char tmp[4096];
    while (true) {
        size_t n = std::fread(tmp, 1, sizeof(tmp), f);
        if (n) buf.append(tmp, n);
        if (n < sizeof(tmp)) break;
    }
    bool ok = !std::ferror(f);
    std::fclose(f);
    if (ok) out.swap(buf);
    return ok;
}

// Unique temporary filename to avoid collisions between invocations
static std::string generate_tmp_filename(const std::string& base_path) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 9999);
    return base_path + ".tmp." + std::to_string(now) + "." + std::to_string(dis(gen));
}

bool atomic_write_file(const std::string& path, const std::string& contents, std::string& err, bool owner_only){
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            err = "failed to create directory: " + ec.message();
            return false;
        }
    }

    std::string tmp = generate_tmp_filename(path);
    FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) {
        err = "failed to create temporary file " + tmp;
        return false;
    }
#ifndef _WIN32
    // Restrict before any content lands on disk
    if (owner_only && fchmod(fileno(f), S_IRUSR | S_IWUSR) != 0) {
        std::fclose(f);
        std::remove(tmp.c_str());
        err = "failed to restrict permissions on " + tmp;
        return false;
    }
#endif

    bool write_ok = true;
    if (!contents.empty()) {
        write_ok = std::fwrite(contents.data(), 1, contents.size(), f) == contents.size();
    }
    if (write_ok) write_ok = (std::fflush(f) == 0);
#ifndef _WIN32
    if (write_ok) {
        int fd = fileno(f);
        if (fd >= 0 && fsync(fd) != 0) write_ok = false;
    }
#endif
    if (std::fclose(f) != 0) write_ok = false;

    if (!write_ok) {
        std::remove(tmp.c_str());
        err = "write to temporary file failed";
        return false;
    }

    // Keep the previous version for manual recovery
    if (fs::exists(path, ec)) {
        fs::copy_file(path, path + ".bak", fs::copy_options::overwrite_existing, ec);
        if (owner_only && !ec) {
            fs::permissions(path + ".bak", fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, ec);
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::remove(tmp.c_str());
        err = "atomic rename failed: " + ec.message();
        return false;
    }
    return true;
}

} // namespace bme
