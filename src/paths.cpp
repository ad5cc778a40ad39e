#include "paths.h"
#include "constants.h"
#include <cstdlib>
#include <string>

namespace bme {

static std::string getenv_str(const char* k) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : std::string();
}

std::string join_path(const std::string& a, const std::string& b){
#ifdef _WIN32
    const char sep='\\';
#else
    const char sep='/';
#endif
    if(a.empty()) return b;
    if(a.back()=='/' || a.back()==sep) return a+b;
    return a + sep + b;
}

static std::string home_dir(){
#ifdef _WIN32
    std::string up = getenv_str("USERPROFILE");
    return up.empty() ? std::string(".") : up;
#else
    std::string h = getenv_str("HOME");
    return h.empty() ? std::string(".") : h;
#endif
}

std::string expand_home(const std::string& path){
    if(path.empty() || path[0] != '~') return path;
    if(path.size() == 1) return home_dir();
    if(path[1] == '/' || path[1] == '\\') return join_path(home_dir(), path.substr(2));
    return path;  // ~user is not supported
}

std::string config_dir(){
#ifdef _WIN32
    std::string a = getenv_str("APPDATA");
    if(!a.empty()) return join_path(a, APP_NAME);
    return join_path(join_path(join_path(home_dir(), "AppData"), "Roaming"), APP_NAME);
#elif __APPLE__
    return join_path(join_path(home_dir(), "Library/Application Support"), APP_NAME);
#else
    std::string xdg = getenv_str("XDG_CONFIG_HOME");
    if(!xdg.empty()) return join_path(xdg, APP_NAME);
    return join_path(join_path(home_dir(), ".config"), APP_NAME);
#endif
}

}
