#include "json.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
namespace bme {
static void skip(const std::string& s, size_t& i){ while(i<s.size() && isspace((unsigned char)s[i])) ++i; }
static void put_utf8(std::ostringstream& o, unsigned cp){
    if(cp<0x80){ o<<(char)cp; }
    else if(cp<0x800){ o<<(char)(0xC0|(cp>>6)); o<<(char)(0x80|(cp&0x3F)); }
    else if(cp<0x10000){ o<<(char)(0xE0|(cp>>12)); o<<(char)(0x80|((cp>>6)&0x3F)); o<<(char)(0x80|(cp&0x3F)); }
    else { o<<(char)(0xF0|(cp>>18)); o<<(char)(0x80|((cp>>12)&0x3F)); o<<(char)(0x80|((cp>>6)&0x3F)); o<<(char)(0x80|(cp&0x3F)); }
}
// Four hex digits starting at s[at].
static bool parse_hex4(const std::string& s, size_t at, unsigned& out){
    if(at+4>s.size()) return false;
    out=0;
    for(size_t k=at;k<at+4;++k){
        char c=s[k];
        if(!isxdigit((unsigned char)c)) return false;
        out = out*16 + (unsigned)(isdigit((unsigned char)c) ? c-'0' : (tolower((unsigned char)c)-'a'+10));
    }
    return true;
}
static bool parse_string(const std::string& s, size_t& i, std::string& out){
    if(i>=s.size() || s[i]!='"') return false; ++i; std::ostringstream o;
    while(i<s.size() && s[i]!='"'){
        if(s[i]=='\\'){
            ++i; if(i>=s.size()) return false; char c=s[i];
            if(c=='"'||c=='\\'||c=='/') o<<c;
            else if(c=='b') o<<'\b'; else if(c=='f') o<<'\f'; else if(c=='n') o<<'\n';
            else if(c=='r') o<<'\r'; else if(c=='t') o<<'\t';
            else if(c=='u'){
                unsigned cp=0;
                if(!parse_hex4(s, i+1, cp)) return false;
                i+=4;
                if(cp>=0xDC00 && cp<=0xDFFF) return false;          // lone low surrogate
                if(cp>=0xD800 && cp<=0xDBFF){
                    unsigned lo=0;
                    if(i+2>=s.size() || s[i+1]!='\\' || s[i+2]!='u') return false;
                    if(!parse_hex4(s, i+3, lo) || lo<0xDC00 || lo>0xDFFF) return false;
                    cp = 0x10000 + ((cp-0xD800)<<10) + (lo-0xDC00);
                    i+=6;
                }
                put_utf8(o, cp);
            }
            else return false;
        } else o<<s[i];
        ++i;
    }
    if(i>=s.size()||s[i]!='"') return false; ++i; out=o.str(); return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out);
static bool parse_array(const std::string& s, size_t& i, JNode& out){
    if(s[i]!='[') return false; ++i; skip(s,i); JArray arr; if(i<s.size() && s[i]==']'){ ++i; out.v=arr; return true; }
    while(true){ JNode val; if(!parse_value(s,i,val)) return false; arr.push_back(val); skip(s,i); if(i>=s.size()) return false; if(s[i]==','){ ++i; skip(s,i); continue; } if(s[i]==']'){ ++i; out.v=arr; return true; } return false; }
}
static bool parse_object(const std::string& s, size_t& i, JNode& out){
    if(s[i]!='{') return false; ++i; skip(s,i); JObject obj; if(i<s.size() && s[i]=='}'){ ++i; out.v=obj; return true; }
    while(true){ std::string k; if(!parse_string(s,i,k)) return false; skip(s,i); if(i>=s.size() || s[i]!=':') return false; ++i; skip(s,i); JNode val; if(!parse_value(s,i,val)) return false; obj[k]=val; skip(s,i); if(i>=s.size()) return false; if(s[i]==','){ ++i; skip(s,i); continue; } if(s[i]=='}'){ ++i; out.v=obj; return true; } return false; }
}
static bool parse_number(const std::string& s, size_t& i, double& out){
    size_t j=i;
    if(i<s.size() && s[i]=='-') ++i;
    size_t digits=i; while(i<s.size() && isdigit((unsigned char)s[i])) ++i;
    if(i==digits) return false;
    if(i<s.size() && s[i]=='.'){ ++i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; }
    if(i<s.size() && (s[i]=='e'||s[i]=='E')){
        ++i; if(i<s.size() && (s[i]=='+'||s[i]=='-')) ++i;
        size_t e=i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i;
        if(i==e) return false;
    }
    out = std::strtod(s.substr(j, i-j).c_str(), nullptr); return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out){
    skip(s,i); if(i>=s.size()) return false;
    if(s[i]=='"'){ std::string str; if(!parse_string(s,i,str)) return false; out.v=str; return true; }
    if(s[i]=='{') return parse_object(s,i,out);
    if(s[i]=='[') return parse_array(s,i,out);
    if(s.compare(i,4,"true")==0){ i+=4; out.v=true; return true; }
    if(s.compare(i,5,"false")==0){ i+=5; out.v=false; return true; }
    if(s.compare(i,4,"null")==0){ i+=4; out.v=JNull{}; return true; }
    double num; if(parse_number(s,i,num)){ out.v=num; return true; }
    return false;
}
bool json_parse(const std::string& s, JNode& out){ size_t i=0; bool ok=parse_value(s,i,out); if(!ok) return false; skip(s,i); return i==s.size(); }

static void dump_string(const std::string& s, std::ostringstream& o){
    o<<'"';
    for(char c : s){
        switch(c){
            case '\\': o<<"\\\\"; break;
            case '"':  o<<"\\\""; break;
            case '\n': o<<"\\n"; break;
            case '\r': o<<"\\r"; break;
            case '\t': o<<"\\t"; break;
            default:
                if((unsigned char)c < 0x20){ char b[8]; std::snprintf(b, sizeof(b), "\\u%04x", (unsigned)(unsigned char)c); o<<b; }
                else o<<c;
        }
    }
    o<<'"';
}
static void dump_number(double d, std::ostringstream& o){
    if(!std::isfinite(d)){ o<<"null"; return; }
    char b[40];
    if(d==std::floor(d) && std::fabs(d) < 9007199254740992.0) std::snprintf(b, sizeof(b), "%.0f", d);
    else std::snprintf(b, sizeof(b), "%.17g", d);
    o<<b;
}
static void dump(const JNode& n, std::ostringstream& o){
    if(std::holds_alternative<JNull>(n.v)) o<<"null";
    else if(std::holds_alternative<bool>(n.v)) o<<(std::get<bool>(n.v)?"true":"false");
    else if(std::holds_alternative<double>(n.v)) dump_number(std::get<double>(n.v), o);
    else if(std::holds_alternative<std::string>(n.v)) dump_string(std::get<std::string>(n.v), o);
    else if(std::holds_alternative<JArray>(n.v)){ o<<'['; const auto& a=std::get<JArray>(n.v); for(size_t i=0;i<a.size();++i){ if(i) o<<','; dump(a[i],o);} o<<']'; }
    else { o<<'{'; const auto& m=std::get<JObject>(n.v); size_t i=0; for(auto& kv: m){ if(i++) o<<','; dump_string(kv.first,o); o<<':'; dump(kv.second,o);} o<<'}'; }
}
std::string json_dump(const JNode& n){ std::ostringstream o; dump(n,o); return o.str(); }

JNode jnull(){ JNode n; n.v = JNull{}; return n; }
JNode jbool(bool v){ JNode n; n.v = v; return n; }
JNode jnum(double v){ JNode n; n.v = v; return n; }
JNode jstr(const std::string& s){ JNode n; n.v = s; return n; }

const JNode* json_member(const JObject& o, const std::string& key){
    auto it = o.find(key);
    return it==o.end() ? nullptr : &it->second;
}
bool json_get_number(const JObject& o, const std::string& key, double& out){
    const JNode* n = json_member(o, key);
    if(!n || !std::holds_alternative<double>(n->v)) return false;
    out = std::get<double>(n->v); return true;
}
bool json_get_string(const JObject& o, const std::string& key, std::string& out){
    const JNode* n = json_member(o, key);
    if(!n || !std::holds_alternative<std::string>(n->v)) return false;
    out = std::get<std::string>(n->v); return true;
}
}
