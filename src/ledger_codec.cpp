#include "ledger_codec.h"
#include "category.h"
#include "json.h"

#include <cmath>

namespace bme {

static JNode encode_item(const HistoryItem& it){
    JObject o;
    o["amount"] = jnum(it.amount);
    o["reason"] = jstr(it.reason);
    o["specific"] = it.specific ? jstr(*it.specific) : jnull();
    o["time"] = jnum((double)it.time);
    JNode n; n.v = o; return n;
}

static JNode encode_items(const std::vector<HistoryItem>& items){
    JArray a;
    a.reserve(items.size());
    for(const auto& it : items) a.push_back(encode_item(it));
    JNode n; n.v = a; return n;
}

std::string encode_ledger(const Ledger& l){
    JObject root;
    root["version"] = jnum((double)l.version);
    root["history"] = encode_items(l.history);
    root["redo_stack"] = encode_items(l.redo_stack);
    root["balance"] = jnum(l.balance);
    root["debt"] = jnum(l.debt);
    root["rate"] = l.rate ? jnum(*l.rate) : jnull();
    root["last_updated"] = jnum((double)l.last_updated);

    JObject cringe;
    for(const auto& kv : l.cringe_factors) cringe[kv.first] = jnum(kv.second);
    JNode cn; cn.v = cringe;
    root["cringe_factors"] = cn;

    JObject syn;
    for(const auto& kv : l.synonyms){
        JArray a;
        for(const auto& s : kv.second) a.push_back(jstr(s));
        JNode an; an.v = a;
        syn[kv.first] = an;
    }
    JNode sn; sn.v = syn;
    root["synonyms"] = sn;

    JNode n; n.v = root;
    return json_dump(n);
}

static bool is_integral(double d){ return std::isfinite(d) && d == std::floor(d); }

static bool decode_item(const JNode& n, HistoryItem& it, std::string& err){
    if(!std::holds_alternative<JObject>(n.v)){ err = "history item is not an object"; return false; }
    const auto& o = std::get<JObject>(n.v);
    double time = 0;
    if(!json_get_number(o, "amount", it.amount)){ err = "history item missing amount"; return false; }
    if(!json_get_string(o, "reason", it.reason)){ err = "history item missing reason"; return false; }
    if(!json_get_number(o, "time", time) || !is_integral(time)){ err = "history item has bad time"; return false; }
    it.time = (int64_t)time;
    it.specific.reset();
    if(const JNode* sp = json_member(o, "specific")){
        if(std::holds_alternative<std::string>(sp->v)) it.specific = std::get<std::string>(sp->v);
        else if(!std::holds_alternative<JNull>(sp->v)){ err = "history item has bad specific"; return false; }
    }
    return true;
}

static bool decode_items(const JObject& root, const char* key, std::vector<HistoryItem>& out, std::string& err){
    out.clear();
    const JNode* n = json_member(root, key);
    if(!n) return true;
    if(!std::holds_alternative<JArray>(n->v)){ err = std::string(key) + " is not an array"; return false; }
    for(const auto& e : std::get<JArray>(n->v)){
        HistoryItem it;
        if(!decode_item(e, it, err)){ err = std::string(key) + ": " + err; return false; }
        out.push_back(std::move(it));
    }
    return true;
}

bool decode_ledger(const std::string& text, Ledger& out, std::string& err){
    JNode doc;
    if(!json_parse(text, doc)){ err = "malformed ledger document"; return false; }
    if(!std::holds_alternative<JObject>(doc.v)){ err = "ledger document is not an object"; return false; }
    const auto& root = std::get<JObject>(doc.v);

    Ledger l;
    double version = DATA_VERSION;
    if(json_member(root, "version")){
        if(!json_get_number(root, "version", version) || !is_integral(version)){
            err = "ledger version is not an integer"; return false;
        }
    }
    if(version != (double)DATA_VERSION){
        err = "unsupported ledger version " + std::to_string((long long)version) +
              " (this build reads version " + std::to_string(DATA_VERSION) + ")";
        return false;
    }
    l.version = (uint32_t)version;

    if(!decode_items(root, "history", l.history, err)) return false;
    if(!decode_items(root, "redo_stack", l.redo_stack, err)) return false;
    if(!json_get_number(root, "balance", l.balance)){ err = "ledger missing balance"; return false; }
    l.debt = 0.0;
    if(json_member(root, "debt") && !json_get_number(root, "debt", l.debt)){ err = "ledger has bad debt"; return false; }

    l.rate.reset();
    if(const JNode* r = json_member(root, "rate")){
        if(std::holds_alternative<double>(r->v)) l.rate = std::get<double>(r->v);
        else if(!std::holds_alternative<JNull>(r->v)){ err = "ledger has bad rate"; return false; }
    }

    double last = 0;
    if(!json_get_number(root, "last_updated", last) || !is_integral(last)){
        err = "ledger missing last_updated"; return false;
    }
    l.last_updated = (int64_t)last;

    if(const JNode* c = json_member(root, "cringe_factors")){
        if(!std::holds_alternative<JObject>(c->v)){ err = "cringe_factors is not an object"; return false; }
        for(const auto& kv : std::get<JObject>(c->v)){
            if(!std::holds_alternative<double>(kv.second.v)){ err = "cringe factor '" + kv.first + "' is not a number"; return false; }
            l.cringe_factors[fold_category(kv.first)] = std::get<double>(kv.second.v);
        }
    }

    if(const JNode* s = json_member(root, "synonyms")){
        if(!std::holds_alternative<JObject>(s->v)){ err = "synonyms is not an object"; return false; }
        for(const auto& kv : std::get<JObject>(s->v)){
            if(!std::holds_alternative<JArray>(kv.second.v)){ err = "synonyms of '" + kv.first + "' is not an array"; return false; }
            auto& set = l.synonyms[fold_category(kv.first)];
            for(const auto& e : std::get<JArray>(kv.second.v)){
                if(!std::holds_alternative<std::string>(e.v)){ err = "synonym entry is not a string"; return false; }
                set.insert(fold_category(std::get<std::string>(e.v)));
            }
        }
    }

    out = std::move(l);
    return true;
}

}
