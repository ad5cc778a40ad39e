#include "category.h"
#include "log.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace bme {

std::string fold_category(const std::string& s){
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return out;
}

std::vector<std::string> synonym_group(const Ledger& ledger, const std::string& category){
    const std::string start = fold_category(category);
    std::vector<std::string> order{start};
    std::set<std::string> seen{start};

    // breadth-first; std::set iteration keeps each hop lexicographic
    std::vector<std::string> frontier{start};
    while(!frontier.empty()){
        std::set<std::string> next;
        for(const auto& k : frontier){
            auto it = ledger.synonyms.find(k);
            if(it == ledger.synonyms.end()) continue;
            for(const auto& s : it->second){
                if(!seen.count(s)) next.insert(s);
            }
        }
        frontier.assign(next.begin(), next.end());
        for(const auto& s : frontier){
            seen.insert(s);
            order.push_back(s);
        }
    }
    return order;
}

static const std::string* factor_holder(const Ledger& ledger, const std::vector<std::string>& group){
    for(const auto& k : group){
        if(ledger.cringe_factors.count(k)) return &k;
    }
    return nullptr;
}

double effective_multiplier(const Ledger& ledger, const std::string& category){
    const auto group = synonym_group(ledger, category);
    const std::string* holder = factor_holder(ledger, group);
    if(!holder) return 1.0;
    return ledger.cringe_factors.at(*holder);
}

void set_cringe(Ledger& ledger, const std::string& keyword, double factor){
    const auto group = synonym_group(ledger, keyword);
    const std::string* holder = factor_holder(ledger, group);
    const std::string key = holder ? *holder : group.front();
    ledger.cringe_factors[key] = factor;
    if(key != group.front()){
        BME_LOG_DEBUG(LogCategory::LEDGER, "cringe factor for '" + group.front() + "' stored on synonym '" + key + "'");
    }
}

bool set_synonym(Ledger& ledger, const std::string& a, const std::string& b){
    const std::string fa = fold_category(a);
    const std::string fb = fold_category(b);
    if(fa == fb) return false;
    ledger.synonyms[fa].insert(fb);
    ledger.synonyms[fb].insert(fa);
    return true;
}

}
