#pragma once
#include <string>
#include <vector>
#include "ledger.h"

namespace bme {

// Category keywords are stored and compared lower-cased.
std::string fold_category(const std::string& s);

// The synonym group of `category`: the category itself first, then every
// keyword reachable through the synonym graph, ordered by hop distance and
// lexicographically within a hop.
std::vector<std::string> synonym_group(const Ledger& ledger, const std::string& category);

// First stored cringe factor in synonym_group() order, or 1.0.
double effective_multiplier(const Ledger& ledger, const std::string& category);

// Stores `factor` for the group. If a member of the group already carries a
// factor, the one effective_multiplier() would pick is overwritten; otherwise
// the factor is stored under `keyword`.
void set_cringe(Ledger& ledger, const std::string& keyword, double factor);

// Links a and b in both directions. Returns false (no change) for a == b.
bool set_synonym(Ledger& ledger, const std::string& a, const std::string& b);

}
