#pragma once
#include <string>
#include "ledger.h"

namespace bme {

// Serializes the full ledger document (timestamps as integer ms).
std::string encode_ledger(const Ledger& ledger);

// Parses a ledger document. Returns false with `err` set on malformed input
// or an unsupported `version`. A document without `version` is read as
// version 1; a missing `rate` stays unset.
bool decode_ledger(const std::string& text, Ledger& out, std::string& err);

}
