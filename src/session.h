#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "config.h"
#include "ledger.h"
#include "storage/ledger_store.h"

namespace bme {

enum class CommandKind { Balance, List, Spend, Undo, Redo, Garnish, Set, Get };

struct Command {
    CommandKind              kind{CommandKind::Balance};
    std::vector<std::string> args;    // positional arguments after the verb
    bool                     loan{false};
};

// Parses the words after the global options. An empty list is Balance.
bool parse_command(const std::vector<std::string>& words, Command& out, std::string& err);

// Exit codes of one invocation.
constexpr int EXIT_OK      = 0;
constexpr int EXIT_FATAL   = 1;
constexpr int EXIT_REFUSED = 2;   // reconciliation refused the write

using StoreFactory = std::function<std::unique_ptr<LedgerStore>(const Config&)>;

// Persists the (possibly changed) configuration; false with `err` on failure.
using ConfigSaver = std::function<bool(const Config&, std::string&)>;

// One load -> accrue -> command -> verify -> store cycle.
class Session {
public:
    // `save`, when set, runs after the command and before the ledger is
    // verified and written, so a failed write never loses a config change.
    Session(Config& cfg, StoreFactory factory, std::ostream& out, std::ostream& err,
            ConfigSaver save = ConfigSaver());

    // Runs `cmd` at wall time `now`. User-level refusals (over budget, key
    // not valid for the provider) log a warning, skip the write and return
    // EXIT_OK. Undo/redo on an empty stack, config save failures and storage
    // failures throw std::runtime_error.
    int run(const Command& cmd, int64_t now);

    const Ledger& ledger() const { return ledger_; }
    bool config_changed() const { return config_changed_; }

private:
    void load(int64_t now);
    bool execute(const Command& cmd, int64_t now);
    void save_config_now();
    int  commit(int64_t now);

    void print_balance();
    void print_list(int64_t now);
    void warn(const std::string& msg);

    Config&                      cfg_;
    StoreFactory                 factory_;
    ConfigSaver                  save_;
    std::ostream&                out_;
    std::ostream&                err_;
    std::unique_ptr<LedgerStore> store_;
    Ledger                       ledger_;
    bool                         config_changed_{false};
};

}
