#include "session.h"
#include "accrual.h"
#include "format.h"
#include "history.h"
#include "log.h"
#include "reconcile.h"
#include "settings.h"
#include "util.h"

#include <stdexcept>

namespace bme {

bool parse_command(const std::vector<std::string>& words, Command& out, std::string& err){
    out = Command{};
    if (words.empty()) return true;

    const std::string verb = to_lower(words[0]);
    std::vector<std::string> rest;
    for (size_t i = 1; i < words.size(); ++i) {
        if (words[i] == "-o" || words[i] == "--loan") { out.loan = true; continue; }
        rest.push_back(words[i]);
    }
    out.args = rest;

    if (verb == "list" || verb == "ls")  out.kind = CommandKind::List;
    else if (verb == "spend")            out.kind = CommandKind::Spend;
    else if (verb == "undo")             out.kind = CommandKind::Undo;
    else if (verb == "redo")             out.kind = CommandKind::Redo;
    else if (verb == "garnish")          out.kind = CommandKind::Garnish;
    else if (verb == "set")              out.kind = CommandKind::Set;
    else if (verb == "get")              out.kind = CommandKind::Get;
    else if (verb == "balance")          out.kind = CommandKind::Balance;
    else { err = "unknown command '" + words[0] + "'"; return false; }

    if (out.loan && out.kind != CommandKind::Spend) {
        err = "--loan only applies to spend";
        return false;
    }
    switch (out.kind) {
        case CommandKind::Spend:
            if (rest.size() < 2 || rest.size() > 3) { err = "usage: spend <amount> <reason> [specific] [-o|--loan]"; return false; }
            break;
        case CommandKind::Set:
            if (rest.size() < 2) { err = "usage: set <key> <values...>"; return false; }
            break;
        case CommandKind::Get:
            if (rest.empty()) { err = "usage: get <key> [keyword]"; return false; }
            break;
        default:
            if (!rest.empty()) { err = "'" + verb + "' takes no arguments"; return false; }
            break;
    }
    return true;
}

Session::Session(Config& cfg, StoreFactory factory, std::ostream& out, std::ostream& err,
                 ConfigSaver save)
    : cfg_(cfg), factory_(std::move(factory)), save_(std::move(save)), out_(out), err_(err) {}

void Session::warn(const std::string& msg){
    log_warn(LogCategory::LEDGER, msg);
}

void Session::load(int64_t now){
    store_ = factory_(cfg_);
    auto fetched = store_->fetch();
    if (fetched) {
        ledger_ = std::move(*fetched);
        BME_LOG_DEBUG(LogCategory::LEDGER, "Loaded ledger from " + store_->describe());
    } else {
        ledger_ = Ledger::fresh(now);
        log_info(LogCategory::LEDGER, "No ledger at " + store_->describe() + ", starting fresh");
    }
    if (!ledger_.rate) ledger_.rate = DEFAULT_RATE;
    accrue(ledger_, now);
}

void Session::print_balance(){
    out_ << format_balance(ledger_) << "\n";
}

void Session::print_list(int64_t now){
    for (const auto& item : ledger_.history) out_ << format_history_line(item, now) << "\n";
    print_balance();
}

// Returns false when the command was refused and nothing should be written.
bool Session::execute(const Command& cmd, int64_t now){
    switch (cmd.kind) {
        case CommandKind::Balance:
            print_balance();
            return true;

        case CommandKind::List:
            print_list(now);
            return true;

        case CommandKind::Spend: {
            double amount = parse_number_arg(cmd.args[0], "amount");
            std::optional<std::string> specific;
            if (cmd.args.size() > 2) specific = cmd.args[2];
            HistoryItem item;
            SpendStatus st = spend(ledger_, amount, cmd.args[1], specific, cmd.loan, now, &item);
            if (st == SpendStatus::NonPositiveAmount) {
                warn("amount must be positive");
                return false;
            }
            if (st == SpendStatus::OverBudget) {
                warn("not enough money (use -o to take a loan)");
                print_balance();
                return false;
            }
            out_ << "Spent " << format_dollars(item.amount) << " on " << item.reason << "\n";
            print_balance();
            return true;
        }

        case CommandKind::Undo: {
            HistoryItem item = undo(ledger_);
            out_ << "Undid " << format_dollars(item.amount) << " " << item.reason << "\n";
            print_balance();
            return true;
        }

        case CommandKind::Redo: {
            HistoryItem item = redo(ledger_);
            out_ << "Redid " << format_dollars(item.amount) << " " << item.reason << "\n";
            print_balance();
            return true;
        }

        case CommandKind::Garnish: {
            const double before = ledger_.balance;
            if (!garnish(ledger_)) { warn("balance is not negative, nothing to garnish"); return false; }
            out_ << "Moved " << format_dollars(-before) << " into debt\n";
            print_balance();
            return true;
        }

        case CommandKind::Set: {
            CfgKey key;
            if (!parse_cfg_key(cmd.args[0], key)) { warn("unknown key '" + cmd.args[0] + "'"); return false; }
            std::vector<std::string> values(cmd.args.begin() + 1, cmd.args.end());
            std::string msg;
            SetStatus st = set_setting(cfg_, ledger_, key, values, msg);
            if (st != SetStatus::Ok) { warn(msg); return false; }
            if (!cfg_key_is_ledger(key)) config_changed_ = true;
            out_ << msg << "\n";
            return true;
        }

        case CommandKind::Get: {
            CfgKey key;
            if (!parse_cfg_key(cmd.args[0], key)) { warn("unknown key '" + cmd.args[0] + "'"); return false; }
            std::vector<std::string> extra(cmd.args.begin() + 1, cmd.args.end());
            std::string value;
            if (!get_setting(cfg_, ledger_, key, extra, value)) { warn(value); return false; }
            if (!value.empty()) out_ << value << "\n";
            return true;
        }
    }
    return false;
}

int Session::commit(int64_t now){
    // The target may have moved with `set provider` or `set path`.
    if (config_changed_) store_ = factory_(cfg_);

    auto remote = store_->fetch();
    Ledger theirs = remote ? std::move(*remote) : Ledger::fresh(now);
    VerifyResult vr = verify(ledger_, theirs, now);
    if (!vr.ok()) {
        log_error(LogCategory::LEDGER, std::string("Verification failed (") + verify_status_str(vr.status) + "): " + vr.message);
        err_ << ui::red() << "Refusing to overwrite unrelated histories" << ui::reset() << ": " << vr.message << "\n";
        return EXIT_REFUSED;
    }
    BME_LOG_DEBUG(LogCategory::LEDGER, std::string("Verified against stored ledger: ") + verify_status_str(vr.status));

    std::string err;
    if (!store_->store(ledger_, err))
        throw std::runtime_error("failed to write ledger to " + store_->describe() + ": " + err);
    BME_LOG_DEBUG(LogCategory::STORAGE, "Wrote ledger to " + store_->describe());
    return EXIT_OK;
}

void Session::save_config_now(){
    if (!save_) return;
    std::string err;
    if (!save_(cfg_, err)) throw std::runtime_error("failed to write config: " + err);
}

int Session::run(const Command& cmd, int64_t now){
    load(now);
    const bool accepted = execute(cmd, now);
    // Every run, so generated values (bucket name) stick even if the
    // ledger write below fails or is refused.
    save_config_now();
    if (!accepted) return EXIT_OK;
    return commit(now);
}

}
