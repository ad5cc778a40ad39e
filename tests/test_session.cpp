// Whole invocations against an in-memory store
#include "../src/config.h"
#include "../src/ledger.h"
#include "../src/log.h"
#include "../src/session.h"
#include "../src/storage/ledger_store.h"
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <ctime>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace bme;

static const int64_t BASE = 1710072000000LL;   // 2024-03-10 12:00 UTC
static const int64_t DAY = MS_PER_DAY;

struct Shelf {
    std::optional<Ledger> doc;
    int fetches = 0;
    int writes = 0;
    bool fail_store = false;
    std::function<void(int)> on_fetch;   // called with the fetch number
};

class MemoryStore : public LedgerStore {
public:
    explicit MemoryStore(std::shared_ptr<Shelf> shelf) : shelf_(std::move(shelf)) {}

    std::optional<Ledger> fetch() override {
        int n = ++shelf_->fetches;
        auto hook = shelf_->on_fetch;
        if (hook) hook(n);
        return shelf_->doc;
    }
    bool store(const Ledger& ledger, std::string& err) override {
        if (shelf_->fail_store) { err = "bucket unreachable"; return false; }
        shelf_->doc = ledger;
        ++shelf_->writes;
        return true;
    }
    std::string describe() const override { return "memory"; }

private:
    std::shared_ptr<Shelf> shelf_;
};

static StoreFactory factory_for(std::shared_ptr<Shelf> shelf){
    return [shelf](const Config&) -> std::unique_ptr<LedgerStore> { return std::make_unique<MemoryStore>(shelf); };
}

static Command cmd(std::vector<std::string> words){
    Command c;
    std::string err;
    bool ok = parse_command(words, c, err);
    assert(ok);
    return c;
}

static int run(std::shared_ptr<Shelf> shelf, Config& cfg, const Command& c, int64_t now, std::string* out = nullptr){
    std::ostringstream o, e;
    Session s(cfg, factory_for(shelf), o, e);
    int rc = s.run(c, now);
    if (out) *out = o.str() + e.str();
    return rc;
}

int main() {
    setenv("TZ", "UTC", 1);
    tzset();
    log_set_level(LogLevel::NONE);
    printf("Testing session...\n");

    // Command parsing
    {
        Command c;
        std::string err;
        assert(parse_command({}, c, err) && c.kind == CommandKind::Balance);
        assert(parse_command({"spend", "5", "food", "-o"}, c, err));
        assert(c.kind == CommandKind::Spend && c.loan && c.args.size() == 2);
        assert(parse_command({"spend", "5", "food", "pizza"}, c, err) && c.args[2] == "pizza");
        assert(!parse_command({"spend", "5"}, c, err));
        assert(!parse_command({"undo", "-o"}, c, err));
        assert(!parse_command({"list", "extra"}, c, err));
        assert(!parse_command({"fly"}, c, err));
        assert(parse_command({"set", "cringe", "coffee", "2"}, c, err) && c.args.size() == 3);
        assert(!parse_command({"get"}, c, err));
        printf("  [PASS] command parsing\n");
    }

    // First run creates a fresh ledger
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        std::string out;
        assert(run(shelf, cfg, cmd({}), BASE, &out) == EXIT_OK);
        assert(out == "$10.00\n");
        assert(shelf->doc && shelf->doc->balance == 10.0);
        assert(shelf->doc->rate && *shelf->doc->rate == DEFAULT_RATE);
        printf("  [PASS] fresh ledger\n");
    }

    // Three days, spend, undo
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        assert(run(shelf, cfg, cmd({}), BASE) == EXIT_OK);
        std::string out;
        assert(run(shelf, cfg, cmd({"spend", "5", "food"}), BASE + 3 * DAY, &out) == EXIT_OK);
        assert(out == "Spent $5.00 on food\n$20.00\n");
        assert(amounts_equal(shelf->doc->balance, 20.0));
        assert(shelf->doc->history.size() == 1);

        assert(run(shelf, cfg, cmd({"undo"}), BASE + 3 * DAY) == EXIT_OK);
        assert(amounts_equal(shelf->doc->balance, 25.0));
        assert(shelf->doc->history.empty());
        assert(shelf->doc->redo_stack.size() == 1);

        assert(run(shelf, cfg, cmd({"redo"}), BASE + 3 * DAY) == EXIT_OK);
        assert(amounts_equal(shelf->doc->balance, 20.0));
        assert(shelf->doc->history.size() == 1);
        printf("  [PASS] spend, undo, redo persisted\n");
    }

    // Refusals skip the write
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        assert(run(shelf, cfg, cmd({}), BASE) == EXIT_OK);
        const int writes = shelf->writes;
        assert(run(shelf, cfg, cmd({"spend", "50", "tv"}), BASE) == EXIT_OK);
        assert(run(shelf, cfg, cmd({"spend", "-1", "tv"}), BASE) == EXIT_OK);
        assert(run(shelf, cfg, cmd({"garnish"}), BASE) == EXIT_OK);
        assert(run(shelf, cfg, cmd({"set", "access_key", "AK"}), BASE) == EXIT_OK);
        assert(shelf->writes == writes);
        assert(shelf->doc->history.empty());

        assert(run(shelf, cfg, cmd({"spend", "50", "tv", "--loan"}), BASE) == EXIT_OK);
        assert(amounts_equal(shelf->doc->balance, -40.0));
        assert(run(shelf, cfg, cmd({"garnish"}), BASE) == EXIT_OK);
        assert(shelf->doc->balance == 0.0);
        assert(amounts_equal(shelf->doc->debt, 40.0));
        printf("  [PASS] refused operations are not written\n");
    }

    // Fatal errors
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        bool threw = false;
        try { run(shelf, cfg, cmd({"undo"}), BASE); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        threw = false;
        try { run(shelf, cfg, cmd({"spend", "lots", "x"}), BASE); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        assert(shelf->writes == 0);

        shelf->doc = Ledger::fresh(BASE + DAY);
        threw = false;
        try { run(shelf, cfg, cmd({}), BASE); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        printf("  [PASS] fatal errors throw without writing\n");
    }

    // Two overlapping invocations: the second writer is refused
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        assert(run(shelf, cfg, cmd({"spend", "1", "a"}), BASE) == EXIT_OK);

        // "c" completes while "b" sits between its load (fetch 3) and its
        // commit (fetch 4).
        shelf->on_fetch = [&](int n) {
            if (n != 4) return;
            shelf->on_fetch = nullptr;
            Config other;
            assert(run(shelf, other, cmd({"spend", "1", "c"}), BASE + 2) == EXIT_OK);
        };
        std::string out;
        assert(run(shelf, cfg, cmd({"spend", "1", "b"}), BASE + 1, &out) == EXIT_REFUSED);
        assert(out.find("Refusing to overwrite unrelated histories") != std::string::npos);
        assert(shelf->doc->history.size() == 2);
        assert(shelf->doc->history[1].reason == "c");
        printf("  [PASS] overlapping writers\n");
    }

    // Ledger settings persist, config settings change the target
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        assert(run(shelf, cfg, cmd({"set", "rate", "7"}), BASE) == EXIT_OK);
        assert(*shelf->doc->rate == 7.0);
        assert(run(shelf, cfg, cmd({"set", "synonym", "coffee", "latte"}), BASE) == EXIT_OK);
        assert(run(shelf, cfg, cmd({"set", "cringe", "latte", "2"}), BASE) == EXIT_OK);
        assert(shelf->doc->cringe_factors.at("latte") == 2.0);
        assert(run(shelf, cfg, cmd({"spend", "1", "Coffee"}), BASE) == EXIT_OK);
        assert(amounts_equal(shelf->doc->balance, 8.0));

        std::string out;
        assert(run(shelf, cfg, cmd({"get", "rate"}), BASE, &out) == EXIT_OK);
        assert(out == "$7.00\n");

        std::vector<std::string> providers;
        auto counting = [&](const Config& c) -> std::unique_ptr<LedgerStore> {
            providers.push_back(provider_name(c.storage));
            return std::make_unique<MemoryStore>(shelf);
        };
        std::ostringstream o, e;
        Session s(cfg, counting, o, e);
        assert(s.run(cmd({"set", "provider", "aws"}), BASE) == EXIT_OK);
        assert(s.config_changed());
        assert(std::holds_alternative<RemoteConfig>(cfg.storage));
        assert(providers.size() == 2 && providers[0] == "local" && providers[1] == "aws");
        printf("  [PASS] settings\n");
    }

    // Config changes are saved even when the ledger write fails
    {
        auto shelf = std::make_shared<Shelf>();
        shelf->fail_store = true;
        fs::path conf = fs::temp_directory_path() / ("budgetme_session_" + std::to_string(now_ms()) + ".conf");
        auto save = [&conf](const Config& c, std::string& err) { return save_config(conf.string(), c, err); };
        Config cfg;
        std::ostringstream o, e;

        Session first(cfg, factory_for(shelf), o, e, save);
        bool threw = false;
        try { first.run(cmd({"set", "provider", "aws"}), BASE); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        Config back;
        assert(load_config(conf.string(), back));
        const auto* r = std::get_if<RemoteConfig>(&back.storage);
        assert(r && r->bucket_name == std::get<RemoteConfig>(cfg.storage).bucket_name);

        Session second(cfg, factory_for(shelf), o, e, save);
        threw = false;
        try { second.run(cmd({"set", "access_key", "AKIDEXAMPLE"}), BASE); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        assert(load_config(conf.string(), back));
        assert(std::get<RemoteConfig>(back.storage).access_key == "AKIDEXAMPLE");
        assert(shelf->writes == 0);

        fs::remove(conf);
        fs::remove(conf.string() + ".bak");
        printf("  [PASS] config saved before ledger write\n");
    }

    // Refused commands still save; a failing save stops before the ledger write
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        int saves = 0;
        auto counting_save = [&saves](const Config&, std::string&) { ++saves; return true; };
        std::ostringstream o, e;
        Session refused(cfg, factory_for(shelf), o, e, counting_save);
        assert(refused.run(cmd({"spend", "500", "boat"}), BASE) == EXIT_OK);
        assert(saves == 1);
        assert(shelf->writes == 0);

        auto failing_save = [](const Config&, std::string& err) { err = "read-only"; return false; };
        Session broken(cfg, factory_for(shelf), o, e, failing_save);
        bool threw = false;
        try { broken.run(cmd({"spend", "1", "gum"}), BASE); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        assert(shelf->writes == 0);
        printf("  [PASS] config save ordering\n");
    }

    // list output
    {
        auto shelf = std::make_shared<Shelf>();
        Config cfg;
        assert(run(shelf, cfg, cmd({"spend", "2", "lunch", "tacos"}), BASE) == EXIT_OK);
        std::string out;
        assert(run(shelf, cfg, cmd({"list"}), BASE, &out) == EXIT_OK);
        assert(out == "Mar 10 12:00PM: $2.00 lunch (tacos)\n$8.00\n");
        printf("  [PASS] list\n");
    }

    printf("All session tests passed.\n");
    return 0;
}
