// Local file ledger store
#include "../src/history.h"
#include "../src/paths.h"
#include "../src/ledger.h"
#include "../src/storage/local_store.h"
#include "../src/util.h"
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace bme;

static fs::path make_temp_dir(const char* name){
    fs::path p = fs::temp_directory_path() / (std::string("budgetme_") + name + "_" + std::to_string(now_ms()));
    fs::remove_all(p);
    return p;
}

int main() {
    printf("Testing local store...\n");

    // Missing file is a miss, store creates directories
    {
        fs::path dir = make_temp_dir("roundtrip") / "nested";
        LocalStore store(dir.string());
        assert(!store.fetch());

        Ledger l = Ledger::fresh(1000);
        spend(l, 4.0, "book", std::nullopt, false, 1001);
        std::string err;
        assert(store.store(l, err));
        assert(fs::exists(dir / "data.json"));

        auto back = store.fetch();
        assert(back);
        assert(*back == l);
        assert(back->last_updated == 1000);
        fs::remove_all(dir.parent_path());
        printf("  [PASS] store then fetch\n");
    }

    // Overwrite keeps the previous version as .bak
    {
        fs::path dir = make_temp_dir("backup");
        LocalStore store(dir.string());
        std::string err;
        Ledger a = Ledger::fresh(1);
        Ledger b = a;
        b.balance = 42.0;
        assert(store.store(a, err));
        assert(store.store(b, err));
        assert(store.fetch()->balance == 42.0);
        assert(fs::exists(dir / "data.json.bak"));
        std::string bak;
        assert(read_file_all((dir / "data.json.bak").string(), bak));
        assert(bak.find("\"balance\":10") != std::string::npos);
        fs::remove_all(dir);
        printf("  [PASS] backup of previous version\n");
    }

    // Corrupt document throws instead of being treated as empty
    {
        fs::path dir = make_temp_dir("corrupt");
        fs::create_directories(dir);
        {
            std::ofstream f(dir / "data.json");
            f << "{not json";
        }
        LocalStore store(dir.string());
        bool threw = false;
        try { store.fetch(); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        fs::remove_all(dir);
        printf("  [PASS] corrupt document throws\n");
    }

    // Home expansion and XDG config directory
    {
        setenv("HOME", "/home/tester", 1);
        setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
        assert(expand_home("~") == "/home/tester");
        assert(expand_home("~/ledger") == "/home/tester/ledger");
        assert(expand_home("/abs/~") == "/abs/~");
        assert(join_path("/a/", "b") == "/a/b");
        assert(join_path("/a", "b") == "/a/b");
        assert(config_dir() == "/tmp/xdg/budgetme");
        assert(LocalStore("~/ledger").file_path() == "/home/tester/ledger/data.json");
        unsetenv("XDG_CONFIG_HOME");
        assert(config_dir() == "/home/tester/.config/budgetme");
        printf("  [PASS] paths\n");
    }

    printf("All local store tests passed.\n");
    return 0;
}
