#include "config/config.hpp"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
using namespace std;

namespace {
struct TempFile {
    filesystem::path path;
    TempFile(const string& name, const string& content)
        : path(filesystem::temp_directory_path() / name)
    {
        ofstream(path) << content;
    }
    ~TempFile() { filesystem::remove(path); }
};

tl::expected<Config, int> parse_args(vector<string> args)
{
    args.insert(args.begin(), "nftreg");
    vector<char*> argv;
    for (auto& a : args)
        argv.push_back(a.data());
    return Config::from_args(int(argv.size()), argv.data());
}

// captures log output of the default logger while alive
struct CapturedLog {
    ostringstream out;
    shared_ptr<spdlog::logger> previous { spdlog::default_logger() };
    CapturedLog()
    {
        auto sink { make_shared<spdlog::sinks::ostream_sink_mt>(out) };
        spdlog::set_default_logger(make_shared<spdlog::logger>("captured", sink));
    }
    ~CapturedLog() { spdlog::set_default_logger(previous); }
};

void test_defaults()
{
    Config c;
    assert(c.collection.name == "Nft Registry");
    assert(c.collection.symbol == "NFT");
    assert(c.registry.rejectSelfApproval);
    assert(c.log.level == "info");
    assert(c.log.file.empty());
    assert(c.log_level() == spdlog::level::info);
}

void test_load()
{
    Config c;
    c.load_toml(R"(
[collection]
name = "Cats"
symbol = "CAT"

[registry]
reject-self-approval = false

[log]
level = "debug"
events-file = "events.log"
)",
        "test.toml");
    assert(c.collection.name == "Cats");
    assert(c.collection.symbol == "CAT");
    assert(!c.registry.rejectSelfApproval);
    assert(c.log_level() == spdlog::level::debug);
    assert(c.log.eventsFile == "events.log");
    assert(c.log.file.empty());

    // partial files keep the remaining values
    Config d;
    d.load_toml("[collection]\nsymbol = \"DOG\"\n", "partial.toml");
    assert(d.collection.name == "Nft Registry");
    assert(d.collection.symbol == "DOG");
}

void test_dump_reloads()
{
    Config c;
    c.collection.name = "Round";
    c.registry.rejectSelfApproval = false;
    c.log.level = "warn";
    Config d;
    d.load_toml(c.dump(), "dump.toml");
    assert(d.collection.name == "Round");
    assert(!d.registry.rejectSelfApproval);
    assert(d.log_level() == spdlog::level::warn);
}

template <typename E>
bool throws(const string& content)
{
    try {
        Config c;
        c.load_toml(content, "bad.toml");
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_command_line_wins()
{
    TempFile file("nftreg_test_precedence.toml", R"(
[collection]
name = "From File"
symbol = "FILE"

[registry]
reject-self-approval = false

[log]
level = "warn"
)");
    auto c { parse_args({ "--config", file.path.string(), "--name", "From Cli", "--debug", "--events" }) };
    assert(c.has_value());
    assert(c->collection.name == "From Cli");
    assert(c->collection.symbol == "FILE");
    assert(!c->registry.rejectSelfApproval);
    assert(c->log_level() == spdlog::level::debug);
    assert(c->run.printEvents);
    assert(!c->run.printSnapshot);

    // without command line overrides the file values stay
    c = parse_args({ "--config", file.path.string(), "--script", "cmds.txt" });
    assert(c.has_value());
    assert(c->collection.name == "From File");
    assert(c->log_level() == spdlog::level::warn);
    assert(c->run.script == "cmds.txt");

    // and without a file the defaults
    c = parse_args({ "--symbol", "CLI" });
    assert(c.has_value());
    assert(c->collection.name == "Nft Registry");
    assert(c->collection.symbol == "CLI");
    assert(c->registry.rejectSelfApproval);
}

void test_early_exits()
{
    TempFile file("nftreg_test_exits.toml", "[collection]\nname = \"Exit\"\n");
    // dump and test stop after printing, with status 0
    auto c { parse_args({ "--config", file.path.string(), "--dump-config" }) };
    assert(!c.has_value() && c.error() == 0);
    c = parse_args({ "--config", file.path.string(), "--test" });
    assert(!c.has_value() && c.error() == 0);

    TempFile broken("nftreg_test_broken.toml", "[log]\nlevel = 3\n");
    c = parse_args({ "--config", broken.path.string() });
    assert(!c.has_value() && c.error() < 0);
    c = parse_args({ "--config", (filesystem::temp_directory_path() / "nftreg_missing.toml").string() });
    assert(!c.has_value() && c.error() < 0);
}

void test_unknown_key_warns()
{
    CapturedLog captured;
    Config c;
    c.load_toml("[collection]\ncolour = \"red\"\nname = \"Known\"\n", "warn.toml");
    assert(c.collection.name == "Known");
    auto text { captured.out.str() };
    assert(text.find("Ignoring configuration setting \"colour\"") != string::npos);
    assert(text.find("\"name\"") == string::npos);
}

void test_invalid()
{
    assert(throws<runtime_error>("[registry]\nreject-self-approval = \"no\"\n"));
    assert(throws<runtime_error>("collection = 5\n"));
    assert(throws<runtime_error>("[log]\nlevel = \"loud\"\n"));
    assert(throws<toml::parse_error>("[collection\nname = 1\n"));
}
}

int main()
{
    test_defaults();
    test_load();
    test_dump_reloads();
    test_command_line_wins();
    test_early_exits();
    test_unknown_key_warns();
    test_invalid();
    cout << "config tests passed" << endl;
    return 0;
}
