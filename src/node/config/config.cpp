#include "config.hpp"
#include "cmdline/cmdline.h"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include "version.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

using namespace std;

namespace {
constexpr const char* defaultConfigFile { "nftreg.toml" };

struct CmdlineParsed {
    static std::optional<CmdlineParsed> parse(int argc, char** argv)
    {
        gengetopt_args_info ai;
        if (cmdline_parser(argc, argv, &ai) != 0)
            return {};
        return CmdlineParsed { ai };
    }
    CmdlineParsed(const CmdlineParsed&) = delete;
    CmdlineParsed(CmdlineParsed&& other)
        : ai(other.ai)
    {
        other.deleteOnDestruction = false;
    };
    ~CmdlineParsed()
    {
        if (deleteOnDestruction) {
            cmdline_parser_free(&ai);
        }
    }
    auto& value() const { return ai; }

private:
    CmdlineParsed(gengetopt_args_info& ai0)
        : ai(ai0)
    {
    }

    bool deleteOnDestruction { true };
    gengetopt_args_info ai;
};

std::runtime_error failed_convert(const toml::node& n)
{
    return std::runtime_error("Cannot parse configuration value starting at line "s + std::to_string(n.source().begin.line) + ", column "s + std::to_string(n.source().begin.column) + ".");
}

template <typename T>
std::optional<T> config_convert(const toml::node& n)
{
    if (auto val = n.value<T>()) {
        return val.value();
    }
    throw failed_convert(n);
}

struct TableReaderData {
    const toml::table& tbl;
    std::string_view filepath;
    mutable std::map<toml::key, bool> keyUsed;
};

struct TableReader : public TableReaderData {
    bool report { true };
    TableReader(const toml::table& tbl, std::string_view filepath)
        : TableReaderData(tbl, filepath, {})
    {
        for (auto& [k, v] : tbl) {
            keyUsed.emplace(k, false);
        }
    }
    TableReader(const TableReader&) = delete;
    TableReader(TableReader&& a)
        : TableReaderData(std::move(a))
    {
        a.report = false;
    };
    ~TableReader()
    {
        if (report) {
            for (auto& [k, used] : keyUsed) {
                if (!used) {
                    spdlog::warn("Ignoring configuration setting \""s + std::string(k.str()) + "\" at line "s + std::to_string(k.source().begin.line) + " in "s + string(filepath));
                }
            }
        }
    }

    std::optional<TableReader> subtable(std::string_view s)
    {
        if (auto it { tbl.find(s) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            if (it->second.is_table() == false)
                throw std::runtime_error("Configuration file's "s + std::string(s) + " must be a table."s);
            auto p { it->second.as_table() };
            return TableReader { *p, filepath };
        }
        return std::nullopt;
    }

    struct Entry {
        const toml::node* v;

        template <typename T>
        std::optional<T> get() const
        {
            return config_convert<T>(*v);
        }
    };
    std::optional<Entry> operator[](std::string_view key) const
    {
        if (auto it { tbl.find(key) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            return { Entry { &it->second } };
        }
        return std::nullopt;
    }
};

template <typename T>
void fill(
    T& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() }) {
                dst = *v;
                return;
            }
        }
    }
}

void fill_arg(std::string& dst, bool flag_given, const char* flag_val)
{
    if (flag_given)
        dst = flag_val;
}

spdlog::level::level_enum parse_level(const std::string& s)
{
    auto l { spdlog::level::from_str(s) };
    if (l == spdlog::level::off && s != "off")
        throw std::runtime_error("Invalid log level \"" + s + "\".");
    return l;
}
} // namespace

tl::expected<Config, int> Config::from_args(int argc, char** argv)
{
    auto p { CmdlineParsed::parse(argc, argv) };
    if (!p)
        return tl::make_unexpected(-1);

    Config c;
    if (auto i { c.init(p->value()) }; i < 1) {
        return tl::make_unexpected(i);
    }
    return c;
}

void Config::load_toml(std::string_view content, std::string_view source)
{
    toml::table tbl = toml::parse(content, source);
    TableReader root(tbl, source);

    auto s_collection { root.subtable("collection") };
    fill(collection.name, s_collection, "name");
    fill(collection.symbol, s_collection, "symbol");

    auto s_registry { root.subtable("registry") };
    fill(registry.rejectSelfApproval, s_registry, "reject-self-approval");

    auto s_log { root.subtable("log") };
    fill(log.level, s_log, "level");
    fill(log.file, s_log, "file");
    fill(log.eventsFile, s_log, "events-file");
    parse_level(log.level);
}

void Config::load_toml_file(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Cannot read configuration file \"" + filename + "\".");
    std::stringstream ss;
    ss << file.rdbuf();
    load_toml(ss.str(), filename);
}

spdlog::level::level_enum Config::log_level() const
{
    return parse_level(log.level);
}

void Config::process_args(const gengetopt_args_info& ai)
{
    fill_arg(run.script, ai.script_given, ai.script_arg);
    fill_arg(collection.name, ai.name_given, ai.name_arg);
    fill_arg(collection.symbol, ai.symbol_given, ai.symbol_arg);
    fill_arg(log.file, ai.log_file_given, ai.log_file_arg);
    fill_arg(log.eventsFile, ai.events_file_given, ai.events_file_arg);
    if (ai.debug_given)
        log.level = "debug";
    run.printEvents = ai.events_given;
    run.printSnapshot = ai.snapshot_given;
}

std::optional<int> Config::process_config_file(const gengetopt_args_info& ai, bool silent)
{
    std::string filename { defaultConfigFile };
    if (!ai.config_given && !std::filesystem::exists(filename)) {
        if (!silent)
            spdlog::debug("No {} file found, using default configuration", filename);
        if (ai.test_given) {
            spdlog::error("No configuration file found.");
            return -1;
        }
    } else {
        if (ai.config_given)
            filename = ai.config_arg;
        if (!silent)
            spdlog::info("Reading configuration file \"{}\"", filename);

        load_toml_file(filename);
        if (ai.test_given) {
            std::cout << "Configuration file \"" + filename + "\" is valid.\n";
            return 0;
        }
    }
    return {};
}

int Config::init(const gengetopt_args_info& ai)
{
    try {
        bool dmp(ai.dump_config_given);
        if (ai.debug_given)
            spdlog::set_level(spdlog::level::debug);
        if (!dmp)
            spdlog::debug("nftreg v{}.{}.{}", NFTREG_VERSION_MAJOR, NFTREG_VERSION_MINOR, NFTREG_VERSION_PATCH);

        if (auto i { process_config_file(ai, dmp) })
            return *i;
        process_args(ai);
        parse_level(log.level);

        if (dmp) {
            std::cout << dump();
            return 0;
        }
    } catch (const toml::parse_error& err) {
        std::cerr << "Error while parsing file '" << *err.source().path << "':\n"
                  << err.description() << "\n  (" << err.source().begin
                  << ")\n";
        return -1;
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return -1;
    }
    return 1;
}

std::string Config::dump() const
{
    toml::table tbl;
    tbl.insert_or_assign("collection",
        toml::table {
            { "name", collection.name },
            { "symbol", collection.symbol },
        });
    tbl.insert_or_assign("registry",
        toml::table {
            { "reject-self-approval", registry.rejectSelfApproval },
        });
    tbl.insert_or_assign("log",
        toml::table {
            { "level", log.level },
            { "file", log.file },
            { "events-file", log.eventsFile },
        });
    stringstream ss;
    ss << tbl << endl;
    return ss.str();
}
