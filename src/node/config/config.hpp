#pragma once

#include "spdlog/common.h"
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>

struct gengetopt_args_info;
struct Config {
    struct Collection {
        std::string name { "Nft Registry" };
        std::string symbol { "NFT" };
    } collection;
    struct Registry {
        bool rejectSelfApproval { true };
    } registry;
    struct Log {
        std::string level { "info" };
        std::string file;       // empty: console only
        std::string eventsFile; // empty: no event log file
    } log;
    struct Run {
        std::string script; // empty: standard input
        bool printEvents { false };
        bool printSnapshot { false };
    } run;

    static tl::expected<Config, int> from_args(int argc, char** argv);

    // configuration file content, throws toml::parse_error and std::runtime_error
    void load_toml(std::string_view content, std::string_view source);
    void load_toml_file(const std::string& filename);

    spdlog::level::level_enum log_level() const;
    std::string dump() const;

private:
    int init(const gengetopt_args_info&);
    std::optional<int> process_config_file(const gengetopt_args_info&, bool silent);
    void process_args(const gengetopt_args_info&);
};
