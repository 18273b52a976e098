#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/log_level_map.hpp>
#include <strata/core/result.hpp>
#include <strata/engine/engine.hpp>
#include <strata/engine/engine_state.hpp>
#include <strata/evm/revision.hpp>
#include <strata/host/host_context.hpp>
#include <strata/host/in_memory_host_store.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

using namespace strata;
namespace fs = std::filesystem;

namespace
{
    // snapshot: json object of hex key to hex value
    bool load_snapshot(fs::path const &path, InMemoryHostStore &store)
    {
        if (!fs::exists(path)) {
            LOG_INFO("snapshot {} not found, starting empty", path.string());
            return true;
        }
        std::ifstream ifile{path};
        auto const json = nlohmann::json::parse(ifile, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            LOG_ERROR("snapshot {} is not a json object", path.string());
            return false;
        }
        for (auto const &[key, value] : json.items()) {
            if (!value.is_string()) {
                LOG_ERROR("snapshot value of {} is not a string", key);
                return false;
            }
            auto const k = evmc::from_hex(key);
            auto const v = evmc::from_hex(value.get<std::string>());
            if (!k.has_value() || !v.has_value()) {
                LOG_ERROR("snapshot entry {} is not hex", key);
                return false;
            }
            store.write(*k, *v);
        }
        LOG_INFO("loaded {} entries from {}", json.size(), path.string());
        return true;
    }

    void write_snapshot(fs::path const &path, InMemoryHostStore const &store)
    {
        nlohmann::json json = nlohmann::json::object();
        for (auto const &[key, value] : store.data()) {
            json["0x" + evmc::hex(key)] = "0x" + evmc::hex(value);
        }
        std::ofstream ofile{path};
        ofile << json.dump(2) << '\n';
        LOG_INFO("wrote {} entries to {}", store.data().size(), path.string());
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"strata"};
    cli.option_defaults()->always_capture_default();

    fs::path snapshot;
    std::string method;
    std::string args_hex;
    HostContext host;
    std::string revision_name{evm::to_string(evm::latest_revision)};
    EngineOptions options;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--snapshot", snapshot, "host store snapshot (json)")
        ->required();
    cli.add_option("--method", method, "engine entry point")->required();
    cli.add_option("--args", args_hex, "hex encoded arguments");
    cli.add_option(
           "--predecessor",
           host.predecessor_account_id,
           "calling host account")
        ->required();
    cli.add_option(
           "--current", host.current_account_id, "engine host account")
        ->required();
    cli.add_option("--block_index", host.block_index, "host block index");
    cli.add_option(
        "--block_timestamp", host.block_timestamp, "host block timestamp");
    cli.add_option("--revision", revision_name, "evm revision")
        ->check([](std::string const &s) -> std::string {
            if (!evm::revision_from_string(s).has_value()) {
                return "unknown revision " + s;
            }
            return "";
        });
    cli.add_option(
        "--call_gas_limit", options.call_gas_limit, "gas of a root call");
    cli.add_flag(
        "--benchmark", options.benchmark_mode, "enable benchmark methods");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);
    LOG_INFO("running strata {}", STRATA_VERSION);

    options.revision = evm::revision_from_string(revision_name).value();

    auto const args = evmc::from_hex(args_hex);
    if (!args.has_value()) {
        LOG_ERROR("--args is not hex");
        return EXIT_FAILURE;
    }

    InMemoryHostStore store;
    if (!load_snapshot(snapshot, store)) {
        return EXIT_FAILURE;
    }

    Engine engine{store, host, options};
    auto const result = engine.dispatch(method, *args);
    if (result.has_error()) {
        std::cerr << result.error().message().c_str() << std::endl;
        quill::flush();
        return EXIT_FAILURE;
    }

    std::cout << "0x" << evmc::hex(result.value()) << std::endl;
    write_snapshot(snapshot, store);
    quill::flush();
    return EXIT_SUCCESS;
}
