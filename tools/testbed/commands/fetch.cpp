/**
 * testbed CLI - fetch command
 *
 * Ensure a catalogue binary is in the local cache and print its path.
 */

#include "../common.hpp"
#include <testbed/provisioner.hpp>
#include <CLI/CLI.hpp>

namespace testbed::cli::commands {

namespace {

struct FetchOptions {
    std::string binary;
};

int cmd_fetch(const GlobalOptions& opts, const FetchOptions& fetch_opts) {
    auto config = load_cli_config(opts);
    if (!config) {
        return kExitEnvironmentError;
    }

    ProvisionerOptions options;
    options.cache_dir = config->cache_dir;
    options.catalogue = config->catalogue;
    BinaryProvisioner provisioner(std::move(options));

    auto path = provisioner.ensure(fetch_opts.binary);
    if (path.isErr()) {
        print_error(path.error().toString(), opts.json);
        return kExitEnvironmentError;
    }

    if (opts.json) {
        nlohmann::json j;
        j["success"] = true;
        j["name"] = fetch_opts.binary;
        j["version"] = provisioner.spec(fetch_opts.binary)->version;
        j["path"] = path.value();
        output_json(j);
    } else {
        std::cout << path.value() << std::endl;
    }
    return kExitOk;
}

} // anonymous namespace

void setup_fetch(CLI::App* app, GlobalOptions& opts) {
    static FetchOptions fetch_opts;

    app->add_option("binary", fetch_opts.binary, "Binary name (node, bun, uv)")->required();

    app->callback([&opts]() {
        std::exit(cmd_fetch(opts, fetch_opts));
    });
}

} // namespace testbed::cli::commands
