#include <deltaspace/DeltaSpace.hpp>

#include "tools/ToolCli.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace DS;
using namespace DS::History;

namespace {

struct ReplayCliOptions {
    bool                     show_help = false;
    bool                     pretty    = false;
    bool                     describe  = false;
    std::size_t              undo      = 0;
    std::vector<std::string> inputs;
};

void print_usage() {
    std::cout << "Usage: deltaspace_replay [--undo N] [--pretty] [--describe] <base.json> <history.json>\n"
                 "       deltaspace_replay --help\n"
                 "\n"
                 "Applies every patch of <history.json> (an array of patches) to the document in\n"
                 "<base.json>, optionally undoes the last N of them, and prints the result.\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<ReplayCliOptions> {
    ReplayCliOptions options{};

    Tools::ToolCli cli("deltaspace_replay");
    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
    cli.add_alias("-h", "--help");
    cli.add_flag("--pretty", {.on_set = [&] { options.pretty = true; }});
    cli.add_flag("--describe", {.on_set = [&] { options.describe = true; }});
    cli.add_count("--undo", {.on_value = [&](std::size_t value) { options.undo = value; }});
    cli.set_positional_handler([&](std::string_view token) -> Tools::ToolCli::ParseError {
        if (options.inputs.size() == 2) {
            return "too many inputs ('" + std::string(token) + "')";
        }
        options.inputs.emplace_back(token);
        return std::nullopt;
    });

    if (!cli.parse(argc, argv)) {
        for (auto const& error : cli.errors()) {
            std::cerr << error << "\n";
        }
        return std::nullopt;
    }
    return options;
}

auto readDocument(std::string const& path) -> Expected<nlohmann::json> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(Error{Error::Code::MalformedInput, "cannot open '" + path + "'"});
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    auto parsed = PatchCodec::parseJsonText(buffer.str());
    if (!parsed) {
        return std::unexpected(Error{parsed.error().code, path + ": " + parsed.error().message.value_or("")});
    }
    return parsed;
}

auto replay(ReplayCliOptions const& cli) -> Expected<NodePtr> {
    auto base = readDocument(cli.inputs[0]);
    if (!base)
        return std::unexpected(base.error());
    auto historyJson = readDocument(cli.inputs[1]);
    if (!historyJson)
        return std::unexpected(historyJson.error());

    auto patches = PatchCodec::decodeHistory(*historyJson);
    if (!patches)
        return std::unexpected(patches.error());

    auto store = VersionedStore::fromJson(*base);
    if (!store)
        return std::unexpected(store.error());

    for (std::size_t i = 0; i < patches->size(); ++i) {
        if (auto applied = store->applyPatch((*patches)[i]); !applied) {
            auto error    = applied.error();
            error.message = "patch " + std::to_string(i) + ": " + error.message.value_or("");
            return std::unexpected(std::move(error));
        }
    }

    for (std::size_t i = 0; i < cli.undo && store->getCanUndo(); ++i) {
        if (auto undone = store->undo(); !undone)
            return std::unexpected(undone.error());
    }

    if (cli.describe) {
        auto const& ledger = store->ledger();
        for (std::size_t i = 0; i < ledger.size(); ++i) {
            std::cerr << "# entry " << i << (i < ledger.cursor() ? "" : " (undone)") << "\n"
                      << describePatch(ledger.entryAt(i));
        }
    }

    return store->getState();
}

} // namespace

int main(int argc, char** argv) {
    auto cli = parse_cli(argc, argv);
    if (!cli) {
        return EXIT_FAILURE;
    }
    if (cli->show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (cli->inputs.size() != 2) {
        std::cerr << "deltaspace_replay: expected a base document and a history file" << std::endl;
        print_usage();
        return EXIT_FAILURE;
    }

    auto result = replay(*cli);
    if (!result) {
        std::cerr << "deltaspace_replay: " << describeError(result.error()) << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << toJson(*result).dump(cli->pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return EXIT_SUCCESS;
}
