#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "jpatch/Document.hpp"
#include "jpatch/EnvArray.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/FileIO.hpp"
#include "jpatch/Paths.hpp"
#include "jpatch/Util.hpp"

using namespace jpatch;

namespace {

// Try parsing as JSONC, otherwise take the raw text as a string.
Value parse_json_or_string(const std::string& raw) {
    try {
        return Value::parse(raw, nullptr, true, true);
    } catch (const Value::parse_error&) {
        return Value(raw);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jsonc-patch",
            "Edit one key of a VS Code settings.json without touching comments or formatting");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("s,settings", "Path to settings.json (default: VS Code user settings)", cxxopts::value<std::string>())
            ("k,key", "Root-level key to edit", cxxopts::value<std::string>()->default_value(kDefaultKey))
            ("env-file", "JSON object of NAME: VALUE pairs to sync", cxxopts::value<std::string>())
            ("p,prefix", "Sync process env vars starting with this prefix", cxxopts::value<std::string>())
            ("on-duplicate", "first|error when the key is declared twice", cxxopts::value<std::string>()->default_value("first"))
            ("n,dry-run", "Print the resulting document instead of writing it")
            ("f,force", "Rewrite a document that has no root object")
            ("q,quiet", "Only print errors")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: path | get | sync [NAME=VALUE ...] | set JSON | clear\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];
        const bool quiet = result.count("quiet") > 0;
        const bool dry_run = result.count("dry-run") > 0;

        SyncOptions sync_opts;
        sync_opts.key = result["key"].as<std::string>();
        const std::string policy = to_lower(result["on-duplicate"].as<std::string>());
        if (policy == "first") {
            sync_opts.on_duplicate = DuplicatePolicy::FirstMatch;
        } else if (policy == "error") {
            sync_opts.on_duplicate = DuplicatePolicy::Reject;
        } else {
            std::cerr << "Error: --on-duplicate must be 'first' or 'error'\n";
            return 1;
        }

        SettingsLocation location;
        if (result.count("settings")) location.override_path = result["settings"].as<std::string>();
        const std::string path = resolve_settings_path(location);

        // PATH
        if (cmd == "path") {
            std::cout << path << "\n";
            return 0;
        }

        const auto content = read_text_file(path);

        // GET
        if (cmd == "get") {
            if (!content) {
                std::cerr << "Settings file not found: " << path << "\n";
                return 1;
            }
            const auto value = read_key(*content, sync_opts);
            if (!value) {
                std::cerr << "Key not found: " << sync_opts.key << "\n";
                return 1;
            }
            std::cout << value->dump(2) << "\n";
            return 0;
        }

        const std::string doc = content.value_or("");
        PatchResult patched;

        if (cmd == "sync") {
            std::vector<std::vector<EnvEntry>> sources;
            if (result.count("env-file")) {
                const std::string env_path = result["env-file"].as<std::string>();
                const auto env_text = read_text_file(env_path);
                if (!env_text) throw FileNotFoundError(env_path);
                sources.push_back(env_from_text(*env_text));
            }
            if (result.count("prefix")) {
                sources.push_back(collect_env_vars(result["prefix"].as<std::string>()));
            }
            std::vector<EnvEntry> assigned;
            for (size_t i = 1; i < cmdv.size(); ++i) {
                assigned.push_back(parse_assignment(cmdv[i]));
            }
            sources.push_back(assigned);
            patched = sync(doc, merge_entries(sources), sync_opts);
        } else if (cmd == "set") {
            if (cmdv.size() < 2) {
                std::cerr << "Error: insufficient arguments for command 'set'\n";
                return 1;
            }
            patched = sync_value(doc, parse_json_or_string(cmdv[1]), sync_opts);
        } else if (cmd == "clear") {
            if (!content) {
                if (!quiet) std::cout << "Nothing to clear: " << path << " does not exist\n";
                return 0;
            }
            patched = clear(doc, sync_opts);
        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            return 1;
        }

        if (patched.action == PatchAction::Created && !trim(doc).empty() &&
            !result.count("force")) {
            std::cerr << "Error: " << path << " has no JSON object at its root; "
                      << "use --force to replace its contents\n";
            return 1;
        }

        if (dry_run) {
            std::cout << patched.text;
            return 0;
        }

        if (!patched.changed()) {
            if (!quiet) std::cout << sync_opts.key << " already up to date in " << path << "\n";
            return 0;
        }

        atomic_write_file(path, patched.text);
        if (!quiet) {
            std::cout << sync_opts.key << " " << action_name(patched.action)
                      << " in " << path << "\n";
        }
        return 0;

    } catch (const PatchError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
