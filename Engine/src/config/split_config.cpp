/**
 * @file split_config.cpp
 * @brief Environment, argv and mapping-file parsing
 */

#include <config/split_config.hpp>
#include <state/module_path.hpp>
#include <state/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Terrasplit {

namespace {

bool env_flag(const char* value) {
    if (!value) return false;
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<ToolKind> tool_from_name(const std::string& name) {
    if (name.empty() || name == "auto") return std::nullopt;
    auto tool = parse_tool(name);
    if (!tool) {
        throw ConfigError("unknown tool \"" + name + "\" (expected terraform, terragrunt or auto)");
    }
    return tool;
}

ModulePath module_path_argument(const std::string& text, const char* what) {
    try {
        return parse_module_path(text);
    } catch (const ParseError& e) {
        throw ConfigError(std::string("invalid ") + what + " \"" + text + "\": " + e.what());
    }
}

} // namespace

SplitConfig SplitConfig::load_from_env() {
    SplitConfig config;

    const char* tool_env = std::getenv("TERRASPLIT_TOOL");
    const char* terraform_env = std::getenv("TERRASPLIT_TERRAFORM_BIN");
    const char* terragrunt_env = std::getenv("TERRASPLIT_TERRAGRUNT_BIN");
    const char* verbose_env = std::getenv("TERRASPLIT_VERBOSE");

    if (tool_env) config.tool = tool_from_name(tool_env);
    if (terraform_env && *terraform_env) config.terraform_bin = terraform_env;
    if (terragrunt_env && *terragrunt_env) config.terragrunt_bin = terragrunt_env;
    config.verbose = env_flag(verbose_env);

    return config;
}

SplitMapping SplitConfig::parse_split_argument(const std::string& argument) {
    size_t separator = std::string::npos;
    int depth = 0;
    bool quoted = false;

    for (size_t i = 0; i < argument.size(); ++i) {
        char c = argument[i];
        if (quoted) {
            if (c == '\\') ++i;
            else if (c == '"') quoted = false;
        } else if (c == '"') {
            quoted = true;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == '=' && depth == 0) {
            separator = i;
            break;
        }
    }

    if (separator == std::string::npos || separator == 0 || separator + 1 == argument.size()) {
        throw ConfigError("invalid split mapping \"" + argument + "\" (expected MODULE=DIR)");
    }

    SplitMapping mapping;
    mapping.module = module_path_argument(argument.substr(0, separator), "module path");
    mapping.destination = argument.substr(separator + 1);
    mapping.new_prefix = mapping.module;
    return mapping;
}

std::vector<SplitMapping> SplitConfig::load_mappings_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open mappings file " + path);
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("mappings file " + path + " is not valid JSON: " + e.what());
    }
    if (!root.is_array()) {
        throw ConfigError("mappings file " + path + " must contain a JSON array");
    }

    std::vector<SplitMapping> mappings;
    for (size_t i = 0; i < root.size(); ++i) {
        const auto& item = root[i];
        const std::string where = path + " entry #" + std::to_string(i);

        if (!item.is_object() || !item.contains("module") || !item.contains("destination") ||
            !item["module"].is_string() || !item["destination"].is_string()) {
            throw ConfigError(where + " needs string fields \"module\" and \"destination\"");
        }

        SplitMapping mapping;
        mapping.module = module_path_argument(item["module"].get<std::string>(), "module path");
        mapping.destination = item["destination"].get<std::string>();

        if (item.contains("prefix")) {
            if (!item["prefix"].is_string()) {
                throw ConfigError(where + " field \"prefix\" must be a string");
            }
            mapping.new_prefix = module_path_argument(item["prefix"].get<std::string>(), "prefix");
        } else {
            mapping.new_prefix = mapping.module;
        }
        mappings.push_back(std::move(mapping));
    }
    return mappings;
}

SplitConfig SplitConfig::parse(int argc, const char* const* argv) {
    SplitConfig config = load_from_env();
    const std::string program = argc > 0 ? argv[0] : "terrasplit";

    auto value_of = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError(option + " needs a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        } else if (arg == "--source") {
            config.source = value_of(i, arg);
        } else if (arg == "--split") {
            config.mappings.push_back(parse_split_argument(value_of(i, arg)));
        } else if (arg == "--as") {
            std::string prefix = value_of(i, arg);
            if (config.mappings.empty()) {
                throw ConfigError("--as must follow a --split");
            }
            config.mappings.back().new_prefix = module_path_argument(prefix, "prefix");
        } else if (arg == "--mappings") {
            auto loaded = load_mappings_file(value_of(i, arg));
            config.mappings.insert(config.mappings.end(), loaded.begin(), loaded.end());
        } else if (arg == "--tool") {
            config.tool = tool_from_name(value_of(i, arg));
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--overwrite") {
            config.overwrite = true;
        } else if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else {
            throw ConfigError("unknown argument \"" + arg + "\"\n" + usage(program));
        }
    }

    if (config.source.empty()) {
        throw ConfigError("--source is required");
    }
    if (config.mappings.empty()) {
        throw ConfigError("no split mappings provided (use --split or --mappings)");
    }
    return config;
}

std::string SplitConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " --source DIR --split MODULE=DIR [--as PREFIX] ... [options]\n"
        << "\n"
        << "Move the resources of a module subtree from one state into others.\n"
        << "\n"
        << "  --source DIR        Directory whose state is split\n"
        << "  --split MODULE=DIR  Move MODULE (and everything below it) into DIR's state\n"
        << "  --as PREFIX         Module path the preceding --split lands under; \"\" = root\n"
        << "  --mappings FILE     JSON array of {\"module\", \"destination\", \"prefix\"}\n"
        << "  --dry-run           Report what would move; push nothing\n"
        << "  --overwrite         Replace conflicting destination instances\n"
        << "  --tool NAME         terraform, terragrunt or auto (default auto)\n"
        << "  --json              Print the plan and outcome as JSON on stdout\n"
        << "  --verbose, -v       Debug logging\n"
        << "\n"
        << "Examples:\n"
        << "  " << program << " --source live/mono --split module.networking=live/networking --as \"\"\n"
        << "  " << program << " --source live/mono --mappings splits.json --dry-run\n";
    return out.str();
}

SplitOptions SplitConfig::split_options() const {
    SplitOptions options;
    options.dry_run = dry_run;
    options.overwrite = overwrite;
    return options;
}

CommandBackendConfig SplitConfig::backend_config() const {
    CommandBackendConfig backend;
    backend.forced_tool = tool;
    backend.terraform_bin = terraform_bin;
    backend.terragrunt_bin = terragrunt_bin;
    return backend;
}

} // namespace Terrasplit
