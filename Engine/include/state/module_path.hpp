/**
 * @file module_path.hpp
 * @brief Module path and resource address syntax
 *
 * A module path string such as `module.net.module.vpc["east"]` is split into
 * one step per module call: {"module.net", "module.vpc[\"east\"]"}. Index keys
 * are normalized to their JSON spelling so equal keys compare equal as text.
 */

#pragma once

#include <state/state_document.hpp>
#include <optional>
#include <string>

namespace Terrasplit {

/**
 * @brief Parsed resource address: module path, mode, type, name and optional index.
 */
struct ResourceAddress {
    ModulePath module;
    ResourceMode mode = ResourceMode::Managed;
    std::string type;
    std::string name;
    std::optional<Json> index_key;

    std::string to_string() const;
};

/**
 * @brief Parse a module path string. Empty string is the root module.
 * @throws ParseError on malformed input
 */
ModulePath parse_module_path(const std::string& text);

/**
 * @brief Join module steps back into the dotted form used by the state format.
 */
std::string format_module_path(const ModulePath& path);

/**
 * @brief Parse a full resource address (managed or data, with optional index).
 * @throws ParseError on malformed input
 */
ResourceAddress parse_resource_address(const std::string& text);

/**
 * @brief Render an index key as it appears in an address: [0] or ["key"]
 */
std::string format_index_key(const Json& key);

/**
 * @brief Display form of a module path, "(root)" for the root module.
 */
std::string display_module_path(const ModulePath& path);

} // namespace Terrasplit
