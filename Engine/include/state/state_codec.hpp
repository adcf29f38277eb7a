/**
 * @file state_codec.hpp
 * @brief JSON codec for state documents
 *
 * decode() rejects anything that is not a version 4+ state object with the
 * required scalar fields; every field it does not model is retained and
 * re-emitted by encode(). Resource and output order is preserved.
 */

#pragma once

#include <state/state_document.hpp>
#include <string>

namespace Terrasplit {

class StateCodec {
public:
    static constexpr int64_t kMinFormatVersion = 4;

    /**
     * @brief Parse state text
     * @throws ParseError when the text is not a structurally valid state document
     */
    static StateDocument decode(const std::string& text);

    /**
     * @brief Serialize with two-space indentation and a trailing newline
     */
    static std::string encode(const StateDocument& doc);

    static StateDocument from_json(const Json& root);
    static Json to_json(const StateDocument& doc);

private:
    static ResourceEntry decode_resource(const Json& node, size_t position);
    static ResourceInstance decode_instance(const Json& node, const std::string& owner);
    static Json encode_resource(const ResourceEntry& entry);
    static Json encode_instance(const ResourceInstance& instance);
};

} // namespace Terrasplit
