/**
 * @file module_path.cpp
 * @brief Module path and resource address parsing
 */

#include <state/module_path.hpp>
#include <state/errors.hpp>
#include <cctype>

namespace Terrasplit {

namespace {

/**
 * @brief Single-pass cursor over an address string.
 */
class AddressCursor {
public:
    explicit AddressCursor(const std::string& text) : text_(text) {}

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    bool starts_with(const char* prefix, size_t length) const {
        return text_.compare(pos_, length, prefix) == 0;
    }

    void advance(size_t n) { pos_ += n; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void expect(char c) {
        if (!consume(c)) fail(std::string("expected '") + c + "'");
    }

    // Terraform identifiers: letters, digits, underscores and dashes.
    std::string read_identifier() {
        size_t start = pos_;
        while (!at_end()) {
            char c = text_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
                ++pos_;
            } else {
                break;
            }
        }
        if (start == pos_) fail("expected identifier");
        return text_.substr(start, pos_ - start);
    }

    Json read_index_key() {
        expect('[');
        Json key;

        if (peek() == '"') {
            size_t start = pos_++;
            bool closed = false;
            while (!at_end()) {
                char c = text_[pos_++];
                if (c == '\\') {
                    if (at_end()) break;
                    ++pos_;
                } else if (c == '"') {
                    closed = true;
                    break;
                }
            }
            if (!closed) fail("unterminated index key");
            try {
                key = Json::parse(text_.substr(start, pos_ - start));
            } catch (const Json::parse_error&) {
                fail("invalid string index key");
            }
        } else {
            size_t start = pos_;
            consume('-');
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
            if (pos_ == start || (pos_ == start + 1 && text_[start] == '-')) {
                fail("expected integer or quoted index key");
            }
            try {
                key = std::stoll(text_.substr(start, pos_ - start));
            } catch (const std::out_of_range&) {
                fail("index key out of range");
            }
        }

        expect(']');
        return key;
    }

    std::string read_module_step() {
        if (!starts_with("module.", 7)) fail("expected 'module.'");
        advance(7);
        std::string step = "module." + read_identifier();
        if (peek() == '[') {
            step += format_index_key(read_index_key());
        }
        return step;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw ParseError(what + " at offset " + std::to_string(pos_) + " in \"" + text_ + "\"");
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace

std::string format_index_key(const Json& key) {
    return "[" + key.dump() + "]";
}

ModulePath parse_module_path(const std::string& text) {
    ModulePath path;
    if (text.empty()) return path;

    AddressCursor cursor(text);
    while (true) {
        path.push_back(cursor.read_module_step());
        if (cursor.at_end()) break;
        cursor.expect('.');
    }
    return path;
}

std::string format_module_path(const ModulePath& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += '.';
        out += path[i];
    }
    return out;
}

std::string display_module_path(const ModulePath& path) {
    return path.empty() ? "(root)" : format_module_path(path);
}

ResourceAddress parse_resource_address(const std::string& text) {
    ResourceAddress address;
    AddressCursor cursor(text);

    while (cursor.starts_with("module.", 7)) {
        address.module.push_back(cursor.read_module_step());
        cursor.expect('.');
    }

    if (cursor.starts_with("data.", 5)) {
        cursor.advance(5);
        address.mode = ResourceMode::Data;
    }

    address.type = cursor.read_identifier();
    cursor.expect('.');
    address.name = cursor.read_identifier();

    if (cursor.peek() == '[') {
        address.index_key = cursor.read_index_key();
    }
    if (!cursor.at_end()) cursor.fail("unexpected trailing characters");

    return address;
}

std::string ResourceAddress::to_string() const {
    std::string out = format_module_path(module);
    if (!out.empty()) out += '.';
    if (mode == ResourceMode::Data) out += "data.";
    out += type;
    out += '.';
    out += name;
    if (index_key) out += format_index_key(*index_key);
    return out;
}

} // namespace Terrasplit
