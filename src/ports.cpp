#include "ports.h"
#include <vector>
#include <sstream>
#include <cctype>
#include <cstring>

namespace benefice {

namespace {

// Parsed Enarx.toml value. Only the shapes TOML documents use are kept;
// floats and dates are recognised but not interpreted.
struct Value {
    enum class Kind { STRING, INTEGER, BOOLEAN, OTHER, ARRAY, TABLE };

    Kind kind = Kind::TABLE;
    size_t line = 0;
    std::string str;
    long long integer = 0;
    bool boolean = false;
    std::vector<Value> array;
    std::map<std::string, Value> table;
    bool is_header_array = false;    // Array created by [[name]]
};

class TomlReader {
public:
    explicit TomlReader(const std::string& text) : text_(text) {}

    Value read_document() {
        Value root;
        root.line = 1;
        Value* current = &root;

        while (true) {
            skip_blank_lines();
            if (at_end()) break;

            if (peek() == '[') {
                current = read_header(root);
            } else {
                read_key_value(*current);
            }
            expect_line_end();
        }
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t depth_ = 0;               // Open arrays, inline tables and dotted keys

    [[noreturn]] void fail(const std::string& message) const {
        throw ConfigParseError(message, line_);
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }
    char next() {
        char c = text_[pos_++];
        if (c == '\n') line_++;
        return c;
    }
    bool starts_with(const char* s) const { return text_.compare(pos_, std::strlen(s), s) == 0; }

    void skip_spaces() {
        while (!at_end() && (peek() == ' ' || peek() == '\t')) pos_++;
    }

    void skip_comment() {
        if (peek() == '#') {
            while (!at_end() && peek() != '\n') pos_++;
        }
    }

    // Whitespace, comments and newlines between statements or array items
    void skip_blank_lines() {
        while (!at_end()) {
            skip_spaces();
            skip_comment();
            if (peek() == '\r' && peek(1) == '\n') {
                pos_++;
            }
            if (peek() == '\n') {
                next();
            } else {
                break;
            }
        }
    }

    void expect_line_end() {
        skip_spaces();
        skip_comment();
        if (at_end()) return;
        if (peek() == '\r') pos_++;
        if (peek() != '\n') fail("expected end of line");
        next();
    }

    static bool is_bare_key_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    }

    std::string read_key_part() {
        skip_spaces();
        if (peek() == '"') return read_basic_string();
        if (peek() == '\'') return read_literal_string();

        size_t start = pos_;
        while (!at_end() && is_bare_key_char(peek())) pos_++;
        if (start == pos_) fail("expected a key");
        return text_.substr(start, pos_ - start);
    }

    std::vector<std::string> read_key() {
        std::vector<std::string> path{read_key_part()};
        skip_spaces();
        while (peek() == '.') {
            pos_++;
            path.push_back(read_key_part());
            if (depth_ + path.size() > MAX_CONFIG_NESTING) fail("nesting too deep");
            skip_spaces();
        }
        return path;
    }

    void enter_nested() {
        if (++depth_ > MAX_CONFIG_NESTING) fail("nesting too deep");
    }

    Value* descend(Value& from, const std::vector<std::string>& path, size_t count) {
        Value* node = &from;
        for (size_t i = 0; i < count; i++) {
            auto it = node->table.find(path[i]);
            if (it == node->table.end()) {
                Value child;
                child.line = line_;
                it = node->table.emplace(path[i], std::move(child)).first;
            }
            node = &it->second;
            if (node->kind == Value::Kind::ARRAY && node->is_header_array && !node->array.empty()) {
                node = &node->array.back();
            }
            if (node->kind != Value::Kind::TABLE) {
                fail("key '" + path[i] + "' is not a table");
            }
        }
        return node;
    }

    Value* read_header(Value& root) {
        next();  // '['
        bool array_header = peek() == '[';
        if (array_header) next();

        std::vector<std::string> path = read_key();
        if (at_end() || next() != ']') fail("unterminated table header");
        if (array_header && (at_end() || next() != ']')) fail("unterminated array-of-tables header");

        Value* parent = descend(root, path, path.size() - 1);
        const std::string& name = path.back();

        if (array_header) {
            auto it = parent->table.find(name);
            if (it == parent->table.end()) {
                Value array;
                array.kind = Value::Kind::ARRAY;
                array.is_header_array = true;
                array.line = line_;
                it = parent->table.emplace(name, std::move(array)).first;
            } else if (!it->second.is_header_array) {
                fail("'" + name + "' is not an array of tables");
            }
            Value table;
            table.line = line_;
            it->second.array.push_back(std::move(table));
            return &it->second.array.back();
        }

        auto it = parent->table.find(name);
        if (it != parent->table.end()) {
            if (it->second.kind != Value::Kind::TABLE) fail("'" + name + "' is not a table");
            return &it->second;
        }
        Value table;
        table.line = line_;
        return &parent->table.emplace(name, std::move(table)).first->second;
    }

    void read_key_value(Value& into) {
        std::vector<std::string> path = read_key();
        skip_spaces();
        if (at_end() || next() != '=') fail("expected '=' after key");
        skip_spaces();

        depth_ += path.size();
        Value value = read_value();
        depth_ -= path.size();
        Value* parent = descend(into, path, path.size() - 1);
        if (!parent->table.emplace(path.back(), std::move(value)).second) {
            fail("duplicate key '" + path.back() + "'");
        }
    }

    Value read_value() {
        Value value;
        value.line = line_;

        char c = peek();
        if (c == '"' || c == '\'') {
            value.kind = Value::Kind::STRING;
            value.str = c == '"' ? read_basic_string() : read_literal_string();
        } else if (c == '[') {
            value.kind = Value::Kind::ARRAY;
            read_array(value);
        } else if (c == '{') {
            value.kind = Value::Kind::TABLE;
            read_inline_table(value);
        } else if (starts_with("true")) {
            pos_ += 4;
            value.kind = Value::Kind::BOOLEAN;
            value.boolean = true;
        } else if (starts_with("false")) {
            pos_ += 5;
            value.kind = Value::Kind::BOOLEAN;
        } else {
            read_number_or_other(value);
        }
        return value;
    }

    std::string read_basic_string() {
        bool multiline = starts_with("\"\"\"");
        pos_ += multiline ? 3 : 1;

        std::string out;
        while (true) {
            if (at_end()) fail("unterminated string");
            if (multiline && starts_with("\"\"\"")) {
                pos_ += 3;
                return out;
            }
            char c = next();
            if (!multiline && c == '"') return out;
            if (!multiline && c == '\n') fail("newline in string");
            if (c == '\\') {
                if (at_end()) fail("unterminated escape");
                char e = next();
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    case 'b': out += '\b'; break;
                    case 'f': out += '\f'; break;
                    case 'u':
                    case 'U': {
                        size_t digits = e == 'u' ? 4 : 8;
                        for (size_t i = 0; i < digits; i++) {
                            if (!std::isxdigit(static_cast<unsigned char>(peek()))) {
                                fail("invalid unicode escape");
                            }
                            pos_++;
                        }
                        out += '?';
                        break;
                    }
                    case '\n':
                        if (!multiline) fail("invalid escape");
                        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) next();
                        break;
                    default:
                        fail(std::string("invalid escape '\\") + e + "'");
                }
                continue;
            }
            out += c;
        }
    }

    std::string read_literal_string() {
        bool multiline = starts_with("'''");
        pos_ += multiline ? 3 : 1;

        std::string out;
        while (true) {
            if (at_end()) fail("unterminated string");
            if (multiline && starts_with("'''")) {
                pos_ += 3;
                return out;
            }
            char c = next();
            if (!multiline && c == '\'') return out;
            if (!multiline && c == '\n') fail("newline in string");
            out += c;
        }
    }

    void read_array(Value& value) {
        next();  // '['
        enter_nested();
        while (true) {
            skip_blank_lines();
            if (at_end()) fail("unterminated array");
            if (peek() == ']') {
                next();
                depth_--;
                return;
            }
            value.array.push_back(read_value());
            skip_blank_lines();
            if (peek() == ',') {
                next();
            } else if (peek() != ']') {
                fail("expected ',' or ']' in array");
            }
        }
    }

    void read_inline_table(Value& value) {
        next();  // '{'
        enter_nested();
        skip_spaces();
        if (peek() == '}') {
            next();
            depth_--;
            return;
        }
        while (true) {
            read_key_value(value);
            skip_spaces();
            if (at_end()) fail("unterminated inline table");
            char c = next();
            if (c == '}') {
                depth_--;
                return;
            }
            if (c != ',') fail("expected ',' or '}' in inline table");
            skip_spaces();
        }
    }

    void read_number_or_other(Value& value) {
        size_t start = pos_;
        while (!at_end()) {
            char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
                c == '_' || c == '.' || c == ':') {
                pos_++;
            } else {
                break;
            }
        }
        std::string token = text_.substr(start, pos_ - start);
        if (token.empty()) fail("expected a value");

        std::string digits;
        bool negative = false;
        size_t i = 0;
        if (token[0] == '+' || token[0] == '-') {
            negative = token[0] == '-';
            i = 1;
        }
        bool integer = i < token.size();
        for (; i < token.size(); i++) {
            char c = token[i];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digits += c;
            } else if (c == '_' && !digits.empty() && i + 1 < token.size() &&
                       std::isdigit(static_cast<unsigned char>(token[i + 1]))) {
                continue;
            } else {
                integer = false;
                break;
            }
        }

        if (integer) {
            if (digits.size() > 1 && digits[0] == '0') fail("leading zero in integer");
            try {
                value.integer = std::stoll(digits);
            } catch (const std::exception&) {
                fail("integer out of range");
            }
            if (negative) value.integer = -value.integer;
            value.kind = Value::Kind::INTEGER;
            return;
        }

        // Floats, hex/octal/binary integers, dates and inf/nan. None of
        // these carry ports; accept anything that starts like a number.
        char first = token[0];
        if (std::isdigit(static_cast<unsigned char>(first)) || first == '+' || first == '-' ||
            token == "inf" || token == "nan") {
            value.kind = Value::Kind::OTHER;
            return;
        }
        fail("invalid value '" + token + "'");
    }
};

} // namespace

PortSet parse_listen_ports(const std::string& config_text) {
    Value root = TomlReader(config_text).read_document();

    PortSet ports;
    auto files = root.table.find("files");
    if (files == root.table.end()) {
        return ports;
    }
    if (files->second.kind != Value::Kind::ARRAY) {
        throw ConfigParseError("'files' must be an array of tables", files->second.line);
    }

    for (const auto& file : files->second.array) {
        if (file.kind != Value::Kind::TABLE) {
            throw ConfigParseError("'files' entries must be tables", file.line);
        }
        auto kind = file.table.find("kind");
        if (kind == file.table.end() || kind->second.kind != Value::Kind::STRING) {
            throw ConfigParseError("file entry without a 'kind' string", file.line);
        }
        if (kind->second.str != "listen") {
            continue;
        }

        auto port = file.table.find("port");
        if (port == file.table.end()) {
            throw ConfigParseError("listen entry without a 'port'", file.line);
        }
        if (port->second.kind != Value::Kind::INTEGER ||
            port->second.integer < 0 || port->second.integer > 65535) {
            throw ConfigParseError("listen 'port' must be an integer between 0 and 65535",
                                   port->second.line);
        }
        ports.insert(static_cast<uint16_t>(port->second.integer));
    }
    return ports;
}

PortSet find_illegal_ports(const PortSet& ports, const PortRange& range) {
    PortSet illegal;
    for (uint16_t port : ports) {
        if (!range.contains(port)) {
            illegal.insert(port);
        }
    }
    return illegal;
}

std::string format_ports(const PortSet& ports) {
    std::ostringstream out;
    bool first = true;
    for (uint16_t port : ports) {
        if (!first) out << ", ";
        out << port;
        first = false;
    }
    return out.str();
}

PortSet PortRegistry::try_reserve(const PortSet& ports, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    PortSet conflicts;
    for (uint16_t port : ports) {
        if (held_.count(port)) {
            conflicts.insert(port);
        }
    }
    if (!conflicts.empty()) {
        return conflicts;
    }

    for (uint16_t port : ports) {
        held_[port] = owner;
    }
    return conflicts;
}

void PortRegistry::release(const PortSet& ports) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint16_t port : ports) {
        held_.erase(port);
    }
}

bool PortRegistry::is_held(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(port) > 0;
}

std::string PortRegistry::owner_of(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(port);
    return it == held_.end() ? std::string() : it->second;
}

size_t PortRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

} // namespace benefice
