#include "multipart.h"
#include "constants.h"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace benefice {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

MultipartStreamParser::MultipartStreamParser(const std::string& boundary, Handler& handler)
    : handler_(handler), delimiter_("\r\n--" + boundary) {
    // The first delimiter may open the body without a preceding CRLF
    buffer_ = "\r\n";
    if (boundary.empty()) {
        fail("empty boundary");
    }
}

bool MultipartStreamParser::fail(const std::string& message) {
    state_ = State::FAILED;
    error_ = message;
    buffer_.clear();
    return false;
}

bool MultipartStreamParser::abort() {
    aborted_ = true;
    return fail("aborted by handler");
}

bool MultipartStreamParser::feed(const char* data, size_t len) {
    if (state_ == State::FAILED) return false;
    if (state_ == State::DONE) return true;  // Epilogue is ignored

    buffer_.append(data, len);
    const size_t keep = delimiter_.size() - 1;

    while (true) {
        switch (state_) {
            case State::PREAMBLE: {
                size_t pos = buffer_.find(delimiter_);
                if (pos == std::string::npos) {
                    if (buffer_.size() > keep) buffer_.erase(0, buffer_.size() - keep);
                    return true;
                }
                buffer_.erase(0, pos + delimiter_.size());
                state_ = State::AFTER_DELIMITER;
                break;
            }

            case State::AFTER_DELIMITER: {
                if (buffer_.size() < 2) return true;
                if (buffer_.compare(0, 2, "--") == 0) {
                    state_ = State::DONE;
                    buffer_.clear();
                    return true;
                }
                if (buffer_[0] == ' ' || buffer_[0] == '\t') {
                    buffer_.erase(0, 1);  // Transport padding
                    break;
                }
                if (buffer_.compare(0, 2, "\r\n") != 0) {
                    return fail("malformed delimiter line");
                }
                buffer_.erase(0, 2);
                state_ = State::HEADERS;
                break;
            }

            case State::HEADERS: {
                std::string section;
                if (buffer_.size() >= 2 && buffer_.compare(0, 2, "\r\n") == 0) {
                    buffer_.erase(0, 2);  // Part without headers
                } else {
                    size_t end = buffer_.find("\r\n\r\n");
                    if (end == std::string::npos) {
                        if (buffer_.size() > MAX_PART_HEADER_SIZE) {
                            return fail("part headers too large");
                        }
                        return true;
                    }
                    section = buffer_.substr(0, end);
                    buffer_.erase(0, end + 4);
                }

                MultipartPart part;
                if (!parse_headers(section, part)) {
                    return fail("malformed part headers");
                }
                if (!handler_.on_part_begin(part)) return abort();
                state_ = State::BODY;
                break;
            }

            case State::BODY: {
                size_t pos = buffer_.find(delimiter_);
                if (pos == std::string::npos) {
                    if (buffer_.size() > keep) {
                        size_t emit = buffer_.size() - keep;
                        if (!handler_.on_part_data(buffer_.data(), emit)) return abort();
                        buffer_.erase(0, emit);
                    }
                    return true;
                }
                if (pos > 0 && !handler_.on_part_data(buffer_.data(), pos)) return abort();
                if (!handler_.on_part_end()) return abort();
                buffer_.erase(0, pos + delimiter_.size());
                state_ = State::AFTER_DELIMITER;
                break;
            }

            case State::DONE:
                buffer_.clear();
                return true;

            case State::FAILED:
                return false;
        }
    }
}

std::string MultipartStreamParser::extract_boundary(const std::string& content_type) {
    if (lower(content_type).rfind("multipart/form-data", 0) != 0) return "";

    std::string boundary_prefix = "boundary=";
    size_t pos = lower(content_type).find(boundary_prefix);
    if (pos == std::string::npos) return "";

    pos += boundary_prefix.length();
    size_t end = content_type.find(';', pos);
    if (end == std::string::npos) end = content_type.length();

    // Remove quotes if present
    return unquote(trim(content_type.substr(pos, end - pos)));
}

bool MultipartStreamParser::parse_headers(const std::string& section, MultipartPart& part) {
    std::istringstream headers_stream(section);
    std::string line;
    while (std::getline(headers_stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos) return false;

        std::string key = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        part.headers[key] = value;

        if (key == "content-type") {
            part.content_type = value;
            part.has_content_type = true;
        } else if (key == "content-disposition") {
            // form-data; name="wasm"; filename="app.wasm"
            std::istringstream params(value);
            std::string param;
            while (std::getline(params, param, ';')) {
                param = trim(param);
                size_t eq = param.find('=');
                if (eq == std::string::npos) continue;
                std::string pkey = lower(trim(param.substr(0, eq)));
                std::string pvalue = unquote(trim(param.substr(eq + 1)));
                if (pkey == "name") {
                    part.name = pvalue;
                } else if (pkey == "filename") {
                    part.filename = pvalue;
                }
            }
        }
    }
    return true;
}

} // namespace benefice
