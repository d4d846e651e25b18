#pragma once

#include <string>
#include <map>
#include <cstddef>

namespace benefice {

// Headers of a single part in multipart form data
struct MultipartPart {
    std::map<std::string, std::string> headers;   // Keys lower-cased
    std::string name;
    std::string filename;
    std::string content_type;
    bool has_content_type = false;
};

// Incremental multipart/form-data parser. Bytes are fed as they arrive;
// part bodies are handed to the handler in pieces and never buffered
// beyond one delimiter length.
class MultipartStreamParser {
public:
    class Handler {
    public:
        virtual ~Handler() = default;

        // Returning false from any callback aborts the parse
        virtual bool on_part_begin(const MultipartPart& part) = 0;
        virtual bool on_part_data(const char* data, size_t len) = 0;
        virtual bool on_part_end() = 0;
    };

    MultipartStreamParser(const std::string& boundary, Handler& handler);

    // Returns false once the input is malformed or the handler aborted
    bool feed(const char* data, size_t len);

    // The closing delimiter has been seen
    bool done() const { return state_ == State::DONE; }
    // A handler callback refused the input, as opposed to malformed input
    bool aborted() const { return aborted_; }
    const std::string& error() const { return error_; }

    static std::string extract_boundary(const std::string& content_type);

private:
    enum class State {
        PREAMBLE,
        AFTER_DELIMITER,
        HEADERS,
        BODY,
        DONE,
        FAILED
    };

    Handler& handler_;
    std::string delimiter_;
    std::string buffer_;
    State state_ = State::PREAMBLE;
    bool aborted_ = false;
    std::string error_;

    bool fail(const std::string& message);
    bool abort();
    static bool parse_headers(const std::string& section, MultipartPart& part);
};

} // namespace benefice
