#include <kunai/json_util.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iterator>
#include <vector>

namespace kunai {

TextPosition text_position(const std::string& text, std::size_t offset) {
    TextPosition pos;
    std::size_t end = offset < text.size() ? offset : text.size();
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++pos.line;
            pos.column = 1;
        } else {
            ++pos.column;
        }
    }
    return pos;
}

TextPosition parse_error_position(const std::string& text, std::size_t error_byte) {
    return text_position(text, error_byte > 0 ? error_byte - 1 : 0);
}

namespace {

// Input iterator over a buffer that counts how many characters the parser
// has consumed so SAX callbacks can tell where they are.
class CountingIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = char;
    using difference_type = std::ptrdiff_t;
    using pointer = const char*;
    using reference = const char&;

    CountingIterator(const char* p, std::size_t* consumed)
        : p_(p), consumed_(consumed) {}

    reference operator*() const { return *p_; }
    CountingIterator& operator++() {
        ++p_;
        ++*consumed_;
        return *this;
    }
    CountingIterator operator++(int) {
        CountingIterator tmp = *this;
        ++*this;
        return tmp;
    }
    bool operator==(const CountingIterator& o) const { return p_ == o.p_; }
    bool operator!=(const CountingIterator& o) const { return p_ != o.p_; }

private:
    const char* p_;
    std::size_t* consumed_;
};

std::vector<std::string> pointer_tokens(const std::string& pointer) {
    std::vector<std::string> tokens;
    if (pointer.empty()) return tokens;

    std::size_t start = pointer[0] == '/' ? 1 : 0;
    while (true) {
        std::size_t slash = pointer.find('/', start);
        std::string raw = pointer.substr(start, slash == std::string::npos
                                                    ? std::string::npos
                                                    : slash - start);
        std::string token;
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '~' && i + 1 < raw.size()) {
                token += raw[i + 1] == '1' ? '/' : '~';
                ++i;
            } else {
                token += raw[i];
            }
        }
        tokens.push_back(std::move(token));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return tokens;
}

class PointerLocator : public nlohmann::json_sax<nlohmann::json> {
public:
    PointerLocator(const std::string& text, std::vector<std::string> target,
                   const std::size_t& consumed)
        : text_(text), target_(std::move(target)), consumed_(consumed) {}

    bool found() const { return found_; }
    std::size_t offset() const { return offset_; }

    bool null() override { return on_value(); }
    bool boolean(bool) override { return on_value(); }
    bool number_integer(number_integer_t) override { return on_value(); }
    bool number_unsigned(number_unsigned_t) override { return on_value(); }
    bool number_float(number_float_t, const string_t&) override { return on_value(); }
    bool string(string_t&) override { return on_value(); }
    bool binary(binary_t&) override { return on_value(); }

    bool start_object(std::size_t) override {
        if (!on_value()) return false;
        frames_.push_back(Frame{false, {}, 0});
        return true;
    }

    bool key(string_t& k) override {
        frames_.back().key = k;
        if (matches()) {
            found_ = true;
            offset_ = key_start();
            return false;
        }
        return true;
    }

    bool end_object() override {
        frames_.pop_back();
        return true;
    }

    bool start_array(std::size_t) override {
        if (!on_value()) return false;
        frames_.push_back(Frame{true, {}, 0});
        return true;
    }

    bool end_array() override {
        frames_.pop_back();
        return true;
    }

    bool parse_error(std::size_t, const std::string&,
                     const nlohmann::detail::exception&) override {
        return false;
    }

private:
    struct Frame {
        bool is_array;
        std::string key;
        std::size_t index;
    };

    // Array elements are addressed by index; object members by key()
    bool on_value() {
        if (!frames_.empty() && frames_.back().is_array) {
            Frame& f = frames_.back();
            f.key = std::to_string(f.index++);
            if (matches()) {
                found_ = true;
                offset_ = consumed_ > 0 ? consumed_ - 1 : 0;
                return false;
            }
        }
        return true;
    }

    bool matches() const {
        if (frames_.size() != target_.size()) return false;
        for (std::size_t i = 0; i < frames_.size(); ++i) {
            if (frames_[i].key != target_[i]) return false;
        }
        return true;
    }

    // The closing quote of the key is the last character consumed
    std::size_t key_start() const {
        if (consumed_ < 2) return 0;
        std::size_t i = consumed_ - 2;
        while (i > 0) {
            if (text_[i] == '"' && text_[i - 1] != '\\') return i;
            --i;
        }
        return 0;
    }

    const std::string& text_;
    std::vector<std::string> target_;
    const std::size_t& consumed_;
    std::vector<Frame> frames_;
    bool found_ = false;
    std::size_t offset_ = 0;
};

} // namespace

bool is_valid_utf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();

    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        unsigned char lo = 0x80, hi = 0xBF;   // range of the second byte
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (n - i < len) return false;
        if (s[i + 1] < lo || s[i + 1] > hi) return false;
        for (std::size_t k = 2; k < len; ++k) {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

TextPosition locate_json_pointer(const std::string& text, const std::string& pointer) {
    auto tokens = pointer_tokens(pointer);
    if (tokens.empty()) return TextPosition{};

    std::size_t consumed = 0;
    PointerLocator locator(text, std::move(tokens), consumed);
    CountingIterator first(text.data(), &consumed);
    CountingIterator last(text.data() + text.size(), &consumed);

    // A false return only means the locator stopped early
    (void)nlohmann::json::sax_parse(first, last, &locator);

    if (!locator.found()) return TextPosition{};
    return text_position(text, locator.offset());
}

} // namespace kunai
