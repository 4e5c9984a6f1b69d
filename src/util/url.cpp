#include <kunai/url.hpp>

#include <curl/curl.h>
#include <memory>

namespace kunai {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
    void operator()(char* s) const { curl_free(s); }
};
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

// Spaces are percent-encoded rather than rejected, as browsers do
constexpr unsigned int kParseFlags =
    CURLU_NON_SUPPORT_SCHEME | CURLU_ALLOW_SPACE | CURLU_URLENCODE;

struct UrlParts {
    std::string normalized;
    std::string scheme;
    std::string host;
    std::string path;
};

// Fetch one part of a parsed handle; missing optional parts yield ""
std::string get_part(CURLU* h, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(h, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return "";
    }
    CurlString owned(raw);
    return std::string(owned.get());
}

Result<UrlParts> read_parts(CURLU* h, const std::string& original) {
    char* raw = nullptr;
    CURLUcode rc = curl_url_get(h, CURLUPART_URL, &raw, 0);
    if (rc != CURLUE_OK || raw == nullptr) {
        return KunaiError{KunaiError::InvalidUrl,
            "'" + original + "' is not a valid URL: " + curl_url_strerror(rc)};
    }
    CurlString normalized(raw);

    UrlParts parts;
    parts.normalized = normalized.get();
    parts.scheme = get_part(h, CURLUPART_SCHEME);
    parts.host = get_part(h, CURLUPART_HOST);
    parts.path = get_part(h, CURLUPART_PATH);
    return Result<UrlParts>::ok(std::move(parts));
}

} // namespace

Result<Url> Url::parse(const std::string& text) {
    CurlUrlHandle h(curl_url());
    if (!h) {
        return KunaiError{KunaiError::IO, "curl_url() allocation failed"};
    }

    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, text.c_str(), kParseFlags);
    if (rc != CURLUE_OK) {
        return KunaiError{KunaiError::InvalidUrl,
            "'" + text + "' is not a valid URL: " + curl_url_strerror(rc)};
    }

    auto parts = read_parts(h.get(), text);
    if (parts.is_err()) return std::move(parts).error();

    auto& p = parts.value();
    return Result<Url>::ok(Url(std::move(p.normalized), std::move(p.scheme),
                               std::move(p.host), std::move(p.path)));
}

std::vector<std::string> Url::path_segments() const {
    std::vector<std::string> segments;
    if (path_.empty() || path_[0] != '/') return segments;

    size_t start = 1;
    while (true) {
        size_t slash = path_.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path_.substr(start));
            break;
        }
        segments.push_back(path_.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

Result<Url> Url::with_path(const std::string& new_path) const {
    CurlUrlHandle h(curl_url());
    if (!h) {
        return KunaiError{KunaiError::IO, "curl_url() allocation failed"};
    }

    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, normalized_.c_str(), kParseFlags);
    if (rc == CURLUE_OK) rc = curl_url_set(h.get(), CURLUPART_PATH, new_path.c_str(), 0);
    if (rc == CURLUE_OK) rc = curl_url_set(h.get(), CURLUPART_QUERY, nullptr, 0);
    if (rc == CURLUE_OK) rc = curl_url_set(h.get(), CURLUPART_FRAGMENT, nullptr, 0);
    if (rc != CURLUE_OK) {
        return KunaiError{KunaiError::InvalidUrl,
            "cannot set path '" + new_path + "' on '" + normalized_ + "': " +
            curl_url_strerror(rc)};
    }

    auto parts = read_parts(h.get(), normalized_);
    if (parts.is_err()) return std::move(parts).error();

    auto& p = parts.value();
    return Result<Url>::ok(Url(std::move(p.normalized), std::move(p.scheme),
                               std::move(p.host), std::move(p.path)));
}

} // namespace kunai
