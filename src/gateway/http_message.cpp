#include "gateway/http_message.hpp"

#include <charconv>
#include <algorithm>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

GateError bad_request(std::string detail) {
    return GateError{GateErrorCode::kValidation, "Bad request", std::move(detail)};
}

// RFC 9110 token 문자
bool is_token_char(char c) noexcept {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_token(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_token_char);
}

// split_lines: CRLF 구분. 끝의 빈 줄들은 버린다.
std::vector<std::string_view> split_lines(std::string_view head) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < head.size()) {
        const auto eol = head.find("\r\n", pos);
        if (eol == std::string_view::npos) {
            lines.push_back(head.substr(pos));
            break;
        }
        lines.push_back(head.substr(pos, eol - pos));
        pos = eol + 2;
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// ---------------------------------------------------------------------------
// parse_header_block
//   lines[1..] 를 HeaderList 로 변환하고 바디 길이 관련 헤더를 해석한다.
// ---------------------------------------------------------------------------
struct BodyFraming {
    std::optional<std::uint64_t> content_length{};
    bool                         transfer_coded{false};   // Transfer-Encoding 헤더 존재
    bool                         chunked{false};          // 마지막 헤더의 마지막 코딩이 chunked
};

std::expected<BodyFraming, GateError>
parse_header_block(const std::vector<std::string_view>& lines, HeaderList& out) {
    BodyFraming framing;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        if (line.empty()) {
            return std::unexpected(bad_request("empty header line"));
        }
        if (line.front() == ' ' || line.front() == '\t') {
            return std::unexpected(bad_request("obsolete header line folding"));
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return std::unexpected(bad_request("header line without ':'"));
        }
        const std::string_view name  = line.substr(0, colon);
        const std::string_view value = trim(line.substr(colon + 1));
        if (!is_token(name)) {
            return std::unexpected(bad_request(fmt::format("invalid header name '{}'", name)));
        }

        if (iequals(name, "Content-Length")) {
            const auto len = parse_u64(value);
            if (!len) {
                return std::unexpected(bad_request("invalid Content-Length"));
            }
            if (framing.content_length && *framing.content_length != *len) {
                return std::unexpected(bad_request("conflicting Content-Length headers"));
            }
            framing.content_length = len;
        } else if (iequals(name, "Transfer-Encoding")) {
            // 여러 줄이면 마지막 줄의 마지막 코딩이 최종 코딩이다
            const auto last_comma = value.rfind(',');
            const auto last = trim(last_comma == std::string_view::npos
                                       ? value
                                       : value.substr(last_comma + 1));
            framing.transfer_coded = true;
            framing.chunked        = iequals(last, "chunked");
        }

        out.emplace_back(std::string(name), std::string(value));
    }

    if (framing.transfer_coded && framing.content_length) {
        return std::unexpected(bad_request("both Transfer-Encoding and Content-Length present"));
    }
    return framing;
}

void append_headers(std::string& out, const HeaderList& headers) {
    for (const auto& [name, value] : headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// HttpRequestHead
// ---------------------------------------------------------------------------
std::expected<HttpRequestHead, GateError> HttpRequestHead::parse(std::string_view head) {
    const auto lines = split_lines(head);
    if (lines.empty()) {
        return std::unexpected(bad_request("empty request head"));
    }

    // request-line = method SP request-target SP HTTP-version
    const std::string_view request_line = lines.front();
    const auto sp1 = request_line.find(' ');
    const auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos
        || request_line.find(' ', sp2 + 1) != std::string_view::npos) {
        return std::unexpected(bad_request("malformed request line"));
    }

    HttpRequestHead req;
    req.method  = std::string(request_line.substr(0, sp1));
    req.target  = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
    req.version = std::string(request_line.substr(sp2 + 1));

    if (!is_token(req.method)) {
        return std::unexpected(bad_request("invalid method"));
    }
    if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0") {
        return std::unexpected(bad_request(fmt::format("unsupported version '{}'", req.version)));
    }
    // origin-form 만 허용 (absolute-form 은 forward proxy 용)
    if (req.target.empty() || req.target.front() != '/') {
        return std::unexpected(bad_request("request target must be origin-form"));
    }

    const auto qmark = req.target.find('?');
    if (qmark == std::string::npos) {
        req.path = req.target;
    } else {
        req.path  = req.target.substr(0, qmark);
        req.query = req.target.substr(qmark + 1);
    }

    auto framing = parse_header_block(lines, req.headers);
    if (!framing) {
        return std::unexpected(framing.error());
    }
    // RFC 9112 §6.3: 요청의 최종 코딩이 chunked 가 아니면 길이를 알 수 없다
    if (framing->transfer_coded && !framing->chunked) {
        return std::unexpected(bad_request("Transfer-Encoding without final chunked coding"));
    }
    req.content_length = framing->content_length;
    req.chunked        = framing->chunked;
    return req;
}

std::string HttpRequestHead::serialize() const {
    std::string out = fmt::format("{} {} {}\r\n", method, target, version);
    append_headers(out, headers);
    out += "\r\n";
    return out;
}

// ---------------------------------------------------------------------------
// HttpResponseHead
// ---------------------------------------------------------------------------
std::expected<HttpResponseHead, GateError> HttpResponseHead::parse(std::string_view head) {
    const auto lines = split_lines(head);
    if (lines.empty()) {
        return std::unexpected(bad_request("empty response head"));
    }

    // status-line = HTTP-version SP status-code SP [reason-phrase]
    const std::string_view status_line = lines.front();
    const auto sp1 = status_line.find(' ');
    if (sp1 == std::string_view::npos || !status_line.starts_with("HTTP/1.")) {
        return std::unexpected(bad_request("malformed status line"));
    }
    const std::string_view rest = status_line.substr(sp1 + 1);
    const std::string_view code = rest.substr(0, 3);
    const auto status = parse_u64(code);
    if (code.size() != 3 || !status || *status < 100 || *status > 599) {
        return std::unexpected(bad_request("invalid status code"));
    }

    HttpResponseHead res;
    res.version = std::string(status_line.substr(0, sp1));
    res.status  = static_cast<int>(*status);
    res.reason  = rest.size() > 4 ? std::string(rest.substr(4)) : std::string{};

    auto framing = parse_header_block(lines, res.headers);
    if (!framing) {
        return std::unexpected(framing.error());
    }
    res.content_length = framing->content_length;
    res.chunked        = framing->chunked;
    return res;
}

std::string HttpResponseHead::serialize() const {
    std::string out = fmt::format("{} {} {}\r\n", version, status, reason);
    append_headers(out, headers);
    out += "\r\n";
    return out;
}

// ---------------------------------------------------------------------------
// 헬퍼
// ---------------------------------------------------------------------------
std::optional<std::size_t> find_head_end(std::string_view buffer) noexcept {
    const auto pos = buffer.find("\r\n\r\n");
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return pos + 4;
}

void remove_header(HeaderList& headers, std::string_view name) {
    std::erase_if(headers, [name](const auto& h) { return iequals(h.first, name); });
}

void set_header(HeaderList& headers, std::string_view name, std::string value) {
    remove_header(headers, name);
    headers.emplace_back(std::string(name), std::move(value));
}

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 411: return "Length Required";
        case 413: return "Content Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

std::string make_json_response(int status, std::string_view json_body, const HeaderList& extra_headers) {
    HttpResponseHead head;
    head.status = status;
    head.reason = std::string(reason_phrase(status));
    head.headers = {
        {"Content-Type",   "application/json"},
        {"Content-Length", std::to_string(json_body.size())},
        {"Connection",     "close"},
    };
    for (const auto& [name, value] : extra_headers) {
        set_header(head.headers, name, value);
    }
    std::string out = head.serialize();
    out += json_body;
    return out;
}
