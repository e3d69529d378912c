#include "network/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <sstream>

namespace {

using tcp = asio::ip::tcp;
using ssl_stream = asio::ssl::stream<tcp::socket>;

// Blocking waits run the io_context in slices this long and check the
// cancellation token in between.
constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr size_t kMaxHeaderBytes = 64 * 1024;
constexpr size_t kReadChunk = 32 * 1024;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool is_eof(const asio::error_code& ec) {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

bool is_redirect(int code) {
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

class AsioHttpResponse : public HttpResponse {
public:
    AsioHttpResponse(Url url, const HttpConfig& config, CancellationToken token)
        : url_(std::move(url)), config_(config), token_(std::move(token)), resolver_(io_) {}

    ~AsioHttpResponse() override {
        asio::error_code ignored;
        if (tls_ || plain_) lowest().close(ignored);
    }

    void open() {
        create_stream();
        connect();
        if (tls_) handshake();
        send_request();
        read_head();
    }

    int status_code() const override { return status_code_; }
    const std::string& reason() const override { return reason_; }
    std::optional<uint64_t> content_length() const override { return content_length_; }

    std::optional<std::string> header(const std::string& name) const override {
        auto it = headers_.find(to_lower(name));
        if (it == headers_.end()) return std::nullopt;
        return it->second;
    }

    size_t read_some(char* out, size_t len) override {
        if (finished_ || len == 0) return 0;

        switch (mode_) {
            case BodyMode::None:
                finished_ = true;
                return 0;

            case BodyMode::Chunked:
                return read_chunked(out, len);

            case BodyMode::Length: {
                if (remaining_ == 0) {
                    finished_ = true;
                    return 0;
                }
                size_t want = static_cast<size_t>(std::min<uint64_t>(len, remaining_));
                size_t n = take_pending(out, want);
                if (n == 0) n = read_direct(out, want);
                if (n == 0) {
                    throw HttpError("connection closed with " + std::to_string(remaining_) +
                                    " bytes of body outstanding");
                }
                remaining_ -= n;
                if (remaining_ == 0) finished_ = true;
                return n;
            }

            case BodyMode::UntilClose: {
                size_t n = take_pending(out, len);
                if (n == 0) n = read_direct(out, len);
                if (n == 0) finished_ = true;
                return n;
            }
        }
        return 0;
    }

private:
    enum class BodyMode { None, Length, Chunked, UntilClose };

    tcp::socket::lowest_layer_type& lowest() {
        return tls_ ? tls_->lowest_layer() : plain_->lowest_layer();
    }

    template <typename Fn>
    void with_stream(Fn&& fn) {
        if (tls_) fn(*tls_);
        else fn(*plain_);
    }

    // Runs the io_context until `done` flips. On cancellation every pending
    // operation is aborted and drained before CancelledError is thrown, so
    // no handler outlives the stack frame it captured.
    void wait(const bool& done) {
        while (!done) {
            if (token_.is_cancelled()) {
                abort();
                io_.restart();
                io_.run();
                throw CancelledError(token_.reason());
            }
            io_.run_for(kPollInterval);
            if (io_.stopped()) io_.restart();
        }
    }

    void abort() {
        resolver_.cancel();
        asio::error_code ignored;
        lowest().close(ignored);
    }

    void create_stream() {
        if (!url_.is_tls()) {
            plain_ = std::make_unique<tcp::socket>(io_);
            return;
        }

        ssl_ctx_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
        if (config_.verify_tls) {
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(asio::ssl::verify_peer);
        } else {
            ssl_ctx_->set_verify_mode(asio::ssl::verify_none);
        }
        tls_ = std::make_unique<ssl_stream>(io_, *ssl_ctx_);

        // SNI
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
            throw HttpError("failed to set TLS server name for " + url_.host);
        }
        if (config_.verify_tls) {
            tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
        }
    }

    void connect() {
        bool done = false;
        asio::error_code ec;
        tcp::resolver::results_type endpoints;
        resolver_.async_resolve(url_.host, std::to_string(url_.port),
            [&](const asio::error_code& error, tcp::resolver::results_type results) {
                ec = error;
                endpoints = std::move(results);
                done = true;
            });
        wait(done);
        if (ec) {
            throw HttpError("failed to resolve " + url_.host + ": " + ec.message());
        }

        done = false;
        asio::async_connect(lowest(), endpoints,
            [&](const asio::error_code& error, const tcp::endpoint&) {
                ec = error;
                done = true;
            });
        wait(done);
        if (ec) {
            throw HttpError("failed to connect to " + url_.host_header() + ": " + ec.message());
        }
    }

    void handshake() {
        bool done = false;
        asio::error_code ec;
        tls_->async_handshake(asio::ssl::stream_base::client,
            [&](const asio::error_code& error) {
                ec = error;
                done = true;
            });
        wait(done);
        if (ec) {
            throw HttpError("TLS handshake with " + url_.host + " failed: " + ec.message());
        }
    }

    void send_request() {
        std::ostringstream req;
        req << "GET " << url_.target << " HTTP/1.1\r\n"
            << "Host: " << url_.host_header() << "\r\n"
            << "User-Agent: " << config_.user_agent << "\r\n"
            << "Accept: */*\r\n"
            << "Accept-Encoding: identity\r\n"
            << "Connection: close\r\n\r\n";
        const std::string request = req.str();

        bool done = false;
        asio::error_code ec;
        with_stream([&](auto& stream) {
            asio::async_write(stream, asio::buffer(request),
                [&](const asio::error_code& error, size_t) {
                    ec = error;
                    done = true;
                });
        });
        wait(done);
        if (ec) {
            throw HttpError("failed to send request: " + ec.message());
        }
    }

    void read_head() {
        bool done = false;
        asio::error_code ec;
        size_t head_len = 0;
        with_stream([&](auto& stream) {
            asio::async_read_until(stream, asio::dynamic_buffer(pending_, kMaxHeaderBytes), "\r\n\r\n",
                [&](const asio::error_code& error, size_t n) {
                    ec = error;
                    head_len = n;
                    done = true;
                });
        });
        wait(done);
        if (ec == asio::error::not_found) {
            throw HttpError("response headers exceed " + std::to_string(kMaxHeaderBytes) + " bytes");
        }
        if (ec) {
            throw HttpError("failed to read response headers: " + ec.message());
        }

        std::string head = pending_.substr(0, head_len);
        pending_.erase(0, head_len);
        parse_head(head);
    }

    void parse_head(const std::string& head) {
        std::istringstream in(head);
        std::string line;
        if (!std::getline(in, line)) {
            throw HttpError("empty response");
        }
        line = trim(line);
        // HTTP/1.1 200 OK
        std::istringstream status(line);
        std::string version;
        status >> version >> status_code_;
        if (version.rfind("HTTP/", 0) != 0 || status.fail()) {
            throw HttpError("malformed status line: " + line);
        }
        std::getline(status, reason_);
        reason_ = trim(reason_);

        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty()) continue;
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            headers_[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }

        if (status_code_ == 204 || status_code_ == 304 || (status_code_ >= 100 && status_code_ < 200)) {
            mode_ = BodyMode::None;
            return;
        }
        auto te = header("transfer-encoding");
        if (te && to_lower(*te).find("chunked") != std::string::npos) {
            mode_ = BodyMode::Chunked;
            return;
        }
        if (auto cl = header("content-length")) {
            try {
                content_length_ = std::stoull(*cl);
            } catch (const std::exception&) {
                throw HttpError("invalid Content-Length: " + *cl);
            }
            remaining_ = *content_length_;
            mode_ = BodyMode::Length;
            return;
        }
        mode_ = BodyMode::UntilClose;
    }

    size_t take_pending(char* out, size_t len) {
        size_t n = std::min(len, pending_.size());
        if (n == 0) return 0;
        std::memcpy(out, pending_.data(), n);
        pending_.erase(0, n);
        return n;
    }

    // Reads straight into the caller's buffer. Returns 0 at end of stream.
    size_t read_direct(char* out, size_t len) {
        if (eof_) return 0;
        bool done = false;
        asio::error_code ec;
        size_t got = 0;
        with_stream([&](auto& stream) {
            stream.async_read_some(asio::buffer(out, len),
                [&](const asio::error_code& error, size_t n) {
                    ec = error;
                    got = n;
                    done = true;
                });
        });
        wait(done);
        if (ec) {
            if (is_eof(ec)) {
                eof_ = true;
                return got;
            }
            throw HttpError(ec.message());
        }
        return got;
    }

    // Appends more raw bytes to pending_. Returns false at end of stream.
    bool fill() {
        size_t got = read_direct(scratch_.data(), scratch_.size());
        if (got == 0) return false;
        pending_.append(scratch_.data(), got);
        return true;
    }

    std::optional<std::string> read_line() {
        size_t pos;
        while ((pos = pending_.find("\r\n")) == std::string::npos) {
            if (!fill()) return std::nullopt;
        }
        std::string line = pending_.substr(0, pos);
        pending_.erase(0, pos + 2);
        return line;
    }

    size_t read_chunked(char* out, size_t len) {
        if (chunk_remaining_ == 0) {
            if (chunk_crlf_pending_) {
                if (!read_line()) throw HttpError("connection closed inside chunked body");
                chunk_crlf_pending_ = false;
            }
            auto size_line = read_line();
            if (!size_line) throw HttpError("connection closed inside chunked body");
            std::string size_text = *size_line;
            size_t semi = size_text.find(';');
            if (semi != std::string::npos) size_text.erase(semi);
            size_text = trim(size_text);
            try {
                chunk_remaining_ = std::stoull(size_text, nullptr, 16);
            } catch (const std::exception&) {
                throw HttpError("malformed chunk header: " + *size_line);
            }
            if (chunk_remaining_ == 0) {
                // Trailer section, terminated by an empty line or connection close.
                for (auto trailer = read_line(); trailer && !trailer->empty(); trailer = read_line()) {
                }
                finished_ = true;
                return 0;
            }
        }

        if (pending_.empty() && !fill()) {
            throw HttpError("connection closed inside chunked body");
        }
        size_t n = static_cast<size_t>(std::min<uint64_t>(std::min(len, pending_.size()), chunk_remaining_));
        std::memcpy(out, pending_.data(), n);
        pending_.erase(0, n);
        chunk_remaining_ -= n;
        if (chunk_remaining_ == 0) chunk_crlf_pending_ = true;
        return n;
    }

    Url url_;
    HttpConfig config_;
    CancellationToken token_;

    asio::io_context io_;
    tcp::resolver resolver_;
    std::unique_ptr<asio::ssl::context> ssl_ctx_;
    std::unique_ptr<tcp::socket> plain_;
    std::unique_ptr<ssl_stream> tls_;

    int status_code_ = 0;
    std::string reason_;
    std::map<std::string, std::string> headers_;
    std::optional<uint64_t> content_length_;

    BodyMode mode_ = BodyMode::UntilClose;
    std::string pending_;
    std::array<char, kReadChunk> scratch_{};
    uint64_t remaining_ = 0;
    uint64_t chunk_remaining_ = 0;
    bool chunk_crlf_pending_ = false;
    bool eof_ = false;
    bool finished_ = false;
};

} // namespace

Url Url::parse(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw HttpError("invalid URL (missing scheme): " + url);
    }
    Url out;
    out.scheme = to_lower(url.substr(0, scheme_end));
    if (out.scheme != "http" && out.scheme != "https") {
        throw HttpError("unsupported URL scheme: " + out.scheme);
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, authority_end == std::string::npos
                                                            ? std::string::npos
                                                            : authority_end - authority_start);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) throw HttpError("invalid URL host: " + url);
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }
    if (out.host.empty()) {
        throw HttpError("invalid URL (empty host): " + url);
    }

    out.port = out.is_tls() ? 443 : 80;
    if (!port_text.empty()) {
        try {
            unsigned long port = std::stoul(port_text);
            if (port == 0 || port > 65535) throw std::out_of_range("port");
            out.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            throw HttpError("invalid URL port: " + port_text);
        }
    }

    std::string target = authority_end == std::string::npos ? "" : url.substr(authority_end);
    size_t fragment = target.find('#');
    if (fragment != std::string::npos) target.erase(fragment);
    if (target.empty() || target.front() != '/') target.insert(0, "/");
    out.target = target;
    return out;
}

Url Url::resolve(const std::string& location) const {
    if (location.find("://") != std::string::npos) {
        return parse(location);
    }
    if (location.rfind("//", 0) == 0) {
        return parse(scheme + ":" + location);
    }
    Url next = *this;
    if (!location.empty() && location.front() == '/') {
        next.target = location;
    } else {
        std::string path = target.substr(0, target.find('?'));
        next.target = path.substr(0, path.rfind('/') + 1) + location;
    }
    return next;
}

std::string Url::host_header() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = (is_tls() && port == 443) || (!is_tls() && port == 80);
    if (!default_port) h += ":" + std::to_string(port);
    return h;
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

std::string HttpResponse::status_line() const {
    return reason().empty() ? std::to_string(status_code())
                            : std::to_string(status_code()) + " " + reason();
}

std::string HttpTransport::fetch_text(const std::string& url, const CancellationToken& token,
                                      size_t max_bytes) {
    auto response = get(url, token);
    if (!response->ok()) {
        throw HttpError("server returned " + response->status_line());
    }

    std::string body;
    std::array<char, 8192> buf;
    while (size_t n = response->read_some(buf.data(), buf.size())) {
        body.append(buf.data(), n);
        if (body.size() > max_bytes) {
            throw HttpError("response larger than " + std::to_string(max_bytes) + " bytes");
        }
    }
    return body;
}

AsioHttpTransport::AsioHttpTransport(HttpConfig config) : config_(std::move(config)) {}

std::unique_ptr<HttpResponse> AsioHttpTransport::get(const std::string& url,
                                                     const CancellationToken& token) {
    Url current = Url::parse(url);
    for (int hop = 0;; ++hop) {
        auto response = open(current, token);
        if (!is_redirect(response->status_code())) {
            return response;
        }
        auto location = response->header("location");
        if (!location || location->empty()) {
            return response;
        }
        if (hop >= config_.max_redirects) {
            throw HttpError("stopped after " + std::to_string(config_.max_redirects) + " redirects");
        }
        Url next = current.resolve(*location);
        LOG_DEBUG("Following ", response->status_code(), " redirect from ", current.to_string(),
                  " to ", next.to_string());
        current = next;
    }
}

std::unique_ptr<HttpResponse> AsioHttpTransport::open(const Url& url, const CancellationToken& token) {
    auto response = std::make_unique<AsioHttpResponse>(url, config_, token);
    response->open();
    return response;
}
