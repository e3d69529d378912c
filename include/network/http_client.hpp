#ifndef ISOFETCH_HTTP_CLIENT_HPP
#define ISOFETCH_HTTP_CLIENT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "../common/cancellation.hpp"
#include "../common/config.hpp"

struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target;   // path plus query, always starts with '/'

    /**
     * @brief Splits an absolute http(s) URL.
     * @throws HttpError for anything else.
     */
    static Url parse(const std::string& url);

    // Resolves a Location header value against this URL.
    Url resolve(const std::string& location) const;

    bool is_tls() const { return scheme == "https"; }
    std::string host_header() const;
    std::string to_string() const;
};

// An open response whose body has not been consumed yet.
class HttpResponse {
public:
    virtual ~HttpResponse() = default;

    virtual int status_code() const = 0;
    virtual const std::string& reason() const = 0;
    // Known only when the server sent Content-Length.
    virtual std::optional<uint64_t> content_length() const = 0;
    virtual std::optional<std::string> header(const std::string& name) const = 0;

    /**
     * @brief Reads up to `len` body bytes.
     * @return Number of bytes copied; 0 once the body is complete.
     * @throws HttpError on transport failure or a truncated body.
     * @throws CancelledError when the token passed to get() fires.
     */
    virtual size_t read_some(char* out, size_t len) = 0;

    bool ok() const { return status_code() >= 200 && status_code() < 300; }
    std::string status_line() const;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Issues a GET and returns once the response headers are in.
     *
     * Every blocking step (resolve, connect, handshake, read) observes the
     * token, so a cancelled job stops waiting on the network promptly.
     * @throws HttpError, CancelledError
     */
    virtual std::unique_ptr<HttpResponse> get(const std::string& url,
                                              const CancellationToken& token) = 0;

    /**
     * @brief Fetches a small text resource (a checksum listing).
     * @throws HttpError if the status is not 2xx or the body exceeds `max_bytes`.
     */
    std::string fetch_text(const std::string& url, const CancellationToken& token,
                           size_t max_bytes);
};

/**
 * HTTP/1.1 client built on asio, with TLS through asio::ssl and OpenSSL.
 *
 * One connection per request (Connection: close). Redirects are followed up to
 * HttpConfig::max_redirects. Bodies may be Content-Length delimited, chunked or
 * terminated by connection close.
 */
class AsioHttpTransport : public HttpTransport {
public:
    explicit AsioHttpTransport(HttpConfig config = HttpConfig());

    std::unique_ptr<HttpResponse> get(const std::string& url,
                                      const CancellationToken& token) override;

private:
    std::unique_ptr<HttpResponse> open(const Url& url, const CancellationToken& token);

    HttpConfig config_;
};

#endif // ISOFETCH_HTTP_CLIENT_HPP
