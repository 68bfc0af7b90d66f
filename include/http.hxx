#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <ostream>
#include <string>

namespace http
{
    constexpr auto EOL = "\r\n";
    constexpr auto EOL2 = "\r\n\r\n";

    constexpr auto MAX_REDIRECTS = 10;

    enum class HttpMethod
    {
        Get,
    };

    enum class HttpStatusCode : int
    {
        OK = 200,

        MovedPermanently = 301,
        Found = 302,
        SeeOther = 303,
        NotModified = 304,
        TemporaryRedirect = 307,
        PermanentRedirect = 308,

        BadRequest = 400,
        Unauthorized = 401,
        Forbidden = 403,
        NotFound = 404,

        InternalServerError = 500,
        BadGateway = 502,
        ServiceUnavailable = 503,
    };

    inline bool is_success(HttpStatusCode status_code) { return 200 <= static_cast<int>(status_code) && static_cast<int>(status_code) <= 299; }
    inline bool is_redirect(HttpStatusCode status_code) { return 300 <= static_cast<int>(status_code) && static_cast<int>(status_code) <= 399; }

    struct HttpLocation
    {
        bool UseTLS{};
        std::string Host;
        std::uint16_t Port{};
        std::string Pathname;
    };

    using HttpHeaders = std::map<std::string, std::string>;

    struct HttpRequest
    {
        HttpMethod Method{};
        HttpLocation Location;
        HttpHeaders Headers;
    };

    struct HttpResponse
    {
        [[nodiscard]] bool ok() const { return is_success(StatusCode); }

        HttpStatusCode StatusCode{};
        std::string StatusMessage;
        HttpHeaders Headers;
        std::ostream *Body{};
    };

    struct HttpTransport
    {
        virtual ~HttpTransport() = default;

        virtual int write(const char *buf, std::size_t len) = 0;
        virtual int read(char *buf, std::size_t len) = 0;
    };

    int HttpParseStatus(std::istream &stream, HttpStatusCode &status_code, std::string &status_message);
    int HttpParseHeaders(std::istream &stream, HttpHeaders &headers);

    /**
     * Reads the response body following the header block. `prefetch` holds
     * bytes already read past the header block. Handles chunked transfer
     * encoding, content-length and close-delimited bodies. `body` may be null
     * to discard the payload.
     */
    int HttpReadBody(HttpTransport &transport, const HttpHeaders &headers, std::string prefetch, std::ostream *body);

    class HttpClient
    {
    public:
        HttpClient();
        ~HttpClient();

        HttpClient(const HttpClient &) = delete;
        HttpClient &operator=(const HttpClient &) = delete;

        int Request(HttpRequest request, HttpResponse &response);

    private:
        int Request(HttpRequest request, HttpResponse &response, int redirects);

        struct State;
        State *m_State;
    };

    std::ostream &operator<<(std::ostream &stream, HttpMethod method);
    std::ostream &operator<<(std::ostream &stream, HttpStatusCode status_code);
    std::istream &operator>>(std::istream &stream, HttpStatusCode &status_code);
    std::ostream &operator<<(std::ostream &stream, const HttpLocation &location);
}
