#include <http.hxx>
#include <log.hxx>
#include <url.hxx>
#include <util.hxx>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <charconv>
#include <memory>
#include <optional>
#include <sstream>

#include <netdb.h>
#include <unistd.h>
#include <sys/socket.h>

#include <version.h>

using platform_socket_t = int;

inline int socket_close(const platform_socket_t s)
{
    return close(s);
}

static std::string ssl_error_string()
{
    const auto code = ERR_get_error();
    if (!code)
        return "unknown error";

    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

static int read_until(http::HttpTransport &transport, std::string &dst, const char *delim)
{
    char buf[1024];

    while (dst.find(delim) == std::string::npos)
    {
        const auto len = transport.read(buf, sizeof(buf));
        if (len <= 0)
        {
            Error("connection closed while reading response.");
            return 1;
        }

        dst.append(buf, len);
    }

    return 0;
}

static int read_at_least(http::HttpTransport &transport, std::string &dst, const std::size_t count)
{
    char buf[4096];

    while (dst.size() < count)
    {
        const auto len = transport.read(buf, sizeof(buf));
        if (len <= 0)
        {
            Error("connection closed while reading response body.");
            return 1;
        }

        dst.append(buf, len);
    }

    return 0;
}

static int write_body(std::ostream *body, const char *buf, const std::size_t len)
{
    if (!body)
        return 0;

    body->write(buf, static_cast<std::streamsize>(len));
    if (!*body)
    {
        Error("failed to write response body.");
        return 1;
    }

    return 0;
}

static int read_chunked(http::HttpTransport &transport, std::string data, std::ostream *body)
{
    while (true)
    {
        if (read_until(transport, data, http::EOL))
        {
            Error("truncated chunk header.");
            return 1;
        }

        const auto eol = data.find(http::EOL);
        auto size_line = Trim(data.substr(0, eol));
        if (const auto semicolon = size_line.find(';'); semicolon != std::string::npos)
            size_line.resize(semicolon);

        std::size_t size{};
        if (const auto [ptr, ec] = std::from_chars(size_line.data(), size_line.data() + size_line.size(), size, 16);
            ec != std::errc() || ptr != size_line.data() + size_line.size())
        {
            Error("invalid chunk size '", size_line, "'.");
            return 1;
        }

        data.erase(0, eol + 2);

        // trailers after the last chunk are not needed, the connection is closed anyway
        if (size == 0)
            return 0;

        if (const auto error = read_at_least(transport, data, size + 2))
            return error;

        if (const auto error = write_body(body, data.data(), size))
            return error;

        data.erase(0, size + 2);
    }
}

static void set_header_if_missing(http::HttpHeaders &headers, const std::string &key, const std::string &val)
{
    if (headers.contains(key) || headers.contains(Lower(key)))
    {
        return;
    }

    headers.emplace(key, val);
}

int http::HttpParseStatus(std::istream &stream, HttpStatusCode &status_code, std::string &status_message)
{
    std::string http_version;
    stream >> http_version;

    if (http_version != "HTTP/1.1" && http_version != "HTTP/1.0")
    {
        Error("invalid http version '", http_version, "'.");
        return 1;
    }

    if (!(stream >> status_code))
    {
        Error("invalid http status code.");
        return 1;
    }

    GetLine(stream, status_message, EOL);

    status_message = Trim(std::move(status_message));
    return 0;
}

int http::HttpParseHeaders(std::istream &stream, HttpHeaders &headers)
{
    headers.clear();

    std::string line;
    while (GetLine(stream, line, EOL))
    {
        if (line.empty())
        {
            break;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos)
        {
            continue;
        }

        auto key = line.substr(0, colon);
        auto val = line.substr(colon + 1);

        key = Trim(std::move(key));
        val = Trim(std::move(val));

        headers.emplace(Lower(std::move(key)), std::move(val));
    }
    return 0;
}

int http::HttpReadBody(HttpTransport &transport, const HttpHeaders &headers, std::string prefetch, std::ostream *body)
{
    if (const auto it = headers.find("transfer-encoding"); it != headers.end())
    {
        if (Lower(it->second).find("chunked") != std::string::npos)
        {
            return read_chunked(transport, std::move(prefetch), body);
        }
    }

    std::optional<std::size_t> content_length;
    if (const auto it = headers.find("content-length"); it != headers.end())
    {
        auto &value = it->second;

        std::size_t length{};
        if (const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            ec != std::errc() || ptr != value.data() + value.size())
        {
            Error("invalid content-length '", value, "'.");
            return 1;
        }

        content_length = length;
    }

    if (content_length.has_value() && prefetch.size() > content_length.value())
    {
        prefetch.resize(content_length.value());
    }

    if (const auto error = write_body(body, prefetch.data(), prefetch.size()))
    {
        return error;
    }

    char buf[4096];

    auto count = prefetch.size();
    while (!content_length.has_value() || count < content_length.value())
    {
        auto want = sizeof(buf);
        if (content_length.has_value())
        {
            want = std::min(want, content_length.value() - count);
        }

        const auto len = transport.read(buf, want);
        if (len <= 0)
        {
            break;
        }

        if (const auto error = write_body(body, buf, len))
        {
            return error;
        }

        count += len;
    }

    if (content_length.has_value() && count < content_length.value())
    {
        Error("connection closed after ", count, " of ", content_length.value(), " bytes.");
        return 1;
    }

    return 0;
}

struct HttpTcpTransport final : http::HttpTransport
{
    explicit HttpTcpTransport(const platform_socket_t sock)
        : sock(sock)
    {
    }

    int write(const char *buf, const std::size_t len) override
    {
        return static_cast<int>(send(sock, buf, len, 0));
    }

    int read(char *buf, const std::size_t len) override
    {
        return static_cast<int>(recv(sock, buf, len, 0));
    }

    platform_socket_t sock;
};

struct HttpTlsTransport final : http::HttpTransport
{
    explicit HttpTlsTransport(SSL *ssl)
        : ssl(ssl)
    {
    }

    int write(const char *buf, const std::size_t len) override
    {
        return SSL_write(ssl, buf, static_cast<int>(len));
    }

    int read(char *buf, const std::size_t len) override
    {
        return SSL_read(ssl, buf, static_cast<int>(len));
    }

    SSL *ssl;
};

struct HttpConnection
{
    HttpConnection() = default;

    HttpConnection(const HttpConnection &) = delete;
    HttpConnection &operator=(const HttpConnection &) = delete;

    ~HttpConnection()
    {
        if (Ssl)
        {
            SSL_free(Ssl);
        }

        if (Socket >= 0)
        {
            socket_close(Socket);
        }
    }

    platform_socket_t Socket = -1;
    SSL *Ssl = nullptr;
};

struct http::HttpClient::State
{
    SSL_CTX *SslCtx;
};

http::HttpClient::HttpClient()
{
    m_State = new State();

    SSL_library_init();
    SSL_load_error_strings();
    OpenSSL_add_ssl_algorithms();

    m_State->SslCtx = SSL_CTX_new(TLS_client_method());
    if (m_State->SslCtx)
    {
        SSL_CTX_set_min_proto_version(m_State->SslCtx, TLS1_2_VERSION);
        SSL_CTX_set_default_verify_paths(m_State->SslCtx);
    }
}

http::HttpClient::~HttpClient()
{
    if (m_State->SslCtx)
    {
        SSL_CTX_free(m_State->SslCtx);
    }
    EVP_cleanup();

    delete m_State;
    m_State = nullptr;
}

int http::HttpClient::Request(HttpRequest request, HttpResponse &response)
{
    return Request(std::move(request), response, 0);
}

int http::HttpClient::Request(HttpRequest request, HttpResponse &response, const int redirects)
{
    auto service = std::to_string(request.Location.Port);

    addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    if (const auto error = getaddrinfo(request.Location.Host.c_str(), service.c_str(), &hints, &res))
    {
        Error("failed to resolve ", request.Location.Host, ": ", gai_strerror(error));
        return 1;
    }

    HttpConnection connection;

    for (auto it = res; it; it = it->ai_next)
    {
        connection.Socket = socket(it->ai_family, it->ai_socktype, it->ai_protocol);
        if (connection.Socket < 0)
        {
            continue;
        }

        if (connect(connection.Socket, it->ai_addr, it->ai_addrlen))
        {
            socket_close(connection.Socket);
            connection.Socket = -1;
            continue;
        }

        break;
    }

    freeaddrinfo(res);

    if (connection.Socket < 0)
    {
        Error("failed to connect to ", request.Location.Host, ":", request.Location.Port, ".");
        return 1;
    }

    std::unique_ptr<HttpTransport> transport;

    if (request.Location.UseTLS)
    {
        if (!m_State->SslCtx)
        {
            Error("TLS is unavailable: ", ssl_error_string());
            return 1;
        }

        connection.Ssl = SSL_new(m_State->SslCtx);
        SSL_set_fd(connection.Ssl, connection.Socket);

        SSL_set_tlsext_host_name(connection.Ssl, request.Location.Host.c_str());
        SSL_set1_host(connection.Ssl, request.Location.Host.c_str());
        SSL_set_verify(connection.Ssl, SSL_VERIFY_PEER, nullptr);

        if (SSL_connect(connection.Ssl) <= 0)
        {
            Error("TLS handshake with ", request.Location.Host, " failed: ", ssl_error_string());
            return 1;
        }

        if (SSL_get_verify_result(connection.Ssl) != X509_V_OK)
        {
            Error("TLS certificate verification for ", request.Location.Host, " failed.");
            return 1;
        }

        transport = std::make_unique<HttpTlsTransport>(connection.Ssl);
    }
    else
    {
        transport = std::make_unique<HttpTcpTransport>(connection.Socket);
    }

    set_header_if_missing(request.Headers, "Host", request.Location.Host);
    set_header_if_missing(request.Headers, "Connection", "close");
    set_header_if_missing(request.Headers, "Accept-Encoding", "identity");
    set_header_if_missing(request.Headers, "User-Agent", std::string(PROJECT_NAME) + "/" + PROJECT_VERSION);

    std::stringstream packet;
    packet << request.Method << ' ' << request.Location.Pathname << ' ' << "HTTP/1.1" << EOL;
    for (auto &[key, val] : request.Headers)
    {
        packet << key << ": " << val << EOL;
    }
    packet << EOL;

    const auto packet_string = packet.str();
    if (transport->write(packet_string.data(), packet_string.size()) < 0)
    {
        Error("failed to send request to ", request.Location.Host, ".");
        return 1;
    }

    std::string header_block;
    if (const auto error = read_until(*transport, header_block, EOL2))
    {
        return error;
    }

    const auto headers_end = header_block.find(EOL2);
    // keep the final EOL so every header line is terminated
    const auto headers = header_block.substr(0, headers_end + 2);
    auto body_prefetch = header_block.substr(headers_end + 4);

    std::istringstream headers_stream(headers);

    std::string status_line;
    GetLine(headers_stream, status_line, EOL);

    std::istringstream status_stream(status_line);
    if (const auto error = HttpParseStatus(status_stream, response.StatusCode, response.StatusMessage))
    {
        return error;
    }

    if (const auto error = HttpParseHeaders(headers_stream, response.Headers))
    {
        return error;
    }

    if (is_redirect(response.StatusCode))
    {
        if (!response.Headers.contains("location"))
        {
            Error("missing location header in redirect response.");
            return 1;
        }

        if (redirects >= MAX_REDIRECTS)
        {
            Error("too many redirects.");
            return 1;
        }

        auto location = response.Headers.at("location");

        if (location.find("://") != std::string::npos)
        {
            if (!ParseUrl(request.Location, location))
            {
                Error("invalid redirect location '", location, "'.");
                return 1;
            }
        }
        else if (location.starts_with("/"))
        {
            request.Location.Pathname = location;
        }
        else
        {
            const auto slash = request.Location.Pathname.rfind('/');
            request.Location.Pathname = request.Location.Pathname.substr(0, slash + 1) + location;
        }

        request.Headers.erase("Host");

        Debug("redirect to ", request.Location);
        return Request(std::move(request), response, redirects + 1);
    }

    return HttpReadBody(*transport, response.Headers, std::move(body_prefetch), response.ok() ? response.Body : nullptr);
}

std::ostream &http::operator<<(std::ostream &stream, const HttpMethod method)
{
    static const std::map<http::HttpMethod, const char *> map = {
        { http::HttpMethod::Get, "GET" },
    };

    return stream << map.at(method);
}

std::ostream &http::operator<<(std::ostream &stream, const HttpStatusCode status_code)
{
    return stream << static_cast<int>(status_code);
}

std::istream &http::operator>>(std::istream &stream, HttpStatusCode &status_code)
{
    int status_code_int;
    if (stream >> status_code_int)
    {
        status_code = static_cast<http::HttpStatusCode>(status_code_int);
    }
    return stream;
}

std::ostream &http::operator<<(std::ostream &stream, const HttpLocation &location)
{
    return stream
           << (location.UseTLS ? "https" : "http")
           << "://"
           << location.Host
           << ":"
           << location.Port
           << location.Pathname;
}
