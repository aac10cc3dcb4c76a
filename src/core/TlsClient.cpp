#include "TlsClient.hpp"
#include "Request.hpp"

#include "../helpers/RequestUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <climits>
#include <cstring>
#include <memory>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

struct SURLParts {
    std::string host;
    std::string port = "443";
    std::string path = "/";
};

// closes on scope exit
struct SSocket {
    int fd = -1;

    ~SSocket() {
        if (fd >= 0)
            close(fd);
    }
};

using UniqueAddrInfo = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;
using UniqueSSLCTX   = std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)>;
using UniqueSSL      = std::unique_ptr<SSL, decltype(&SSL_free)>;

static std::expected<SURLParts, std::string> splitURL(const std::string& url) {
    if (!url.starts_with("https://"))
        return std::unexpected(fmt::format("not an https url: {}", url));

    std::string_view rest = std::string_view{url}.substr(8);
    SURLParts        parts;

    const auto       SLASH    = rest.find('/');
    std::string_view hostPort = rest.substr(0, SLASH);
    if (SLASH != std::string_view::npos)
        parts.path = std::string{rest.substr(SLASH)};

    const auto COLON = hostPort.find(':');
    parts.host       = std::string{hostPort.substr(0, COLON)};
    if (COLON != std::string_view::npos)
        parts.port = std::string{hostPort.substr(COLON + 1)};

    if (parts.host.empty() || parts.port.empty())
        return std::unexpected(fmt::format("bad url: {}", url));

    return parts;
}

// SO_RCVTIMEO / SO_SNDTIMEO expiry shows up as one of these
static bool timedOut() {
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINPROGRESS;
}

static std::string sslError() {
    const auto CODE = ERR_get_error();
    if (CODE == 0)
        return errno == 0 ? "connection closed" : std::strerror(errno);

    char buf[256];
    ERR_error_string_n(CODE, buf, sizeof(buf));
    return buf;
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

static std::expected<std::string, std::string> decodeChunked(std::string_view body) {
    std::string decoded;

    while (true) {
        const auto CRLF = body.find("\r\n");
        if (CRLF == std::string_view::npos)
            return std::unexpected("truncated chunk header");

        // chunk extensions after ';' are ignored
        const auto SIZE_STR = NRequestUtils::trim(body.substr(0, std::min(CRLF, body.find(';'))));
        size_t     size     = 0;
        const auto RES      = std::from_chars(SIZE_STR.data(), SIZE_STR.data() + SIZE_STR.size(), size, 16);
        if (RES.ec != std::errc{} || RES.ptr != SIZE_STR.data() + SIZE_STR.size())
            return std::unexpected(fmt::format("bad chunk size \"{}\"", SIZE_STR));

        body = body.substr(CRLF + 2);

        if (size == 0)
            return decoded;

        if (body.size() < size + 2)
            return std::unexpected("truncated chunk");

        decoded.append(body.substr(0, size));
        body = body.substr(size + 2);
    }
}

std::expected<SHttpReply, std::string> NTlsClient::parseResponse(const std::string& raw) {
    const auto HEAD_END = raw.find("\r\n\r\n");
    if (HEAD_END == std::string::npos)
        return std::unexpected("truncated reply headers");

    std::string_view head       = std::string_view{raw}.substr(0, HEAD_END);
    const auto       LINE_END   = head.find("\r\n");
    std::string_view statusLine = head.substr(0, LINE_END);

    // HTTP/1.1 200 OK
    const auto SPACE = statusLine.find(' ');
    if (!statusLine.starts_with("HTTP/") || SPACE == std::string_view::npos)
        return std::unexpected(fmt::format("bad status line \"{}\"", statusLine));

    SHttpReply       reply;
    std::string_view codeStr = statusLine.substr(SPACE + 1, 3);
    const auto       RES     = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), reply.code);
    if (RES.ec != std::errc{} || reply.code < 100 || reply.code > 599)
        return std::unexpected(fmt::format("bad status line \"{}\"", statusLine));

    CHeaders headers;
    head = LINE_END == std::string_view::npos ? std::string_view{} : head.substr(LINE_END + 2);
    while (!head.empty()) {
        const auto       EOL   = head.find("\r\n");
        std::string_view line  = head.substr(0, EOL);
        const auto       COLON = line.find(':');
        if (COLON != std::string_view::npos)
            headers.add(std::string{NRequestUtils::trim(line.substr(0, COLON))}, std::string{NRequestUtils::trim(line.substr(COLON + 1))});

        if (EOL == std::string_view::npos)
            break;
        head = head.substr(EOL + 2);
    }

    std::string_view body = std::string_view{raw}.substr(HEAD_END + 4);

    if (toLower(headers.get("Transfer-Encoding").value_or("")).contains("chunked")) {
        auto decoded = decodeChunked(body);
        if (!decoded)
            return std::unexpected(decoded.error());
        reply.body = std::move(*decoded);
        return reply;
    }

    if (const auto LENGTH = headers.get("Content-Length"); LENGTH) {
        size_t     length = 0;
        const auto LRES   = std::from_chars(LENGTH->data(), LENGTH->data() + LENGTH->size(), length);
        if (LRES.ec != std::errc{})
            return std::unexpected(fmt::format("bad Content-Length \"{}\"", *LENGTH));
        if (body.size() < length)
            return std::unexpected(fmt::format("truncated body, got {} of {} bytes", body.size(), length));
        body = body.substr(0, length);
    }

    reply.body = std::string{body};
    return reply;
}

HttpOutcome NTlsClient::post(const std::string& url, const std::vector<std::pair<std::string, std::string>>& headers, const std::string& body,
                             std::chrono::milliseconds timeout, size_t maxResponseSize) {
    const auto PARTS = splitURL(url);
    if (!PARTS)
        return std::unexpected(STransportError{false, PARTS.error()});

    const auto DEADLINE = std::chrono::steady_clock::now() + timeout;

    addrinfo   hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    if (const int RET = getaddrinfo(PARTS->host.c_str(), PARTS->port.c_str(), &hints, &found); RET != 0 || !found)
        return std::unexpected(STransportError{false, fmt::format("couldn't resolve {}: {}", PARTS->host, gai_strerror(RET))});

    UniqueAddrInfo addrs(found, &freeaddrinfo);

    timeval        tv{};
    tv.tv_sec  = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;

    SSocket sock;
    bool    connectTimedOut = false;
    for (auto* ai = addrs.get(); ai; ai = ai->ai_next) {
        sock.fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock.fd < 0)
            continue;

        // also bounds connect() on linux
        setsockopt(sock.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock.fd, ai->ai_addr, ai->ai_addrlen) == 0)
            break;

        connectTimedOut = connectTimedOut || timedOut();
        close(sock.fd);
        sock.fd = -1;
    }

    if (sock.fd < 0)
        return std::unexpected(STransportError{connectTimedOut, fmt::format("couldn't connect to {}:{}", PARTS->host, PARTS->port)});

    UniqueSSLCTX ctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
    if (!ctx)
        return std::unexpected(STransportError{false, fmt::format("couldn't create a TLS context: {}", sslError())});

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1)
        return std::unexpected(STransportError{false, fmt::format("couldn't load CA certificates: {}", sslError())});

    UniqueSSL ssl(SSL_new(ctx.get()), &SSL_free);
    if (!ssl)
        return std::unexpected(STransportError{false, fmt::format("couldn't create a TLS session: {}", sslError())});

    SSL_set_fd(ssl.get(), sock.fd);
    SSL_set_tlsext_host_name(ssl.get(), PARTS->host.c_str());
    SSL_set1_host(ssl.get(), PARTS->host.c_str());

    errno = 0;
    if (SSL_connect(ssl.get()) != 1)
        return std::unexpected(STransportError{timedOut(), fmt::format("TLS handshake with {} failed: {}", PARTS->host, sslError())});

    std::string request = fmt::format("POST {} HTTP/1.1\r\nHost: {}\r\nConnection: close\r\nContent-Length: {}\r\n", PARTS->path, PARTS->host, body.size());
    for (const auto& [name, value] : headers) {
        request += fmt::format("{}: {}\r\n", name, value);
    }
    request += "\r\n";
    request += body;

    size_t written = 0;
    while (written < request.size()) {
        errno        = 0;
        const int N = SSL_write(ssl.get(), request.data() + written, static_cast<int>(std::min<size_t>(request.size() - written, INT_MAX)));
        if (N <= 0)
            return std::unexpected(STransportError{timedOut(), fmt::format("couldn't send request: {}", sslError())});
        written += N;
    }

    std::string raw;
    char        buf[16384];
    while (true) {
        if (std::chrono::steady_clock::now() > DEADLINE)
            return std::unexpected(STransportError{true, fmt::format("no reply within {}ms", timeout.count())});

        errno       = 0;
        const int N = SSL_read(ssl.get(), buf, sizeof(buf));
        if (N > 0) {
            raw.append(buf, N);
            if (raw.size() > maxResponseSize)
                return std::unexpected(STransportError{false, fmt::format("reply exceeds {} bytes", maxResponseSize)});
            continue;
        }

        const int ERR = SSL_get_error(ssl.get(), N);
        if (ERR == SSL_ERROR_ZERO_RETURN || (ERR == SSL_ERROR_SYSCALL && errno == 0))
            break;

        return std::unexpected(STransportError{timedOut(), fmt::format("couldn't read reply: {}", sslError())});
    }

    SSL_shutdown(ssl.get());

    auto reply = parseResponse(raw);
    if (!reply)
        return std::unexpected(STransportError{false, reply.error()});

    return *reply;
}
