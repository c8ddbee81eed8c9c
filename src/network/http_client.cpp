#include "network/http_client.hpp"
#include "network/body_source.hpp"
#include "network/http_helper.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::network {
//---------------------------------------------------------------------------
using namespace std;
using namespace std::chrono;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string sslError()
// The last OpenSSL error
{
    auto code = ERR_get_error();
    if (!code)
        return "unknown tls error";
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}
//---------------------------------------------------------------------------
/// One request response exchange over a single connection
class Exchange {
    public:
    /// The failure code
    uint16_t failureCode = 0;
    /// The state
    MessageState state = MessageState::Init;
    /// The failure description
    string failureMessage;

    private:
    /// The cancellation token
    const utils::CancellationToken& _token;
    /// The deadline
    steady_clock::time_point _deadline;
    /// The poll slice
    milliseconds _slice;
    /// The socket
    int _fd;
    /// The ssl object
    SSL* _ssl;

    public:
    /// The constructor
    Exchange(const utils::CancellationToken& token, steady_clock::time_point deadline, milliseconds slice) : _token(token), _deadline(deadline), _slice(slice), _fd(-1), _ssl(nullptr) {}
    /// Delete copy
    Exchange(const Exchange&) = delete;
    /// Delete copy assignment
    Exchange& operator=(const Exchange&) = delete;
    /// The destructor
    ~Exchange() {
        if (_ssl)
            SSL_free(_ssl);
        if (_fd >= 0)
            ::close(_fd);
    }

    /// Record a failure
    void fail(MessageFailureCode code, const string& message) {
        failureCode |= static_cast<uint16_t>(code);
        if (state != MessageState::Cancelled)
            state = MessageState::Aborted;
        if (failureMessage.empty())
            failureMessage = message;
    }
    /// Has the failure bit
    [[nodiscard]] bool failed(MessageFailureCode code) const { return failureCode & static_cast<uint16_t>(code); }

    /// Waits until the socket is ready for the events
    bool await(short events)
    {
        while (true) {
            if (_token.isCancelled()) {
                state = MessageState::Cancelled;
                return false;
            }
            auto now = steady_clock::now();
            if (now >= _deadline) {
                fail(MessageFailureCode::Timeout, "request timed out");
                return false;
            }
            auto waitTime = min(duration_cast<milliseconds>(_deadline - now), _slice);
            pollfd pfd = {_fd, events, 0};
            auto status = ::poll(&pfd, 1, max(1, static_cast<int>(waitTime.count())));
            if (status < 0) {
                if (errno == EINTR)
                    continue;
                fail(MessageFailureCode::Socket, string("poll error: ") + strerror(errno));
                return false;
            }
            // Errors and hang ups are reported by the following operation
            if (status > 0)
                return true;
        }
    }

    /// Connect to the first reachable address
    bool connect(const addrinfo* addr)
    {
        auto lastError = 0;
        for (auto current = addr; current; current = current->ai_next) {
            _fd = ::socket(current->ai_family, current->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, current->ai_protocol);
            if (_fd < 0) {
                lastError = errno;
                continue;
            }
            int noDelay = 1;
            if (setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay))) {
                fail(MessageFailureCode::Socket, string("Socket creation error! - nodelay error: ") + strerror(errno));
                return false;
            }
            if (::connect(_fd, current->ai_addr, current->ai_addrlen) == 0)
                return true;
            if (errno == EINPROGRESS) {
                if (!await(POLLOUT))
                    return false;
                int error = 0;
                socklen_t length = sizeof(error);
                if (getsockopt(_fd, SOL_SOCKET, SO_ERROR, &error, &length) == 0 && !error)
                    return true;
                lastError = error ? error : errno;
            } else {
                lastError = errno;
            }
            ::close(_fd);
            _fd = -1;
        }
        fail(MessageFailureCode::Socket, string("connect error: ") + strerror(lastError));
        return false;
    }

    /// Runs an ssl operation until it does not want more io
    template <typename F>
    bool sslOperation(F&& func, int& result, MessageFailureCode code)
    {
        while (true) {
            ERR_clear_error();
            auto status = func();
            if (status > 0) {
                result = status;
                return true;
            }
            switch (SSL_get_error(_ssl, status)) {
                case SSL_ERROR_WANT_READ:
                    if (!await(POLLIN))
                        return false;
                    break;
                case SSL_ERROR_WANT_WRITE:
                    if (!await(POLLOUT))
                        return false;
                    break;
                case SSL_ERROR_ZERO_RETURN:
                    result = 0;
                    return true;
                case SSL_ERROR_SYSCALL:
                    fail(code, errno ? string(strerror(errno)) : sslError());
                    return false;
                default:
                    fail(MessageFailureCode::TLS, sslError());
                    return false;
            }
        }
    }

    /// The tls handshake
    bool handshake(TLSContext& context, SSL* ssl, const string& key)
    {
        _ssl = ssl;
        if (SSL_set_fd(_ssl, _fd) != 1) {
            fail(MessageFailureCode::TLS, sslError());
            return false;
        }
        context.reuseSession(key, _ssl);
        int unused;
        return sslOperation([this] { return SSL_connect(_ssl); }, unused, MessageFailureCode::TLS);
    }

    /// Write all bytes
    bool write(span<const uint8_t> data)
    {
        while (!data.empty()) {
            if (_token.isCancelled()) {
                state = MessageState::Cancelled;
                return false;
            }
            int64_t written;
            if (_ssl) {
                auto length = static_cast<int>(min<uint64_t>(data.size(), 1ull << 30));
                int status;
                if (!sslOperation([this, data, length] { return SSL_write(_ssl, data.data(), length); }, status, MessageFailureCode::Send))
                    return false;
                if (!status) {
                    fail(MessageFailureCode::Send, "connection closed by peer");
                    return false;
                }
                written = status;
            } else {
                written = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
                if (written < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                        if (!await(POLLOUT))
                            return false;
                        continue;
                    }
                    fail(MessageFailureCode::Send, string("send error: ") + strerror(errno));
                    return false;
                }
            }
            data = data.subspan(static_cast<size_t>(written));
        }
        return true;
    }

    /// Receive once, zero bytes mark the end of the stream
    bool receive(char* buffer, uint64_t length, int64_t& received)
    {
        if (_ssl) {
            int status;
            if (!sslOperation([this, buffer, length] { return SSL_read(_ssl, buffer, static_cast<int>(length)); }, status, MessageFailureCode::Recv))
                return false;
            received = status;
            return true;
        }
        while (true) {
            received = ::recv(_fd, buffer, length, 0);
            if (received >= 0)
                return true;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                if (!await(POLLIN))
                    return false;
                continue;
            }
            fail(MessageFailureCode::Recv, string("recv error: ") + strerror(errno));
            return false;
        }
    }

    /// Read until the response is complete
    bool read(string& data, unique_ptr<HttpHelper::Info>& info, uint64_t recvChunk, uint64_t maxSize)
    {
        auto buffer = make_unique<char[]>(recvChunk);
        auto closed = false;
        while (true) {
            try {
                if (HttpHelper::finished(data, info, closed))
                    return true;
            } catch (const runtime_error& error) {
                fail(MessageFailureCode::HTTP, error.what());
                return false;
            }
            if (closed) {
                if (data.empty())
                    fail(MessageFailureCode::Empty, "connection closed without response");
                else
                    fail(MessageFailureCode::HTTP, "connection closed before the response was complete");
                return false;
            }
            if (data.size() > maxSize) {
                fail(MessageFailureCode::HTTP, "response exceeds " + to_string(maxSize) + " bytes");
                return false;
            }
            int64_t received;
            if (!receive(buffer.get(), recvChunk, received))
                return false;
            if (!received)
                closed = true;
            else
                data.append(buffer.get(), static_cast<size_t>(received));
        }
    }

    /// Close the tls session and keep it for resumption
    void shutdown(TLSContext& context, const string& key)
    {
        if (!_ssl)
            return;
        if (SSL_shutdown(_ssl) >= 0)
            context.cacheSession(key, _ssl);
        else
            context.dropSession(key);
        ERR_clear_error();
    }
};
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
string Endpoint::hostHeader() const
// The host header
{
    if ((https && port == 443) || (!https && port == 80))
        return host;
    return host + ":" + to_string(port);
}
//---------------------------------------------------------------------------
HttpClient::HttpClient(Settings settings) : _settings(settings), _resolver()
// The constructor
{
}
//---------------------------------------------------------------------------
TLSContext* HttpClient::tlsContext()
// Lazily create the tls context
{
    call_once(_tlsOnce, [this] { _tlsContext = make_unique<TLSContext>(_settings.verifyPeer); });
    return _tlsContext.get();
}
//---------------------------------------------------------------------------
MessageResult HttpClient::send(const Endpoint& endpoint, const HttpRequest& request, BodySource* body, const utils::CancellationToken& token, milliseconds timeout)
// Sends the request and receives the response
{
    MessageResult result;
    Exchange exchange(token, steady_clock::now() + timeout, _settings.pollSlice);
    auto finish = [&result, &exchange]() -> MessageResult {
        result._failureCode = exchange.failureCode;
        result._state = exchange.state;
        result._failureMessage = move(exchange.failureMessage);
        return move(result);
    };

    if (token.isCancelled()) {
        exchange.state = MessageState::Cancelled;
        return finish();
    }

    auto port = to_string(endpoint.port);
    shared_ptr<const addrinfo> addr;
    try {
        addr = _resolver.resolve(endpoint.host, port);
    } catch (const runtime_error& error) {
        exchange.fail(MessageFailureCode::Resolve, error.what());
        return finish();
    }
    if (!exchange.connect(addr.get())) {
        _resolver.invalidate(endpoint.host, port);
        return finish();
    }

    auto sessionKey = endpoint.host + ":" + port;
    TLSContext* context = nullptr;
    if (endpoint.https) {
        try {
            context = tlsContext();
        } catch (const runtime_error& error) {
            exchange.fail(MessageFailureCode::TLS, error.what());
            return finish();
        }
        auto ssl = context ? context->create(endpoint.host) : nullptr;
        if (!ssl) {
            exchange.fail(MessageFailureCode::TLS, "cannot create tls connection");
            return finish();
        }
        if (!exchange.handshake(*context, ssl, sessionKey))
            return finish();
    }

    // Complete the header
    HttpRequest prepared = request;
    if (!prepared.headers.contains("Host"))
        prepared.headers.emplace("Host", endpoint.hostHeader());
    if (!prepared.headers.contains("Content-Length") && (body || prepared.method == HttpRequest::Method::PUT || prepared.method == HttpRequest::Method::POST))
        prepared.headers.emplace("Content-Length", to_string(body ? body->size() : 0));
    if (!prepared.headers.contains("Connection"))
        prepared.headers.emplace("Connection", "close");

    auto header = HttpRequest::serialize(prepared);
    auto sent = exchange.write({reinterpret_cast<const uint8_t*>(header.data()), header.size()});
    if (sent && body) {
        body->rewind();
        while (sent) {
            auto piece = body->next(_settings.sendChunk);
            if (piece.empty())
                break;
            sent = exchange.write(piece);
        }
    }
    // A peer may answer and close before the body was consumed, so we still try to read the response
    if (!sent && exchange.state == MessageState::Cancelled)
        return finish();
    if (!sent && exchange.failed(MessageFailureCode::Timeout))
        return finish();

    if (!sent)
        exchange.state = MessageState::Init;
    if (!exchange.read(result._data, result._response, _settings.recvChunk, _settings.maxResponseSize))
        return finish();

    if (context)
        exchange.shutdown(*context, sessionKey);
    exchange.state = MessageState::Finished;
    return finish();
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
