#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

/**
 * @brief Blocking HTTP/HTTPS GET client using Boost.Beast
 *
 * Meant to run on a worker thread; NativeHttpTransport wraps it for the event
 * loop. get() blocks for at most the configured timeout: connect, TLS
 * handshake, write and read all share one deadline, and a request that runs
 * past it fails with a timeout error.
 */
class NativeHTTPClient {
public:
    struct Response {
        int statusCode = 0;
        std::string body;
        std::map<std::string, std::string> headers;
        std::string error;
        bool success = false;
        bool timedOut = false;      // the deadline passed before the response was read
    };

    NativeHTTPClient();
    ~NativeHTTPClient();

    Response get(const std::string& url,
                 const std::map<std::string, std::string>& headers = {});

    // Upper bound on response body size
    void setBodyLimit(std::uint64_t bytes) { m_bodyLimit = bytes; }

    // Deadline for one whole request, name resolution included
    void setTimeout(std::chrono::milliseconds timeout) { m_timeout = timeout; }
    std::chrono::milliseconds timeout() const { return m_timeout; }

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
    std::uint64_t m_bodyLimit;
    std::chrono::milliseconds m_timeout;

    template <class Stream>
    void exchange(Stream& stream, const std::string& host, const std::string& target,
                  const std::map<std::string, std::string>& headers, Response& response);
};
