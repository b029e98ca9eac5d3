#pragma once
#include <chrono>
#include <string>

struct HttpResponse {
    unsigned    status = 0;
    std::string body;
};

// Blocking request/response transport; throws TransportError on network failure.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string& host,
                             const std::string& port,
                             const std::string& target,
                             std::chrono::seconds timeout) = 0;
};
