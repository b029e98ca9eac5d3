#pragma once
#include "HttpTransport.hpp"

// HTTPS GET over Boost.Beast + OpenSSL. Each call owns its own io_context,
// so concurrent calls from different workers are independent.
class BeastHttpTransport : public HttpTransport {
public:
    HttpResponse get(const std::string& host,
                     const std::string& port,
                     const std::string& target,
                     std::chrono::seconds timeout) override;
};
