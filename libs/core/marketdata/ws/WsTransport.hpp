#pragma once
#include <functional>
#include <string>

// Pure transport interface (no exchange logic)
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // owns the frame
    using StatusCb  = std::function<void(bool)>;        // true = handshake done, false = down/closed
    using ErrorCb   = std::function<void(std::string)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    // Both run on the transport's executor; callers post onto it.
    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close() = 0;

    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;
};
