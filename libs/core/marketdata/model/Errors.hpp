#pragma once
#include <stdexcept>
#include <string>

// Network failure, timeout or non-2xx status while fetching or connecting.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A payload that cannot be turned into candles. Recovered per message on the live path.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SnapshotError {
    None,
    Transport,
    Decode
};

inline const char* toString(SnapshotError e) {
    switch (e) {
        case SnapshotError::None:      return "none";
        case SnapshotError::Transport: return "transport";
        case SnapshotError::Decode:    return "decode";
    }
    return "unknown";
}
