#pragma once

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace quadshade {

//-----------------------------------------------------------------------------
// Error - message with an optional chain of causes
//-----------------------------------------------------------------------------
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message))
        , _cause(std::make_shared<Error>(cause)) {}

    // Message of this error only
    const std::string& message() const { return _message; }

    // Underlying error, or nullptr at the end of the chain
    const Error* cause() const { return _cause.get(); }

    // Full chain, outermost first: "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

//-----------------------------------------------------------------------------
// Constructors
//-----------------------------------------------------------------------------
inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T = void>
Result<T> Err(std::string message, const Error& cause) {
    return std::unexpected(Error(std::move(message), cause));
}

// Convenience for logging a failed result
template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace quadshade
