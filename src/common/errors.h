#ifndef CHRONICLE_SRC_COMMON_ERRORS_H_
#define CHRONICLE_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Chronicle {

// A slot in a sequence is already occupied. Recoverable: the caller retries
// with a freshly discovered or freshly issued position.
class ConcurrencyError : public std::runtime_error {
public:
    explicit ConcurrencyError(const std::string& what) : std::runtime_error(what) {}
};

// Negative, malformed or out-of-capacity position. Not retried.
class InvalidPosition : public std::invalid_argument {
public:
    explicit InvalidPosition(const std::string& what) : std::invalid_argument(what) {}
};

class InvalidSectionId : public std::invalid_argument {
public:
    explicit InvalidSectionId(const std::string& what) : std::invalid_argument(what) {}
};

// Integer sequence would overflow int64.
class SequenceExhausted : public std::overflow_error {
public:
    explicit SequenceExhausted(const std::string& what) : std::overflow_error(what) {}
};

// Transient backend or RPC failure. The outcome of a write that raised this
// is unknown.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class UnknownTopic : public std::runtime_error {
public:
    explicit UnknownTopic(const std::string& topic)
        : std::runtime_error("No decoder registered for topic '" + topic + "'"),
          topic_(topic) {}

    const std::string& topic() const { return topic_; }

private:
    std::string topic_;
};

} // namespace Chronicle

#endif // CHRONICLE_SRC_COMMON_ERRORS_H_
