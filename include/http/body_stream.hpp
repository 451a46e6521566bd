#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace wafgate {

inline constexpr size_t kBodyChunkSize = 8192;

/**
 * @brief Sequential request-body reader
 *
 * read() returns the number of bytes copied into dst; ok(0) marks the end of
 * the stream. Upstream failures are reported as ENGINE_IO_ERROR.
 */
class IBodyStream {
public:
    virtual ~IBodyStream() = default;

    [[nodiscard]] virtual Result<size_t> read(char* dst, size_t max_len) = 0;
};

/**
 * @brief Body stream over an owned, fully buffered payload
 */
class StringBodyStream : public IBodyStream {
public:
    explicit StringBodyStream(std::string data);

    [[nodiscard]] Result<size_t> read(char* dst, size_t max_len) override;

    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

private:
    std::string data_;
    size_t pos_ = 0;
};

/**
 * @brief Concatenation of several streams, read one after another
 */
class ChainedBodyStream : public IBodyStream {
public:
    explicit ChainedBodyStream(std::vector<std::unique_ptr<IBodyStream>> parts);

    [[nodiscard]] Result<size_t> read(char* dst, size_t max_len) override;

private:
    std::vector<std::unique_ptr<IBodyStream>> parts_;
    size_t current_ = 0;
};

/**
 * @brief Pass-through reader handed to the inspection engine
 *
 * Every byte the engine pulls is counted and copied aside, so that after the
 * engine stops reading the request can be rebuilt as
 * (bytes already consumed) + (unread remainder of the source).
 */
class BodyCaptureStream : public IBodyStream {
public:
    explicit BodyCaptureStream(std::unique_ptr<IBodyStream> source);

    [[nodiscard]] Result<size_t> read(char* dst, size_t max_len) override;

    [[nodiscard]] size_t bytes_consumed() const { return captured_.size(); }
    [[nodiscard]] const std::string& captured() const { return captured_; }

    /**
     * @brief Build the downstream body stream
     *
     * @param retained Engine-held copy of the consumed bytes; when null the
     *        capture's own copy is used instead
     * @return Stream yielding consumed bytes followed by the unread remainder
     */
    [[nodiscard]] std::unique_ptr<IBodyStream> into_replay(
        std::unique_ptr<IBodyStream> retained) &&;

private:
    std::unique_ptr<IBodyStream> source_;
    std::string captured_;
};

/**
 * @brief Drain a stream into a string
 */
[[nodiscard]] Result<std::string> read_all(IBodyStream& stream);

} // namespace wafgate
