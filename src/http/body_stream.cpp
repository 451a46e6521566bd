#include "http/body_stream.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace wafgate {

// ============================================================================
// StringBodyStream
// ============================================================================

StringBodyStream::StringBodyStream(std::string data)
    : data_(std::move(data)) {}

Result<size_t> StringBodyStream::read(char* dst, size_t max_len) {
    const size_t n = std::min(max_len, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(dst, data_.data() + pos_, n);
        pos_ += n;
    }
    return Result<size_t>::ok(n);
}

// ============================================================================
// ChainedBodyStream
// ============================================================================

ChainedBodyStream::ChainedBodyStream(std::vector<std::unique_ptr<IBodyStream>> parts)
    : parts_(std::move(parts)) {}

Result<size_t> ChainedBodyStream::read(char* dst, size_t max_len) {
    if (max_len == 0) return Result<size_t>::ok(0);

    while (current_ < parts_.size()) {
        auto& part = parts_[current_];
        if (!part) {
            ++current_;
            continue;
        }
        auto r = part->read(dst, max_len);
        if (r.is_error()) return r;
        if (r.value() > 0) return r;
        // Exhausted: release it early and move on
        part.reset();
        ++current_;
    }
    return Result<size_t>::ok(0);
}

// ============================================================================
// BodyCaptureStream
// ============================================================================

BodyCaptureStream::BodyCaptureStream(std::unique_ptr<IBodyStream> source)
    : source_(std::move(source)) {}

Result<size_t> BodyCaptureStream::read(char* dst, size_t max_len) {
    if (!source_) return Result<size_t>::ok(0);

    auto r = source_->read(dst, max_len);
    if (r.is_ok() && r.value() > 0) {
        captured_.append(dst, r.value());
    }
    return r;
}

std::unique_ptr<IBodyStream> BodyCaptureStream::into_replay(
        std::unique_ptr<IBodyStream> retained) && {
    std::vector<std::unique_ptr<IBodyStream>> parts;
    parts.reserve(2);
    if (retained) {
        parts.emplace_back(std::move(retained));
    } else {
        parts.emplace_back(std::make_unique<StringBodyStream>(std::move(captured_)));
    }
    parts.emplace_back(std::move(source_));
    captured_.clear();
    return std::make_unique<ChainedBodyStream>(std::move(parts));
}

// ============================================================================
// Helpers
// ============================================================================

Result<std::string> read_all(IBodyStream& stream) {
    std::string out;
    std::array<char, kBodyChunkSize> buf;
    for (;;) {
        auto r = stream.read(buf.data(), buf.size());
        if (r.is_error()) {
            return Result<std::string>::error(r.error_category(), r.error_message());
        }
        if (r.value() == 0) break;
        out.append(buf.data(), r.value());
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace wafgate
