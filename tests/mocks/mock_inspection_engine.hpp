#pragma once

#include "engine/inspection_engine.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wafgate::test {

// What a MockTransaction does at each phase
struct TransactionScript {
    std::optional<Interruption> at_headers;
    std::optional<Interruption> at_body_read;       // Interrupt once the body is read
    std::optional<Interruption> at_body_eval;       // Interrupt from process_request_body
    std::optional<std::string> read_error;          // read_request_body_from fails
    std::optional<std::string> eval_error;          // process_request_body fails
    std::optional<std::string> throw_at_headers;    // process_request_headers throws
    std::optional<std::string> throw_at_logging;    // process_logging throws
    std::optional<int> throw_code_at_headers;       // Same, with a non-std::exception value
    std::optional<int> throw_code_at_logging;

    bool body_accessible = true;
    bool rule_engine_off = false;
    bool retain_body = true;                        // false = request_body_reader() is null
    size_t body_limit = static_cast<size_t>(-1);    // Stop reading after this many bytes
};

// Everything a MockTransaction observed, shared with the test
struct TransactionRecord {
    std::string id;
    bool has_stop_token = false;

    std::string client_host;
    int client_port = -1;
    std::string server_host;
    int server_port = -1;

    std::string uri;
    std::string method;
    std::string protocol;

    std::vector<std::pair<std::string, std::string>> headers;
    std::string server_name;
    std::string body_seen;

    bool headers_processed = false;
    bool body_read = false;
    bool body_evaluated = false;
    int logging_calls = 0;
    int close_calls = 0;
    std::vector<std::string> call_order;

    bool has_header(const std::string& key, const std::string& value) const {
        return std::find(headers.begin(), headers.end(), std::make_pair(key, value)) != headers.end();
    }
};

class MockTransaction : public ITransaction {
public:
    MockTransaction(TransactionScript script, std::shared_ptr<TransactionRecord> record)
        : script_(std::move(script)), record_(std::move(record)) {}

    void process_connection(const std::string& client_host, int client_port,
                            const std::string& server_host, int server_port) override {
        record_->call_order.emplace_back("connection");
        record_->client_host = client_host;
        record_->client_port = client_port;
        record_->server_host = server_host;
        record_->server_port = server_port;
    }

    void process_uri(const std::string& uri, const std::string& method,
                     const std::string& protocol) override {
        record_->call_order.emplace_back("uri");
        record_->uri = uri;
        record_->method = method;
        record_->protocol = protocol;
    }

    void add_request_header(const std::string& key, const std::string& value) override {
        record_->headers.emplace_back(key, value);
    }

    void set_server_name(const std::string& host) override {
        record_->server_name = host;
    }

    std::optional<Interruption> process_request_headers() override {
        record_->call_order.emplace_back("headers");
        record_->headers_processed = true;
        if (script_.throw_at_headers) {
            throw std::runtime_error(*script_.throw_at_headers);
        }
        if (script_.throw_code_at_headers) {
            throw *script_.throw_code_at_headers;
        }
        return script_.at_headers;
    }

    bool is_request_body_accessible() const override { return script_.body_accessible; }

    BodyReadResult read_request_body_from(IBodyStream& stream) override {
        record_->call_order.emplace_back("body_read");
        record_->body_read = true;

        BodyReadResult result;
        if (script_.read_error) {
            result.error = script_.read_error;
            return result;
        }

        std::array<char, 4> buf;   // Small chunks to exercise partial reads
        while (retained_.size() < script_.body_limit) {
            const size_t want = std::min(buf.size(), script_.body_limit - retained_.size());
            auto r = stream.read(buf.data(), want);
            if (r.is_error()) {
                result.error = r.error_message();
                return result;
            }
            if (r.value() == 0) break;
            retained_.append(buf.data(), r.value());
        }
        result.bytes_read = retained_.size();
        record_->body_seen = retained_;
        result.interruption = script_.at_body_read;
        return result;
    }

    std::unique_ptr<IBodyStream> request_body_reader() override {
        if (!script_.retain_body) return nullptr;
        return std::make_unique<StringBodyStream>(retained_);
    }

    Result<std::optional<Interruption>> process_request_body() override {
        record_->call_order.emplace_back("body_eval");
        record_->body_evaluated = true;
        if (script_.eval_error) {
            return Result<std::optional<Interruption>>::error(
                ErrorCategory::INTERNAL_ERROR, *script_.eval_error);
        }
        return Result<std::optional<Interruption>>::ok(script_.at_body_eval);
    }

    bool is_rule_engine_off() const override { return script_.rule_engine_off; }

    void process_logging() override {
        record_->call_order.emplace_back("logging");
        ++record_->logging_calls;
        if (script_.throw_at_logging) {
            throw std::runtime_error(*script_.throw_at_logging);
        }
        if (script_.throw_code_at_logging) {
            throw *script_.throw_code_at_logging;
        }
    }

    void close() override {
        record_->call_order.emplace_back("close");
        ++record_->close_calls;
    }

private:
    TransactionScript script_;
    std::shared_ptr<TransactionRecord> record_;
    std::string retained_;
};

// Plain engine: every transaction follows the same script
class MockEngine : public IInspectionEngine {
public:
    explicit MockEngine(TransactionScript script = {}) : script_(std::move(script)) {}

    std::unique_ptr<ITransaction> new_transaction() override {
        return make(TransactionOptions{});
    }

    std::shared_ptr<TransactionRecord> last() const {
        std::lock_guard lock(mutex_);
        return records_.empty() ? nullptr : records_.back();
    }

    size_t transaction_count() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    TransactionScript script_;

protected:
    std::unique_ptr<ITransaction> make(const TransactionOptions& options) {
        auto record = std::make_shared<TransactionRecord>();
        record->id = options.id;
        record->has_stop_token = options.cancellation.stop_possible();
        {
            std::lock_guard lock(mutex_);
            records_.push_back(record);
        }
        return std::make_unique<MockTransaction>(script_, std::move(record));
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<TransactionRecord>> records_;
};

// Engine that also accepts request context
class MockContextAwareEngine : public MockEngine, public IContextAwareEngine {
public:
    using MockEngine::MockEngine;

    std::unique_ptr<ITransaction> new_transaction() override {
        ++plain_calls;
        return make(TransactionOptions{});
    }

    std::unique_ptr<ITransaction> new_transaction(const TransactionOptions& options) override {
        ++context_calls;
        return make(options);
    }

    std::atomic<int> plain_calls{0};
    std::atomic<int> context_calls{0};
};

// Factory returning a fixed engine, counting invocations
struct MockEngineFactory {
    std::shared_ptr<IInspectionEngine> engine;
    std::shared_ptr<int> calls = std::make_shared<int>(0);
    std::shared_ptr<EngineConfig> seen = std::make_shared<EngineConfig>();

    EngineFactory as_factory() const {
        return [engine = engine, calls = calls, seen = seen](const EngineConfig& config) {
            ++*calls;
            *seen = config;
            return Result<std::shared_ptr<IInspectionEngine>>::ok(engine);
        };
    }
};

inline Interruption deny(int status, int rule_id = 1) {
    return Interruption{std::string(kActionDeny), status, rule_id, ""};
}

} // namespace wafgate::test
