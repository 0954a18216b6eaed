#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include "bridge/protocol_bridge.hpp"
#include "core/config/audit_settings.hpp"
#include "protocol/rpc_envelope.hpp"

namespace webaudit::bridge {

// Line-delimited JSON-RPC over the standard input/output of a spawned backend.
class StdioBridge : public ProtocolBridge {
public:
    explicit StdioBridge(core::config::BackendSettings settings,
                         std::shared_ptr<std::atomic_bool> cancel_token = nullptr);
    ~StdioBridge() override;

    StdioBridge(const StdioBridge&) = delete;
    StdioBridge& operator=(const StdioBridge&) = delete;

    core::errors::Result<bool> open() override;
    core::errors::Result<nlohmann::json> send(const std::string& method,
                                              const nlohmann::json& params) override;
    void close() override;
    bool is_open() const override;
    std::uint64_t session_epoch() const override;

    // Last bytes the backend wrote to its standard error.
    std::string stderr_tail() const;

private:
    core::errors::Result<bool> spawn();
    core::errors::Result<bool> handshake();
    core::errors::Result<nlohmann::json> exchange(const std::string& method,
                                                  const nlohmann::json& params,
                                                  std::uint32_t timeout_ms);
    core::errors::Result<bool> write_line(const std::string& line);
    core::errors::Result<std::string> read_line(std::uint32_t timeout_ms);
    core::errors::Result<bool> reject_server_request(const protocol::rpc::IncomingMessage& message);
    void drain_stderr();
    void release();

    core::config::BackendSettings settings_;
    std::shared_ptr<std::atomic_bool> cancel_token_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool open_ = false;
    std::string read_buffer_;
    std::string stderr_tail_;
    std::int64_t next_id_ = 1;
    std::uint64_t epoch_ = 0;
};

}  // namespace webaudit::bridge
