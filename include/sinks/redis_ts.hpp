#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "sinks/event_sink.hpp"

struct redisContext;

namespace yield_oracle::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"yield:oracle"};
  std::uint32_t connect_timeout_ms{1000};
};

// Writes every latched snapshot to RedisTimeSeries as
// <prefix>:<asset>:apr_pct and, once the window is long enough,
// <prefix>:<asset>:yield_apr_pct.
class RedisTsSink final : public EventSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink() override;

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  const char* name() const noexcept override { return "redis"; }

  bool check_connectivity();
  bool publish(const model::oracle_event& event) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  enum class ReplyKind { OK, REJECTED, NO_REPLY };
  struct ReplyStatus {
    ReplyKind kind;
    std::string message;
  };

  // Takes ownership of a hiredis reply and frees it.
  static ReplyStatus reply_status(void* raw_reply);

  bool open_session();
  bool ensure_series(const std::string& key);
  bool publish_impl(const model::oracle_event& event);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::unordered_set<std::string> created_series_;
  bool timeseries_available_{true};
};

}  // namespace yield_oracle::sinks
