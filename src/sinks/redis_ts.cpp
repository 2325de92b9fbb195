#include "sinks/redis_ts.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "core/fixed_point.hpp"

namespace yield_oracle::sinks {
namespace {

constexpr std::size_t kMaxCommandArgCount = 1 + (2 * 3);

double sanitize_value(const double value) { return std::isfinite(value) ? value : 0.0; }

void add_metric_args(std::vector<std::string>& args, const std::string& key, const std::uint64_t timestamp_ms,
                     const double value) {
  args.emplace_back(key);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

}  // namespace

RedisTsSink::ReplyStatus RedisTsSink::reply_status(void* raw_reply) {
  auto* reply = static_cast<redisReply*>(raw_reply);
  if (reply == nullptr) {
    return ReplyStatus{ReplyKind::NO_REPLY, "connection lost"};
  }

  ReplyStatus status{reply->type == REDIS_REPLY_ERROR ? ReplyKind::REJECTED : ReplyKind::OK, {}};
  if (reply->str != nullptr) {
    status.message.assign(reply->str, reply->len);
  }
  freeReplyObject(reply);
  return status;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!open_session()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::open_session() {
  if (!options_.password.empty()) {
    const auto status = reply_status(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
    if (status.kind != ReplyKind::OK) {
      std::cerr << "[redis] AUTH rejected: " << status.message << '\n';
      return false;
    }
  }

  if (options_.db != 0) {
    const auto status = reply_status(redisCommand(context_.get(), "SELECT %d", options_.db));
    if (status.kind != ReplyKind::OK) {
      std::cerr << "[redis] SELECT " << options_.db << " failed: " << status.message << '\n';
      return false;
    }
  }
  return true;
}

bool RedisTsSink::ensure_series(const std::string& key) {
  if (created_series_.count(key) != 0) {
    return true;
  }

  const auto status =
      reply_status(redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
  const bool exists = status.kind == ReplyKind::REJECTED && status.message.find("already exists") != std::string::npos;
  if (status.kind == ReplyKind::REJECTED && status.message.find("unknown command") != std::string::npos) {
    std::cerr << "[redis] TS.CREATE is an unknown command; RedisTimeSeries is not loaded, sink disabled\n";
    timeseries_available_ = false;
    return false;
  }
  if (status.kind != ReplyKind::OK && !exists) {
    std::cerr << "[redis] TS.CREATE " << key << " failed: " << status.message << '\n';
    return false;
  }

  created_series_.insert(key);
  return true;
}

bool RedisTsSink::publish(const model::oracle_event& event) {
  if (event.kind != model::event_kind::SNAPSHOT_LATCHED) {
    return true;
  }

  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(event)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(event);
}

bool RedisTsSink::publish_impl(const model::oracle_event& event) {
  const std::uint64_t timestamp_ms = event.latched.timestamp * 1000ULL;
  const std::string asset_prefix = options_.key_prefix + ":" + event.asset;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const std::string rate_key = asset_prefix + ":apr_pct";
  if (!ensure_series(rate_key)) {
    return false;
  }
  add_metric_args(command_args_, rate_key, timestamp_ms,
                  sanitize_value(core::annualized_percent(event.latched.rate)));

  if (event.yield.has_value()) {
    const std::string yield_key = asset_prefix + ":yield_apr_pct";
    if (!ensure_series(yield_key)) {
      return false;
    }
    add_metric_args(command_args_, yield_key, timestamp_ms, sanitize_value(core::annualized_percent(*event.yield)));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto status = reply_status(redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()),
                                                    command_argv_.data(), command_argv_len_.data()));
  if (status.kind == ReplyKind::REJECTED) {
    std::cerr << "[redis] TS.MADD for " << event.asset << " rejected: " << status.message << '\n';
  }
  return status.kind == ReplyKind::OK;
}

}  // namespace yield_oracle::sinks
