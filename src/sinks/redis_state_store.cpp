#include "sinks/redis_state_store.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace psu_agent::sinks {

RedisStateStore::RedisStateStore(RedisStoreOptions options) : options_(std::move(options)) {}

RedisStateStore::~RedisStateStore() = default;

RedisStateStore::RedisStateStore(RedisStateStore&&) noexcept = default;
RedisStateStore& RedisStateStore::operator=(RedisStateStore&&) noexcept = default;

bool RedisStateStore::check_connectivity() {
  return ensure_connected();
}

void RedisStateStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisStateStore::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisStateStore::reconnect() {
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
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  if (!select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisStateStore::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisStateStore::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisStateStore::set(const std::string& table, const std::string& key, const FieldValues& fields) {
  if (fields.empty()) {
    return true;
  }

  command_args_.clear();
  command_args_.emplace_back("HSET");
  command_args_.push_back(make_store_key(table, key));
  for (const auto& [field, value] : fields) {
    command_args_.push_back(field);
    command_args_.push_back(value);
  }
  return execute();
}

bool RedisStateStore::remove_field(const std::string& table, const std::string& key, const std::string& field) {
  command_args_.clear();
  command_args_.emplace_back("HDEL");
  command_args_.push_back(make_store_key(table, key));
  command_args_.push_back(field);
  return execute();
}

bool RedisStateStore::remove(const std::string& table, const std::string& key) {
  command_args_.clear();
  command_args_.emplace_back("DEL");
  command_args_.push_back(make_store_key(table, key));
  return execute();
}

bool RedisStateStore::execute() {
  if (!ensure_connected()) {
    return false;
  }

  if (execute_impl()) {
    return true;
  }

  // An error reply leaves the connection usable; only I/O errors warrant a reconnect.
  if (context_->err == REDIS_OK || !reconnect()) {
    return false;
  }
  return execute_impl();
}

bool RedisStateStore::execute_impl() {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] " << command_args_.front() << " " << command_args_[1] << " failed: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace psu_agent::sinks
