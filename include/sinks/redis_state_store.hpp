#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sinks/state_store.hpp"

struct redisContext;

namespace psu_agent::sinks {

struct RedisStoreOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{6};
  std::uint32_t connect_timeout_ms{1000};
};

class RedisStateStore final : public StateStore {
 public:
  explicit RedisStateStore(RedisStoreOptions options = {});
  ~RedisStateStore() override;

  RedisStateStore(const RedisStateStore&) = delete;
  RedisStateStore& operator=(const RedisStateStore&) = delete;
  RedisStateStore(RedisStateStore&&) noexcept;
  RedisStateStore& operator=(RedisStateStore&&) noexcept;

  bool check_connectivity();

  bool set(const std::string& table, const std::string& key, const FieldValues& fields) override;
  bool remove_field(const std::string& table, const std::string& key, const std::string& field) override;
  bool remove(const std::string& table, const std::string& key) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool execute();
  bool execute_impl();

  RedisStoreOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

}  // namespace psu_agent::sinks
