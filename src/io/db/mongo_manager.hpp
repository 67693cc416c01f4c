#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include <memory>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <string>

// Owns the driver instance and a client pool. Clients are acquired per
// operation and returned to the pool when the entry goes out of scope.
class MongoManager {
public:
  // Throws ConfigError for a malformed URI.
  explicit MongoManager(const std::string &uri);

  mongocxx::pool::entry get_client();
  bool ping();

private:
  static mongocxx::instance &driver_instance();
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP
