#include "mongo_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <exception>
#include <memory>
#include <mongocxx/exception/exception.hpp>

mongocxx::instance &MongoManager::driver_instance() {
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const std::string &uri) {
  driver_instance();
  try {
    mongocxx::uri mongo_uri(uri);
    pool_ = std::make_unique<mongocxx::pool>(mongo_uri);
    LOG(LogLevel::INFO, LogComponent::IO_STORE,
        "MongoDB connection pool initialized.");
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_STORE,
        "Could not initialize MongoDB connection pool. Error: " << e.what());
    throw ConfigError(std::string("Invalid MongoDB URI: ") + e.what());
  }
}

mongocxx::pool::entry MongoManager::get_client() {
  // acquire() blocks until a client is free; the pool's waitQueueTimeoutMS
  // bounds that wait when set in the URI.
  try {
    return pool_->acquire();
  } catch (const mongocxx::exception &e) {
    throw TransientIOError(std::string("Could not acquire MongoDB client: ") +
                           e.what());
  }
}

bool MongoManager::ping() {
  try {
    auto client = pool_->acquire();

    bsoncxx::builder::basic::document doc_builder{};
    doc_builder.append(bsoncxx::builder::basic::kvp("ping", 1));

    // The "ping" command is a lightweight way to check server status
    (*client)["admin"].run_command(doc_builder.view());

    LOG(LogLevel::TRACE, LogComponent::IO_STORE,
        "MongoDB server is reachable and responsive.");

    return true;
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_STORE,
        "MongoDB server is unreachable. Error: " << e.what());
    return false;
  }
}
