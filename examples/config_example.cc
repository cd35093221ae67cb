#include <any>
#include <iostream>
#include <string>

#include "bluelink/bluelink.hpp"

using namespace bluelink;

int main(int argc, char** argv) {
  std::cout << "=== bluelink Configuration Example ===" << std::endl;

  auto store = (argc > 1) ? config::ConfigFactory::create_from_file(argv[1])
                           : config::ConfigFactory::create_with_defaults();

  std::cout << "Service name: " << std::any_cast<std::string>(store->get("connection.service_name")) << std::endl;
  std::cout << "Service UUID: " << std::any_cast<std::string>(store->get("connection.service_uuid")) << std::endl;
  std::cout << "Delimiters:   " << std::any_cast<std::string>(store->get("multiplexer.delimiters")) << std::endl;

  store->on_change("connection.listen_max_retries",
                    [](const std::string& key, const std::any& old_value, const std::any& new_value) {
                      std::cout << key << ": " << std::any_cast<int>(old_value) << " -> "
                                << std::any_cast<int>(new_value) << std::endl;
                    });

  auto result = store->set("connection.listen_max_retries", 3);
  std::cout << "Retries = 3: " << (result.is_valid ? "Valid" : "Invalid") << std::endl;
  result = store->set("multiplexer.delimiters", std::string("0D,XY"));
  std::cout << "Delimiters = 0D,XY: " << (result.is_valid ? "Valid" : result.error_message) << std::endl;

  config::ConfigFactory::apply_logging_config(*store);
  ConnectionConfig cfg = config::ConfigFactory::make_connection_config(*store);
  std::cout << "Connection config valid: " << (cfg.is_valid() ? "yes" : "no") << std::endl;

  if (argc > 2) {
    std::cout << "Saved to " << argv[2] << ": " << (store->save_to_file(argv[2]) ? "ok" : "failed") << std::endl;
  }
  return 0;
}
