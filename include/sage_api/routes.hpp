#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace sage_core {
class ServiceProvider;
struct QueryRequest;
}  // namespace sage_core

namespace sage_api {

class Routes {
 public:
  Routes(std::shared_ptr<sage_core::ServiceProvider> services,
         std::string default_collection = "default");
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, public so they can be driven without a listening socket
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_status(const crow::request &req);
  crow::response handle_index_document(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_list_collections(const crow::request &req);
  crow::response handle_collection_documents(const crow::request &req, const std::string &name);
  crow::response handle_delete_collection(const crow::request &req, const std::string &name);
  crow::response handle_delete_documents(const crow::request &req, const std::string &name);

  // Maps the error taxonomy onto HTTP status codes
  static int status_for(const std::exception &e);

 private:
  std::shared_ptr<sage_core::ServiceProvider> services_;
  std::string default_collection_;

  // Runs a handler body and turns any exception into a JSON error response
  crow::response guarded(const char *handler, const std::function<crow::response()> &body);

  sage_core::QueryRequest parse_query_request(const nlohmann::json &body) const;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace sage_api
