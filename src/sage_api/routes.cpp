#include "sage_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "sage_core/embeddings/embedding_service.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/llm/generation_backend.hpp"
#include "sage_core/services/collection_service.hpp"
#include "sage_core/services/indexing_service.hpp"
#include "sage_core/services/query_orchestrator.hpp"
#include "sage_core/services/service_provider.hpp"
#include "sage_core/types.hpp"

namespace sage_api {

namespace {
constexpr const char *kVersion = "0.1.0";
}  // namespace

Routes::Routes(std::shared_ptr<sage_core::ServiceProvider> services,
               std::string default_collection)
    : services_(std::move(services)), default_collection_(std::move(default_collection)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/status")
  ([this](const crow::request &req) { return handle_status(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_index_document(req); });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/collections")
  ([this](const crow::request &req) { return handle_list_collections(req); });

  CROW_ROUTE(app, "/collections/<string>/documents")
  ([this](const crow::request &req, const std::string &name) {
    return handle_collection_documents(req, name);
  });

  CROW_ROUTE(app, "/collections/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &name) {
        return handle_delete_collection(req, name);
      });

  CROW_ROUTE(app, "/collections/<string>/documents/delete")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &name) {
        return handle_delete_documents(req, name);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_for(const std::exception &e) {
  if (dynamic_cast<const sage_core::ValidationError *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e)) {
    return 400;
  }
  if (dynamic_cast<const sage_core::NotFoundError *>(&e)) {
    return 404;
  }
  if (dynamic_cast<const sage_core::QueryTimeoutError *>(&e)) {
    return 504;
  }
  if (dynamic_cast<const sage_core::EmbeddingError *>(&e) ||
      dynamic_cast<const sage_core::RetrievalError *>(&e) ||
      dynamic_cast<const sage_core::GenerationError *>(&e)) {
    return 502;
  }
  return 500;
}

crow::response Routes::guarded(const char *handler, const std::function<crow::response()> &body) {
  try {
    return body();
  } catch (const std::exception &e) {
    const int status = status_for(e);
    std::cerr << "Exception in " << handler << " (" << status << "): " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), status);
  }
}

crow::response Routes::handle_health_check(const crow::request & /*req*/) {
  nlohmann::json response = create_success_response("Sage API is running");
  response["version"] = kVersion;
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_status(const crow::request & /*req*/) {
  return guarded("handle_status", [this] {
    auto &generator = services_->get_generation_backend();
    const auto model = services_->get_embedding_service().model_info();

    nlohmann::json data;
    data["ollama"] = {{"healthy", generator.health_check()}, {"chat_model", generator.model_name()}};
    data["embeddings"] = {{"model", model.name}, {"initialized", model.initialized}};
    data["collections"] = services_->get_collection_service().list_collections().size();
    data["query_timeout_seconds"] = services_->query_timeout().count();
    return create_json_response(create_success_response("Status retrieved", data));
  });
}

crow::response Routes::handle_index_document(const crow::request &req) {
  return guarded("handle_index_document", [this, &req] {
    const auto body = parse_json_body(req.body);
    const std::string collection = body.value("collection", default_collection_);
    const auto metadata =
        sage_core::document_metadata_from_json(body.value("metadata", nlohmann::json::object()));

    auto &indexing = services_->get_indexing_service();
    sage_core::IndexResult result;
    if (body.contains("file_path")) {
      const std::string file_path = body.at("file_path").get<std::string>();
      std::cout << "Indexing file: " << file_path << " into " << collection << std::endl;
      result = indexing.index_file(file_path, collection, metadata);
    } else if (body.contains("text")) {
      std::cout << "Indexing inline text into " << collection << std::endl;
      result = indexing.index_document(body.at("text").get<std::string>(), collection, metadata);
    } else {
      throw sage_core::ValidationError("Request must contain either 'file_path' or 'text'");
    }

    return create_json_response(create_success_response("Document indexed successfully", result));
  });
}

sage_core::QueryRequest Routes::parse_query_request(const nlohmann::json &body) const {
  sage_core::QueryRequest request;
  request.question = body.value("question", std::string());
  request.collection = body.value("collection", default_collection_);
  if (body.contains("limit") && !body.at("limit").is_null()) {
    request.limit = body.at("limit").get<int>();
  }
  if (body.contains("threshold") && !body.at("threshold").is_null()) {
    request.threshold = body.at("threshold").get<double>();
  }
  return request;
}

crow::response Routes::handle_query(const crow::request &req) {
  return guarded("handle_query", [this, &req] {
    const auto request = parse_query_request(parse_json_body(req.body));
    std::cout << "Query in '" << request.collection << "': " << request.question << std::endl;

    const auto response =
        services_->get_query_orchestrator().answer(request, services_->query_timeout());
    nlohmann::json data = response;
    return create_json_response(create_success_response("Query answered", data));
  });
}

crow::response Routes::handle_list_collections(const crow::request &req) {
  return guarded("handle_list_collections", [this, &req] {
    const char *include = req.url_params.get("include_documents");
    const bool include_documents = include && std::string(include) == "true";

    const auto collections =
        services_->get_collection_service().list_collections(include_documents);
    nlohmann::json data;
    data["collections"] = collections;
    data["count"] = collections.size();
    return create_json_response(create_success_response("Collections retrieved", data));
  });
}

crow::response Routes::handle_collection_documents(const crow::request & /*req*/,
                                                   const std::string &name) {
  return guarded("handle_collection_documents", [this, &name] {
    auto &collections = services_->get_collection_service();
    if (!collections.collection_exists(name)) {
      throw sage_core::NotFoundError("Collection " + name + " does not exist");
    }
    const auto documents = collections.collection_documents(name);
    nlohmann::json data;
    data["collection"] = name;
    data["documents"] = documents;
    data["count"] = documents.size();
    return create_json_response(create_success_response("Documents retrieved", data));
  });
}

crow::response Routes::handle_delete_collection(const crow::request & /*req*/,
                                                const std::string &name) {
  return guarded("handle_delete_collection", [this, &name] {
    services_->get_collection_service().delete_collection(name);
    return create_json_response(create_success_response("Collection " + name + " deleted"));
  });
}

crow::response Routes::handle_delete_documents(const crow::request &req, const std::string &name) {
  return guarded("handle_delete_documents", [this, &req, &name] {
    const auto body = parse_json_body(req.body);
    if (!body.contains("document_ids") || !body.at("document_ids").is_array()) {
      throw sage_core::ValidationError("Request must contain a 'document_ids' array");
    }
    const auto document_ids = body.at("document_ids").get<std::vector<std::string>>();

    const size_t removed =
        services_->get_collection_service().delete_documents(name, document_ids);
    nlohmann::json data;
    data["deleted_chunks"] = removed;
    return create_json_response(create_success_response("Documents deleted", data));
  });
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    throw sage_core::ValidationError("Request body must be a JSON object");
  }
  auto json_body = nlohmann::json::parse(body);
  if (!json_body.is_object()) {
    throw sage_core::ValidationError("Request body must be a JSON object");
  }
  return json_body;
}

}  // namespace sage_api
