#include "sage_cli/cli_handler.hpp"

#include <iomanip>  // Required for std::fixed and std::setprecision
#include <stdexcept>

#include "sage_core/embeddings/embedding_service.hpp"
#include "sage_core/llm/generation_backend.hpp"
#include "sage_core/services/collection_service.hpp"
#include "sage_core/services/indexing_service.hpp"
#include "sage_core/services/query_orchestrator.hpp"
#include "sage_core/services/service_provider.hpp"

namespace sage_cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // reported below
  }
  throw CliError(flag + " expects an integer, got '" + value + "'");
}

double parse_double(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // reported below
  }
  throw CliError(flag + " expects a number, got '" + value + "'");
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<sage_core::ServiceProvider> services, std::ostream& out)
    : services_(std::move(services)), out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[], const std::string& default_collection) {
  CliOptions options;
  options.collection = default_collection;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  const std::string command = argv[1];
  if (command == "index" || command == "i") {
    options.command = Command::Index;
  } else if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "collections" || command == "c") {
    options.command = Command::Collections;
  } else if (command == "delete" || command == "d") {
    options.command = Command::Delete;
  } else if (command == "status") {
    options.command = Command::Status;
  } else if (command == "help" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command + ". Run 'sage_cli help' for usage.");
  }

  bool collection_given = false;
  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];

    // Switches without a value
    if (flag == "--stream" || flag == "-s") {
      options.stream = true;
      continue;
    }
    if (flag == "--documents" || flag == "-d") {
      options.include_documents = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    const std::string value = argv[++i];

    if (flag == "--file" || flag == "-f") {
      options.file_path = value;
    } else if (flag == "--question" || flag == "-q") {
      options.question = value;
    } else if (flag == "--collection" || flag == "-c") {
      options.collection = value;
      collection_given = true;
    } else if (flag == "--document") {
      options.document_id = value;
    } else if (flag == "--limit" || flag == "-k") {
      options.limit = parse_int(flag, value);
    } else if (flag == "--threshold" || flag == "-t") {
      options.threshold = parse_double(flag, value);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  if (options.command == Command::Index && options.file_path.empty()) {
    throw CliError("Index command requires a file path. Usage: index --file <path>");
  }
  if (options.command == Command::Ask && options.question.empty()) {
    throw CliError("Ask command requires a question. Usage: ask --question <question>");
  }
  if (options.command == Command::Delete && !collection_given) {
    throw CliError("Delete command requires a collection. Usage: delete --collection <name>");
  }
  return options;
}

void CliHandler::execute_command(const CliOptions& options) {
  switch (options.command) {
    case Command::Index:
      handle_index_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Collections:
      handle_collections_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options);
      break;
    case Command::Status:
      handle_status_command(options);
      break;
    case Command::Help:
      print_help(out_);
      break;
  }
}

void CliHandler::handle_index_command(const CliOptions& options) {
  out_ << "Indexing " << options.file_path << " into '" << options.collection << "'..."
       << std::endl;
  const auto result =
      services_->get_indexing_service().index_file(options.file_path, options.collection);
  out_ << "Indexed document " << result.document_id << ": " << result.chunk_count
       << " chunks in " << result.processing_time_ms << "ms" << std::endl;
}

void CliHandler::handle_ask_command(const CliOptions& options) {
  sage_core::QueryRequest request;
  request.question = options.question;
  request.collection = options.collection;
  request.limit = options.limit;
  request.threshold = options.threshold;

  auto& orchestrator = services_->get_query_orchestrator();
  if (options.stream) {
    orchestrator.answer_stream(
        request,
        [this](const std::string& fragment) {
          out_ << fragment << std::flush;
          return true;
        },
        services_->query_timeout());
    out_ << std::endl;
    return;
  }

  const auto response = orchestrator.answer(request, services_->query_timeout());
  out_ << response.answer << std::endl;

  if (!response.sources.empty()) {
    out_ << "\nSources:" << std::endl;
    out_ << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < response.sources.size(); ++i) {
      const auto& source = response.sources[i];
      out_ << "  [" << i + 1 << "] " << source.metadata.source << ", page "
           << (source.metadata.page ? std::to_string(*source.metadata.page) : "N/A")
           << " (score " << source.score << ")" << std::endl;
    }
  }
  out_ << "\nAnswered in " << response.processing_time_ms << "ms" << std::endl;
}

void CliHandler::handle_collections_command(const CliOptions& options) {
  const auto collections =
      services_->get_collection_service().list_collections(options.include_documents);
  if (collections.empty()) {
    out_ << "No collections found." << std::endl;
    return;
  }

  for (const auto& collection : collections) {
    out_ << collection.name << ": " << collection.document_count << " documents, "
         << collection.chunk_count << " chunks" << std::endl;
    if (!collection.documents) {
      continue;
    }
    for (const auto& document : *collection.documents) {
      out_ << "  " << document.id << "  " << document.file_name;
      if (document.title) {
        out_ << " (" << *document.title << ")";
      }
      out_ << ", " << document.chunk_count << " chunks" << std::endl;
    }
  }
}

void CliHandler::handle_delete_command(const CliOptions& options) {
  auto& collections = services_->get_collection_service();
  if (options.document_id.empty()) {
    collections.delete_collection(options.collection);
    out_ << "Deleted collection " << options.collection << std::endl;
    return;
  }

  const size_t removed = collections.delete_documents(options.collection, {options.document_id});
  if (removed == 0) {
    throw CliError("Document " + options.document_id + " not found in " + options.collection);
  }
  out_ << "Deleted document " << options.document_id << " (" << removed << " chunks)"
       << std::endl;
}

void CliHandler::handle_status_command(const CliOptions& /*options*/) {
  auto& generator = services_->get_generation_backend();
  const auto model = services_->get_embedding_service().model_info();
  const bool healthy = generator.health_check();

  out_ << "Ollama:          " << (healthy ? "reachable" : "unreachable") << std::endl;
  out_ << "Chat model:      " << generator.model_name() << std::endl;
  out_ << "Embedding model: " << model.name << (model.initialized ? " (loaded)" : "") << std::endl;
  out_ << "Collections:     " << services_->get_collection_service().list_collections().size()
       << std::endl;
}

void CliHandler::print_help(std::ostream& out) {
  out << R"(
Sage CLI - Ask questions about your local documents

Usage: sage_cli <command> [options]

Commands:
  index, i         Index a .txt or .md file
    --file, -f <path>          Path to the file to index
    --collection, -c <name>    Target collection (default from config)

  ask, a           Answer a question from indexed documents
    --question, -q <text>      The question
    --collection, -c <name>    Collection to search
    --limit, -k <num>          Maximum number of sources
    --threshold, -t <0-1>      Minimum similarity score
    --stream, -s               Print the answer as it is generated

  collections, c   List collections
    --documents, -d            Also list the documents in each collection

  delete, d        Delete a collection or one document in it
    --collection, -c <name>    Collection to delete from
    --document <id>            Only delete this document

  status           Show backend and model status
  help             Show this help

Configuration is read from sagerc.json or the file named by $SAGE_CONFIG.
)" << std::endl;
}

}  // namespace sage_cli
