#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace sage_core {
class ServiceProvider;
}

namespace sage_cli
{

  enum class Command
  {
    Index,
    Ask,
    Collections,
    Delete,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string question;
    std::string collection;
    std::string document_id;
    std::optional<int> limit;
    std::optional<double> threshold;
    bool stream = false;
    bool include_documents = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::shared_ptr<sage_core::ServiceProvider> services,
                        std::ostream &out = std::cout);

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments; collection defaults to default_collection
    static CliOptions parse_arguments(int argc, char *argv[],
                                      const std::string &default_collection = "default");

    // Execute command
    void execute_command(const CliOptions &options);

    static void print_help(std::ostream &out);

  private:
    std::shared_ptr<sage_core::ServiceProvider> services_;
    std::ostream &out_;

    // Command handlers
    void handle_index_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_collections_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);
  };

}  // namespace sage_cli
