#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docuchat_cli
{

  enum class Command
  {
    Ingest,
    Search,
    List,
    Info,
    Delete,
    Ask,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string category;
    std::string title;
    std::string owner;
    std::string query;
    std::string document_id;
    std::string prompt;
    std::string agent_type = "document-search";
    int top_k = 5;
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
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Throws CliError on an unknown command or a missing required flag
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Returns false when the server reported a failure
    bool execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    // Url-safe form of a path segment
    static std::string escape_path_segment(const std::string &segment);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    bool handle_ingest_command(const CliOptions &options);
    bool handle_search_command(const CliOptions &options);
    bool handle_list_command(const CliOptions &options);
    bool handle_info_command(const CliOptions &options);
    bool handle_delete_command(const CliOptions &options);
    bool handle_ask_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json perform_request(const std::string &method, const std::string &endpoint,
                                   const nlohmann::json *body = nullptr);

    // Helper methods
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    static std::string read_file(const std::string &path);
    void print_search_response(const nlohmann::json &response);
    void print_answer_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    static void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
