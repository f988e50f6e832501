#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace media_cli {

enum class Command {
  Stats,
  Search,
  Similar,
  Subject,
  Episode,
  Info,
  Export,
  Rate,
  Assign,
  List,
  Import,
  Backup,
  Help
};

struct CliOptions {
  Command command = Command::Help;
  std::string query;
  std::string image_path;
  std::string subject;
  std::string asset_id;
  std::string output_path;
  std::string import_path;
  std::string source;
  std::string content_type;
  std::string subjects;
  std::string style_tags;
  std::string notes;
  std::string dest;
  std::string media_type;
  int limit = 0;  // 0 means "server default"
  int offset = 0;
  int episode = 0;
  int rating = 0;
  std::optional<int> min_quality;
  bool unassigned_only = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(const std::string &api_base_url);
  ~CliHandler();

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  CliHandler(CliHandler &&) noexcept;
  CliHandler &operator=(CliHandler &&) noexcept;

  // Parse command line arguments. Throws CliError on unknown commands or missing values.
  CliOptions parse_arguments(int argc, char *argv[]);

  void execute_command(const CliOptions &options);

  void set_api_base_url(const std::string &url);
  std::string get_api_base_url() const;

 private:
  std::string api_base_url_;
  CURL *curl_handle_;

  // Command handlers
  void handle_stats_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_similar_command(const CliOptions &options);
  void handle_subject_command(const CliOptions &options);
  void handle_episode_command(const CliOptions &options);
  void handle_info_command(const CliOptions &options);
  void handle_export_command(const CliOptions &options);
  void handle_rate_command(const CliOptions &options);
  void handle_assign_command(const CliOptions &options);
  void handle_list_command(const CliOptions &options);
  void handle_import_command(const CliOptions &options);
  void handle_backup_command(const CliOptions &options);

  // HTTP methods
  std::string perform_request(const std::string &endpoint, const std::string *post_body);
  nlohmann::json make_get_request(const std::string &endpoint);
  nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
  std::vector<char> download(const std::string &endpoint);

  // Helper methods
  void setup_curl_handle();
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  std::string escape(const std::string &value);
  std::string build_url(const std::string &endpoint);
  void print_json_response(const nlohmann::json &response);
  void print_asset_list(const nlohmann::json &assets);
  void print_help();
};

}  // namespace media_cli
