#include "media_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>  // Required for std::fixed and std::setprecision
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>

#include "media_core/utils/crypto_utils.hpp"

namespace media_cli {

namespace {

using FlagMap = std::map<std::string, std::string>;

// Collects "--flag value" pairs. Boolean flags listed in `switches` take no value.
FlagMap collect_flags(int argc, char *argv[], const std::vector<std::string> &switches = {}) {
  FlagMap flags;
  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag.rfind("--", 0) != 0) {
      throw CliError("Unexpected argument: " + flag);
    }
    bool is_switch = false;
    for (const auto &s : switches) {
      if (flag == s) {
        is_switch = true;
        break;
      }
    }
    if (is_switch) {
      flags[flag] = "true";
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    flags[flag] = argv[++i];
  }
  return flags;
}

std::string require_flag(const FlagMap &flags, const std::string &flag, const std::string &usage) {
  auto it = flags.find(flag);
  if (it == flags.end() || it->second.empty()) {
    throw CliError("Missing " + flag + ". Usage: " + usage);
  }
  return it->second;
}

std::string flag_or(const FlagMap &flags, const std::string &flag, const std::string &fallback) {
  auto it = flags.find(flag);
  return it == flags.end() ? fallback : it->second;
}

int parse_int(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

nlohmann::json split_csv(const std::string &value) {
  nlohmann::json items = nlohmann::json::array();
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::vector<char> read_local_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw CliError("Cannot open file: " + path);
  }
  return std::vector<char>((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
}

}  // namespace

CliHandler::CliHandler(const std::string &api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
  setup_curl_handle();
}

CliHandler::~CliHandler() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

CliHandler::CliHandler(CliHandler &&other) noexcept
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

CliHandler &CliHandler::operator=(CliHandler &&other) noexcept {
  if (this != &other) {
    if (curl_handle_) {
      curl_easy_cleanup(curl_handle_);
    }
    api_base_url_ = std::move(other.api_base_url_);
    curl_handle_ = other.curl_handle_;
    other.curl_handle_ = nullptr;
  }
  return *this;
}

void CliHandler::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw CliError("Failed to initialize CURL");
  }
}

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  const std::string command = argv[1];

  if (command == "stats") {
    options.command = Command::Stats;
  } else if (command == "search" || command == "s") {
    const std::string usage = "search --query <text> [--limit n] [--min-quality n] [--type t]";
    auto flags = collect_flags(argc, argv);
    options.command = Command::Search;
    options.query = require_flag(flags, "--query", usage);
    if (flags.count("--limit")) options.limit = parse_int("--limit", flags["--limit"]);
    if (flags.count("--min-quality")) {
      options.min_quality = parse_int("--min-quality", flags["--min-quality"]);
    }
    options.media_type = flag_or(flags, "--type", "");
  } else if (command == "similar") {
    const std::string usage = "similar --image <path> [--limit n] [--type t]";
    auto flags = collect_flags(argc, argv);
    options.command = Command::Similar;
    options.image_path = require_flag(flags, "--image", usage);
    if (flags.count("--limit")) options.limit = parse_int("--limit", flags["--limit"]);
    options.media_type = flag_or(flags, "--type", "");
  } else if (command == "subject") {
    auto flags = collect_flags(argc, argv);
    options.command = Command::Subject;
    options.subject = require_flag(flags, "--name", "subject --name <subject> [--type t]");
    options.media_type = flag_or(flags, "--type", "");
  } else if (command == "episode") {
    auto flags = collect_flags(argc, argv, {"--unassigned"});
    options.command = Command::Episode;
    options.episode =
        parse_int("--number", require_flag(flags, "--number", "episode --number <n> [--unassigned]"));
    options.unassigned_only = flags.count("--unassigned") > 0;
  } else if (command == "info" || command == "i") {
    auto flags = collect_flags(argc, argv);
    options.command = Command::Info;
    options.asset_id = require_flag(flags, "--id", "info --id <asset_id>");
  } else if (command == "export") {
    const std::string usage = "export --id <asset_id> --output <path>";
    auto flags = collect_flags(argc, argv);
    options.command = Command::Export;
    options.asset_id = require_flag(flags, "--id", usage);
    options.output_path = require_flag(flags, "--output", usage);
  } else if (command == "rate") {
    const std::string usage = "rate --id <asset_id> --rating <1-10> [--notes text]";
    auto flags = collect_flags(argc, argv);
    options.command = Command::Rate;
    options.asset_id = require_flag(flags, "--id", usage);
    options.rating = parse_int("--rating", require_flag(flags, "--rating", usage));
    options.notes = flag_or(flags, "--notes", "");
  } else if (command == "assign") {
    const std::string usage = "assign --id <asset_id> --episode <1-8>";
    auto flags = collect_flags(argc, argv);
    options.command = Command::Assign;
    options.asset_id = require_flag(flags, "--id", usage);
    options.episode = parse_int("--episode", require_flag(flags, "--episode", usage));
  } else if (command == "list" || command == "l") {
    auto flags = collect_flags(argc, argv);
    options.command = Command::List;
    if (flags.count("--limit")) options.limit = parse_int("--limit", flags["--limit"]);
    if (flags.count("--offset")) options.offset = parse_int("--offset", flags["--offset"]);
    options.media_type = flag_or(flags, "--type", "");
    options.source = flag_or(flags, "--source", "");
  } else if (command == "import") {
    const std::string usage =
        "import --path <dir> --source <source> [--content-type t] [--subjects a,b] [--styles a,b]";
    auto flags = collect_flags(argc, argv);
    options.command = Command::Import;
    options.import_path = require_flag(flags, "--path", usage);
    options.source = require_flag(flags, "--source", usage);
    options.content_type = flag_or(flags, "--content-type", "");
    options.subjects = flag_or(flags, "--subjects", "");
    options.style_tags = flag_or(flags, "--styles", "");
  } else if (command == "backup") {
    auto flags = collect_flags(argc, argv);
    options.command = Command::Backup;
    options.dest = flag_or(flags, "--dest", "");
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Stats:
      handle_stats_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Similar:
      handle_similar_command(options);
      break;
    case Command::Subject:
      handle_subject_command(options);
      break;
    case Command::Episode:
      handle_episode_command(options);
      break;
    case Command::Info:
      handle_info_command(options);
      break;
    case Command::Export:
      handle_export_command(options);
      break;
    case Command::Rate:
      handle_rate_command(options);
      break;
    case Command::Assign:
      handle_assign_command(options);
      break;
    case Command::List:
      handle_list_command(options);
      break;
    case Command::Import:
      handle_import_command(options);
      break;
    case Command::Backup:
      handle_backup_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_stats_command(const CliOptions &) {
  nlohmann::json stats = make_get_request("/stats");

  std::cout << "\n=== Collection Stats ===" << std::endl;
  std::cout << "Total assets: " << stats.value("total_assets", 0) << " ("
            << stats.value("images", 0) << " images, " << stats.value("videos", 0) << " videos)"
            << std::endl;
  std::cout << "Total size:   " << std::fixed << std::setprecision(2)
            << stats.value("total_size_mb", 0.0) << " MB" << std::endl;
  if (stats.contains("avg_quality") && !stats["avg_quality"].is_null()) {
    std::cout << "Avg quality:  " << std::setprecision(1) << stats["avg_quality"].get<double>()
              << " (" << stats.value("rated_count", 0) << " rated, "
              << stats.value("unrated_count", 0) << " unrated)" << std::endl;
  } else {
    std::cout << "Avg quality:  n/a (nothing rated)" << std::endl;
  }
  if (stats.value("embedding_unavailable_count", 0) > 0) {
    std::cout << "Without embedding: " << stats["embedding_unavailable_count"].get<int>()
              << std::endl;
  }
  if (stats.contains("sources") && stats["sources"].is_object()) {
    std::cout << "Sources:" << std::endl;
    for (const auto &[source, count] : stats["sources"].items()) {
      std::cout << "  " << source << ": " << count.get<int>() << std::endl;
    }
  }
}

void CliHandler::handle_search_command(const CliOptions &options) {
  std::cout << "Theme search for: " << options.query << std::endl;

  std::string endpoint = "/search/theme?query=" + escape(options.query);
  if (options.limit > 0) endpoint += "&limit=" + std::to_string(options.limit);
  if (options.min_quality) endpoint += "&min_quality=" + std::to_string(*options.min_quality);
  if (!options.media_type.empty()) endpoint += "&media_type=" + escape(options.media_type);

  print_asset_list(make_get_request(endpoint));
}

void CliHandler::handle_similar_command(const CliOptions &options) {
  std::cout << "Finding assets similar to: " << options.image_path << std::endl;

  nlohmann::json request_data = {
      {"image_base64", media_core::base64_encode(read_local_file(options.image_path))}};
  if (options.limit > 0) request_data["limit"] = options.limit;
  if (!options.media_type.empty()) request_data["media_type"] = options.media_type;

  print_asset_list(make_post_request("/search/similar", request_data));
}

void CliHandler::handle_subject_command(const CliOptions &options) {
  std::string endpoint = "/search/subject/" + escape(options.subject);
  if (!options.media_type.empty()) endpoint += "?media_type=" + escape(options.media_type);
  print_asset_list(make_get_request(endpoint));
}

void CliHandler::handle_episode_command(const CliOptions &options) {
  std::string endpoint = "/search/episode/" + std::to_string(options.episode);
  if (options.unassigned_only) endpoint += "?unassigned=true";
  print_asset_list(make_get_request(endpoint));
}

void CliHandler::handle_info_command(const CliOptions &options) {
  print_json_response(make_get_request("/asset/" + escape(options.asset_id)));
}

void CliHandler::handle_export_command(const CliOptions &options) {
  std::vector<char> bytes = download("/asset/" + escape(options.asset_id) + "/content");

  std::ofstream out(options.output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw CliError("Cannot open output file: " + options.output_path);
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw CliError("Failed to write output file: " + options.output_path);
  }
  std::cout << "Exported " << bytes.size() << " bytes to " << options.output_path << std::endl;
}

void CliHandler::handle_rate_command(const CliOptions &options) {
  nlohmann::json request_data = {{"asset_id", options.asset_id}, {"rating", options.rating}};
  if (!options.notes.empty()) request_data["notes"] = options.notes;
  print_json_response(make_post_request("/asset/rate", request_data));
}

void CliHandler::handle_assign_command(const CliOptions &options) {
  nlohmann::json request_data = {{"asset_id", options.asset_id}, {"episode", options.episode}};
  print_json_response(make_post_request("/asset/assign-episode", request_data));
}

void CliHandler::handle_list_command(const CliOptions &options) {
  std::string endpoint = "/assets?offset=" + std::to_string(options.offset);
  if (options.limit > 0) endpoint += "&limit=" + std::to_string(options.limit);
  if (!options.media_type.empty()) endpoint += "&media_type=" + escape(options.media_type);
  if (!options.source.empty()) endpoint += "&source=" + escape(options.source);

  nlohmann::json page = make_get_request(endpoint);
  std::cout << "Showing " << page["assets"].size() << " of " << page.value("total", 0)
            << " assets (offset " << page.value("offset", 0) << ")" << std::endl;
  print_asset_list(page["assets"]);
}

void CliHandler::handle_import_command(const CliOptions &options) {
  std::cout << "Importing " << options.import_path << " (source: " << options.source << ")"
            << std::endl;

  nlohmann::json request_data = {{"path", options.import_path}, {"source", options.source}};
  if (!options.content_type.empty()) request_data["content_type"] = options.content_type;
  if (!options.subjects.empty()) request_data["subjects"] = split_csv(options.subjects);
  if (!options.style_tags.empty()) request_data["style_tags"] = split_csv(options.style_tags);

  print_json_response(make_post_request("/import", request_data));
}

void CliHandler::handle_backup_command(const CliOptions &options) {
  nlohmann::json request_data = nlohmann::json::object();
  if (!options.dest.empty()) request_data["dest"] = options.dest;
  print_json_response(make_post_request("/backup", request_data));
}

std::string CliHandler::perform_request(const std::string &endpoint,
                                        const std::string *post_body) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }

  std::string url = build_url(endpoint);
  std::string response_buffer;
  struct curl_slist *headers = nullptr;

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  if (post_body != nullptr) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    // Error bodies are {"success": false, "error": "..."}
    auto body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (!body.is_discarded() && body.contains("error") && body["error"].is_string()) {
      throw CliError(body["error"].get<std::string>() + " (HTTP " + std::to_string(http_code) +
                     ")");
    }
    throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
  }

  return response_buffer;
}

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
  return nlohmann::json::parse(perform_request(endpoint, nullptr));
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
  const std::string request_json = data.dump();
  return nlohmann::json::parse(perform_request(endpoint, &request_json));
}

std::vector<char> CliHandler::download(const std::string &endpoint) {
  std::string body = perform_request(endpoint, nullptr);
  return std::vector<char>(body.begin(), body.end());
}

std::string CliHandler::escape(const std::string &value) {
  char *escaped =
      curl_easy_escape(curl_handle_, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw CliError("Failed to URL-encode: " + value);
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

void CliHandler::set_api_base_url(const std::string &url) {
  api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
  return api_base_url_;
}

std::string CliHandler::build_url(const std::string &endpoint) {
  return api_base_url_ + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json &response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_asset_list(const nlohmann::json &assets) {
  if (!assets.is_array() || assets.empty()) {
    std::cout << "No assets found." << std::endl;
    return;
  }

  for (const auto &asset : assets) {
    std::cout << "  - " << asset.value("id", std::string()) << "  "
              << asset.value("filename", std::string()) << " ["
              << asset.value("media_type", std::string()) << ", "
              << asset.value("source", std::string()) << "]";
    if (asset.contains("distance")) {
      std::cout << " distance: " << std::fixed << std::setprecision(3)
                << asset["distance"].get<double>();
    }
    if (asset.contains("quality_rating") && !asset["quality_rating"].is_null()) {
      std::cout << " rating: " << asset["quality_rating"].get<int>();
    }
    std::cout << std::endl;
  }
}

void CliHandler::print_help() {
  std::cout << R"(
Media Vault CLI - searchable store for generated images and videos

Usage: media_vault_cli <command> [options]

Search Commands:
  search, s     Semantic theme search
    --query <text>        What to look for
    --limit <n>           Number of results (default: 20)
    --min-quality <n>     Only assets rated at least n
    --type <image|video>  Restrict to one media type

  similar       Find assets visually similar to a local image
    --image <path>        Reference image
    --limit <n>           Number of results (default: 10)

  subject       Assets tagged with an exact subject
    --name <subject>

  episode       Assets assigned to an episode
    --number <1-8>
    --unassigned          Assets NOT assigned to that episode instead

Asset Commands:
  info, i       Show metadata for one asset
    --id <asset_id>

  export        Save the stored file of an asset
    --id <asset_id>
    --output <path>

  rate          Set a quality rating
    --id <asset_id>
    --rating <1-10>
    --notes <text>

  assign        Assign an asset to an episode
    --id <asset_id>
    --episode <1-8>

  list, l       Page through all assets
    --limit <n> --offset <n> --type <image|video> --source <source>

Collection Commands:
  stats         Collection totals
  import        Ingest every supported file in a directory on the server host
    --path <dir> --source <source>
    --content-type <t> --subjects <a,b> --styles <a,b>
  backup        Copy the store to a backup location
    --dest <path>         Defaults to the server's backup_dir

General:
  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the Media Vault API (default: http://127.0.0.1:8422)

Examples:
  media_vault_cli search --query "neon city at night" --min-quality 7
  media_vault_cli similar --image ./ref.png --limit 5
  media_vault_cli assign --id 3f2b8c1e-5d4a-4e8b-9c7d-0a1b2c3d4e5f --episode 2
  media_vault_cli import --path /data/renders --source midjourney --subjects robot,city
)" << std::endl;
}

}  // namespace media_cli
