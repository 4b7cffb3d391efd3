#include "docuchat_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace docuchat_cli {

namespace {

// Flags come in "--flag value" pairs after the command word
std::string flag_value(int argc, char* argv[], const std::string& long_flag,
                       const std::string& short_flag) {
    for (int i = 2; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        if (flag == long_flag || flag == short_flag) {
            return argv[i + 1];
        }
    }
    return "";
}

std::string require_flag(int argc, char* argv[], const std::string& long_flag,
                         const std::string& short_flag, const std::string& usage) {
    std::string value = flag_value(argc, argv, long_flag, short_flag);
    if (value.empty()) {
        throw CliError("Missing " + long_flag + ". Usage: " + usage);
    }
    return value;
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(curl_easy_init()) {
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
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

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "ingest" || command == "i") {
        const std::string usage = "ingest --file <path> --category <politics|operations|manual> [--title <title>]";
        options.command = Command::Ingest;
        options.file_path = require_flag(argc, argv, "--file", "-f", usage);
        options.category = require_flag(argc, argv, "--category", "-c", usage);
        options.title = flag_value(argc, argv, "--title", "-t");
        options.owner = flag_value(argc, argv, "--owner", "-o");
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        options.query = require_flag(argc, argv, "--query", "-q", "search --query <query> [--top-k <k>]");
        std::string top_k = flag_value(argc, argv, "--top-k", "-k");
        if (!top_k.empty()) {
            try {
                options.top_k = std::stoi(top_k);
            } catch (const std::logic_error&) {
                throw CliError("--top-k must be a number, got '" + top_k + "'");
            }
        }
    } else if (command == "list" || command == "l") {
        options.command = Command::List;
        options.owner = flag_value(argc, argv, "--owner", "-o");
    } else if (command == "info") {
        options.command = Command::Info;
        options.document_id = require_flag(argc, argv, "--id", "-i", "info --id <document_id>");
    } else if (command == "delete" || command == "d") {
        options.command = Command::Delete;
        options.document_id = require_flag(argc, argv, "--id", "-i", "delete --id <document_id>");
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        options.prompt = require_flag(argc, argv, "--prompt", "-p",
                                      "ask --prompt <text> [--agent document-search|document-creator]");
        std::string agent = flag_value(argc, argv, "--agent", "-a");
        if (!agent.empty()) {
            options.agent_type = agent;
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }
    return options;
}

bool CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            return handle_ingest_command(options);
        case Command::Search:
            return handle_search_command(options);
        case Command::List:
            return handle_list_command(options);
        case Command::Info:
            return handle_info_command(options);
        case Command::Delete:
            return handle_delete_command(options);
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Help:
            print_help();
            return true;
    }
    return false;
}

bool CliHandler::handle_ingest_command(const CliOptions& options) {
    std::cout << "Ingesting file: " << options.file_path << std::endl;
    nlohmann::json request_data = {
        {"content", read_file(options.file_path)},
        {"category", options.category},
        {"source_file_name", std::filesystem::path(options.file_path).filename().string()}
    };
    if (!options.title.empty()) {
        request_data["title"] = options.title;
    }
    if (!options.owner.empty()) {
        request_data["owner_id"] = options.owner;
    }

    nlohmann::json response = perform_request("POST", "/api/documents", &request_data);
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("unknown error")));
        return false;
    }
    const nlohmann::json& data = response["data"];
    std::cout << "Document " << data["document"]["id"].get<std::string>() << " created: "
              << data["chunks_created"] << " chunks, " << data["embedded_chunks"]
              << " embedded (" << data["embedding_state"].get<std::string>() << ")" << std::endl;
    return true;
}

bool CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Search for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;
    nlohmann::json request_data = {
        {"query", options.query},
        {"k", options.top_k}
    };
    nlohmann::json response = perform_request("POST", "/api/search", &request_data);
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("unknown error")));
        return false;
    }
    print_search_response(response);
    return true;
}

bool CliHandler::handle_list_command(const CliOptions& options) {
    std::string endpoint = "/api/documents";
    if (!options.owner.empty()) {
        endpoint += "?owner=" + escape_path_segment(options.owner);
    }
    nlohmann::json response = perform_request("GET", endpoint);
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("unknown error")));
        return false;
    }
    const nlohmann::json& documents = response["data"]["documents"];
    std::cout << documents.size() << " documents" << std::endl;
    for (const auto& document : documents) {
        std::cout << "  " << document["id"].get<std::string>() << "  "
                  << std::left << std::setw(12) << document["category"].get<std::string>()
                  << document["title"].get<std::string>() << "  ("
                  << document["uploaded_at"].get<std::string>() << ")" << std::endl;
    }
    return true;
}

bool CliHandler::handle_info_command(const CliOptions& options) {
    const std::string id = escape_path_segment(options.document_id);
    nlohmann::json document = perform_request("GET", "/api/documents/" + id);
    if (!document.value("success", false)) {
        print_error(document.value("error", std::string("unknown error")));
        return false;
    }
    nlohmann::json chunks = perform_request("GET", "/api/documents/" + id + "/chunks");
    nlohmann::json data = document["data"];
    data.erase("content");
    if (chunks.value("success", false)) {
        data["chunks"] = chunks["data"]["count"];
    }
    std::cout << data.dump(2) << std::endl;
    return true;
}

bool CliHandler::handle_delete_command(const CliOptions& options) {
    nlohmann::json response =
        perform_request("DELETE", "/api/documents/" + escape_path_segment(options.document_id));
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("unknown error")));
        return false;
    }
    std::cout << "Deleted document " << options.document_id << std::endl;
    return true;
}

bool CliHandler::handle_ask_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"prompt", options.prompt},
        {"agent_type", options.agent_type}
    };
    nlohmann::json response = perform_request("POST", "/api/generate", &request_data);
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("unknown error")));
        return false;
    }
    print_answer_response(response);
    return true;
}

// Error statuses still carry a JSON body, so only transport failures throw
nlohmann::json CliHandler::perform_request(const std::string& method, const std::string& endpoint,
                                           const nlohmann::json* body) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = body ? body->dump() : "";
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    curl_slist* headers = nullptr;
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    try {
        return nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error&) {
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::escape_path_segment(const std::string& segment) {
    if (segment.empty()) {
        return "";
    }
    char* escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode: " + segment);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string CliHandler::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Cannot open file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    const nlohmann::json& results = response["results"];
    std::cout << "\n=== Search Results (" << response["mode"].get<std::string>() << ") ===" << std::endl;
    if (results.empty()) {
        std::cout << "No matching chunks." << std::endl;
        return;
    }
    int rank = 1;
    for (const auto& result : results) {
        std::cout << "\n" << rank++ << ". " << result["document"]["title"].get<std::string>()
                  << " [chunk " << result["chunk"]["chunk_index"] << "] (score: " << std::fixed
                  << std::setprecision(3) << result["score"].get<float>() << ")" << std::endl;
        std::string content = result["chunk"]["content"].get<std::string>();
        if (content.size() > 200) {
            content = content.substr(0, 200) + "...";
        }
        std::cout << "   " << content << std::endl;
    }
}

void CliHandler::print_answer_response(const nlohmann::json& response) {
    std::cout << response["response"].get<std::string>() << std::endl;
    const nlohmann::json& sources = response["sources"];
    if (!sources.empty()) {
        std::cout << "\nSources:" << std::endl;
        for (const auto& source : sources) {
            std::cout << "  - " << source["document"]["title"].get<std::string>() << " [chunk "
                      << source["chunk"]["chunk_index"] << "]" << std::endl;
        }
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "Docuchat CLI - document ingestion and retrieval\n\n"
              << "Usage: docuchat_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  ingest, i   --file <path> --category <politics|operations|manual> [--title <t>] [--owner <o>]\n"
              << "  search, s   --query <text> [--top-k <k>]\n"
              << "  list, l     [--owner <o>]\n"
              << "  info        --id <document_id>\n"
              << "  delete, d   --id <document_id>\n"
              << "  ask, a      --prompt <text> [--agent document-search|document-creator]\n"
              << "  help, h\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  server address (default http://127.0.0.1:3030)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string base = api_base_url_;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

}  // namespace docuchat_cli
