#pragma once
#include <map>
#include <string>

namespace Config {

    // Server defaults
    constexpr const char* DEFAULT_HOST = "0.0.0.0";
    constexpr int DEFAULT_PORT = 9393;
    constexpr int DEFAULT_AUTH_TIMEOUT_MS = 10000;
    constexpr int DEFAULT_MAX_MESSAGE_MB = 50;
    constexpr int DEFAULT_SERVER_THREADS = 2;

    // Gemini defaults
    constexpr const char* DEFAULT_GEMINI_BASE_URL = "https://generativelanguage.googleapis.com";
    constexpr const char* DEFAULT_GEMINI_MODEL = "gemini-2.0-flash-lite";
    constexpr int DEFAULT_MAX_OUTPUT_TOKENS = 512;
    constexpr double DEFAULT_TEMPERATURE = 0.7;
    constexpr int DEFAULT_BACKEND_TIMEOUT_MS = 60000;

    // Storage defaults
    constexpr const char* DEFAULT_DB_PATH = "data/robot.db";
    constexpr int DEFAULT_EMBEDDING_SIZE = 128;

    // Conversation / memory defaults
    constexpr int DEFAULT_COMPACTION_THRESHOLD = 20;
    constexpr int DEFAULT_KEEP_RECENT = 5;
    constexpr int DEFAULT_MIN_IMPORTANCE = 5;
    constexpr int DEFAULT_CONTEXT_LIMIT = 5;
    constexpr int DEFAULT_BACKGROUND_THREADS = 2;

    // Tag decoder
    constexpr size_t MAX_HEADER_BUFFER = 500;

    // WebSocket close codes (RFC 6455)
    constexpr int CLOSE_NORMAL = 1000;
    constexpr int CLOSE_POLICY_VIOLATION = 1008;
    constexpr int CLOSE_INTERNAL_ERROR = 1011;

    // Exploration defaults
    constexpr int DEFAULT_EXPLORE_MINUTES = 5;
}

// Minimal TOML reader: [sections], key = value, "quoted strings", # comments
class SimpleToml {
public:
    bool load(const std::string& filename);
    bool load_string(const std::string& content);

    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    bool has(const std::string& key) const { return values.count(key) > 0; }

private:
    std::map<std::string, std::string> values;
};

struct ServerConfig {
    std::string host = Config::DEFAULT_HOST;
    int port = Config::DEFAULT_PORT;
    std::string api_key;
    int auth_timeout_ms = Config::DEFAULT_AUTH_TIMEOUT_MS;
    int max_message_mb = Config::DEFAULT_MAX_MESSAGE_MB;
    int threads = Config::DEFAULT_SERVER_THREADS;

    size_t max_message_bytes() const {
        return static_cast<size_t>(max_message_mb) * 1024 * 1024;
    }
};

struct GeminiConfig {
    std::string api_key;
    std::string base_url = Config::DEFAULT_GEMINI_BASE_URL;
    std::string model = Config::DEFAULT_GEMINI_MODEL;
    int max_output_tokens = Config::DEFAULT_MAX_OUTPUT_TOKENS;
    double temperature = Config::DEFAULT_TEMPERATURE;
    int timeout_ms = Config::DEFAULT_BACKEND_TIMEOUT_MS;
};

struct ConversationConfig {
    int compaction_threshold = Config::DEFAULT_COMPACTION_THRESHOLD;
    int keep_recent = Config::DEFAULT_KEEP_RECENT;
};

struct MemoryConfig {
    int min_importance = Config::DEFAULT_MIN_IMPORTANCE;
    int context_limit = Config::DEFAULT_CONTEXT_LIMIT;
};

struct AppConfig {
    ServerConfig server;
    GeminiConfig gemini;
    ConversationConfig conversation;
    MemoryConfig memory;

    std::string db_path = Config::DEFAULT_DB_PATH;
    int embedding_size = Config::DEFAULT_EMBEDDING_SIZE;
    int background_threads = Config::DEFAULT_BACKGROUND_THREADS;

    std::string log_level = "info";
    std::string log_file;

    // Throws std::invalid_argument describing the first bad value
    void validate() const;
};

// File values first, then ROBI_API_KEY / GEMINI_API_KEY / ROBI_DB_PATH from the environment
AppConfig load_app_config(const SimpleToml& toml);
