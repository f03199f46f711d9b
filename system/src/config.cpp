#include "config.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
    std::string get_env(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return (value == nullptr || std::string(value).empty()) ? fallback : std::string(value);
    }
}

// ==================== SIMPLE TOML ====================

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

bool SimpleToml::load_string(const std::string& content) {
    std::istringstream in(content);
    std::string line, section;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            auto hash = val.find('#');
            if (hash != std::string::npos) {
                val = trim(val.substr(0, hash));
            }
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

double SimpleToml::get_double(const std::string& key, double def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try { return std::stod(it->second); }
    catch (const std::exception&) { return def; }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    return it->second == "true" || it->second == "1";
}

// ==================== APP CONFIG ====================

AppConfig load_app_config(const SimpleToml& toml) {
    AppConfig cfg;

    cfg.server.host = toml.get("server.host", Config::DEFAULT_HOST);
    cfg.server.port = toml.get_int("server.port", Config::DEFAULT_PORT);
    cfg.server.api_key = toml.get("server.api_key", "");
    cfg.server.auth_timeout_ms = toml.get_int("server.auth_timeout_ms", Config::DEFAULT_AUTH_TIMEOUT_MS);
    cfg.server.max_message_mb = toml.get_int("server.max_message_mb", Config::DEFAULT_MAX_MESSAGE_MB);
    cfg.server.threads = toml.get_int("server.threads", Config::DEFAULT_SERVER_THREADS);

    cfg.gemini.api_key = toml.get("gemini.api_key", "");
    cfg.gemini.base_url = toml.get("gemini.base_url", Config::DEFAULT_GEMINI_BASE_URL);
    cfg.gemini.model = toml.get("gemini.model", Config::DEFAULT_GEMINI_MODEL);
    cfg.gemini.max_output_tokens = toml.get_int("gemini.max_output_tokens", Config::DEFAULT_MAX_OUTPUT_TOKENS);
    cfg.gemini.temperature = toml.get_double("gemini.temperature", Config::DEFAULT_TEMPERATURE);
    cfg.gemini.timeout_ms = toml.get_int("gemini.timeout_ms", Config::DEFAULT_BACKEND_TIMEOUT_MS);

    cfg.db_path = toml.get("database.path", Config::DEFAULT_DB_PATH);
    cfg.embedding_size = toml.get_int("database.embedding_size", Config::DEFAULT_EMBEDDING_SIZE);

    cfg.conversation.compaction_threshold =
        toml.get_int("conversation.compaction_threshold", Config::DEFAULT_COMPACTION_THRESHOLD);
    cfg.conversation.keep_recent = toml.get_int("conversation.keep_recent", Config::DEFAULT_KEEP_RECENT);

    cfg.memory.min_importance = toml.get_int("memory.min_importance", Config::DEFAULT_MIN_IMPORTANCE);
    cfg.memory.context_limit = toml.get_int("memory.context_limit", Config::DEFAULT_CONTEXT_LIMIT);

    cfg.background_threads = toml.get_int("background.threads", Config::DEFAULT_BACKGROUND_THREADS);

    cfg.log_level = toml.get("logging.level", "info");
    cfg.log_file = toml.get("logging.file", "");

    // Secrets are normally injected through the environment
    cfg.server.api_key = get_env("ROBI_API_KEY", cfg.server.api_key);
    cfg.gemini.api_key = get_env("GEMINI_API_KEY", cfg.gemini.api_key);
    cfg.db_path = get_env("ROBI_DB_PATH", cfg.db_path);

    return cfg;
}

void AppConfig::validate() const {
    if (server.api_key.empty()) {
        throw std::invalid_argument("server.api_key is empty (set ROBI_API_KEY)");
    }
    if (server.port <= 0 || server.port > 65535) {
        throw std::invalid_argument("server.port out of range");
    }
    if (server.auth_timeout_ms <= 0) {
        throw std::invalid_argument("server.auth_timeout_ms must be positive");
    }
    if (server.max_message_mb <= 0) {
        throw std::invalid_argument("server.max_message_mb must be positive");
    }
    if (embedding_size <= 0) {
        throw std::invalid_argument("database.embedding_size must be positive");
    }
    if (conversation.compaction_threshold <= 0 || conversation.keep_recent < 0) {
        throw std::invalid_argument("conversation thresholds must be positive");
    }
    if (conversation.keep_recent >= conversation.compaction_threshold) {
        throw std::invalid_argument("conversation.keep_recent must be below compaction_threshold");
    }
    if (memory.min_importance < 1 || memory.min_importance > 10) {
        throw std::invalid_argument("memory.min_importance must be in 1..10");
    }
    if (background_threads <= 0) {
        throw std::invalid_argument("background.threads must be positive");
    }
}
