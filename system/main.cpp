// ============= main.cpp - ROBI BACKEND (WebSocket + Gemini + SQLite) =============
#include "config.hpp"
#include "backend/gemini_backend.hpp"
#include "database/robot_store.hpp"
#include "database/people_repository.hpp"
#include "database/memory_repository.hpp"
#include "database/zone_repository.hpp"
#include "database/history_repository.hpp"
#include "database/thread_pool.hpp"
#include "history/conversation_history.hpp"
#include "transport/ws_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <drogon/drogon.h>
#include <curl/curl.h>
#include <memory>
#include <vector>

static void setup_logging(const AppConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.log_file, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("No se pudo abrir el log {}: {}", cfg.log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("robi", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_file = argc >= 2 ? argv[1] : "config.toml";

    SimpleToml toml;
    if (!toml.load(config_file)) {
        spdlog::warn("No se pudo cargar {}, usando valores por defecto", config_file);
    }

    AppConfig cfg = load_app_config(toml);
    try {
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        spdlog::error("Configuración inválida: {}", e.what());
        return 1;
    }

    setup_logging(cfg);

    spdlog::info("========================================");
    spdlog::info("🤖 ROBI BACKEND");
    spdlog::info("   Listen:  {}:{}", cfg.server.host, cfg.server.port);
    spdlog::info("   DB:      {}", cfg.db_path);
    spdlog::info("   Model:   {}", cfg.gemini.model);
    spdlog::info("========================================");

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::error("curl_global_init failed");
        return 1;
    }

    int exit_code = 0;

    try {
        RobotStore store(cfg.db_path);
        PeopleRepository people(store, cfg.embedding_size);
        MemoryRepository memories(store);
        ZoneRepository zones(store);
        HistoryRepository history_repo(store);

        ThreadPool pool(static_cast<size_t>(cfg.background_threads));
        GeminiBackend backend(cfg.gemini);

        ConversationHistory history(history_repo, backend, pool,
                                    cfg.conversation.compaction_threshold,
                                    cfg.conversation.keep_recent);

        spdlog::info("✓ Store: {} personas, {} recuerdos", people.count_persons(), memories.count());

        SessionServices services{people, memories, zones, history, backend, pool};

        SessionOptions options;
        options.api_key = cfg.server.api_key;
        options.auth_timeout_ms = cfg.server.auth_timeout_ms;
        options.max_audio_bytes = cfg.server.max_message_bytes();
        options.min_importance = cfg.memory.min_importance;
        options.context_limit = cfg.memory.context_limit;

        auto controller = std::make_shared<RobiWsController>(services, options);

        drogon::app()
            .addListener(cfg.server.host, static_cast<uint16_t>(cfg.server.port))
            .setThreadNum(static_cast<size_t>(cfg.server.threads))
            .setClientMaxWebSocketMessageSize(cfg.server.max_message_bytes())
            .registerController(controller);

        spdlog::info("✓ Escuchando en ws://{}:{}/ws/interact", cfg.server.host, cfg.server.port);

        // Drogon installs its own SIGINT/SIGTERM handlers and returns from run()
        drogon::app().run();

        spdlog::info("Deteniendo");
        controller->shutdown();

        // drain scheduled persistence before the store closes
        pool.stop();
        spdlog::info("✓ Tareas en segundo plano fallidas: {}", pool.failed_tasks());
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
