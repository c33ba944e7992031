#include "commands.hpp"
#include "config.hpp"
#include "entity_manager.hpp"
#include "fallback.hpp"
#include "http.hpp"
#include "persistence.hpp"
#include "provider.hpp"
#include "summarizer.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: strata [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Ingest a single message and exit\n"
              << "  --entity ID          Conversation/persona to work on (default: default)\n"
              << "  --speaker NAME       Name the summaries use for the user (default: User)\n"
              << "  --provider NAME      Provider for summarizer backend \"provider\" (anthropic, ollama)\n"
              << "  --model NAME         Model for the provider\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Type /help in the REPL for commands.\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY        API key for Anthropic\n"
              << "  OLLAMA_BASE_URL          Base URL for Ollama (default: http://localhost:11434)\n"
              << "  STRATA_FALLBACK_URL      Base URL of the external memory service\n"
              << "  STRATA_FALLBACK_API_KEY  Bearer token for the external memory service\n"
              << "  STRATA_PERSISTENCE_PATH  Snapshot directory (json) or database file (sqlite)\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string entity_id = "default";
    std::string speaker = "User";
    std::string provider_name;
    std::string model_name;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--entity") == 0 && i + 1 < argc) {
            entity_id = argv[++i];
        } else if (std::strcmp(argv[i], "--speaker") == 0 && i + 1 < argc) {
            speaker = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = strata::Config::load();

    // Override config with CLI args
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;

    // Lives for the whole process: timed-out summarizer calls may still be
    // using it from their worker threads.
    static strata::SocketHttpClient http_client;

    std::shared_ptr<strata::Provider> provider;
    if (config.summarizer.backend == "provider") {
        try {
            provider = strata::create_provider(config.provider,
                                               config.api_key_for(config.provider),
                                               http_client,
                                               config.base_url_for(config.provider));
        } catch (const std::exception& e) {
            std::cerr << "Error creating provider: " << e.what() << "\n";
            return 1;
        }
    }

    std::shared_ptr<strata::SummarizationPort> port;
    std::shared_ptr<strata::ExternalMemoryFallback> fallback;
    std::shared_ptr<strata::PersistenceSink> sink;
    try {
        port = strata::create_summarizer(config.summarizer, provider,
                                         config.model, config.temperature);
        fallback = strata::create_fallback(config.fallback, http_client);
        sink = strata::create_sink(config.persistence);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    strata::EntityManager entities(config.ledger, port, fallback, sink,
                                   config.fallback.limit);

    // Single message mode
    if (!message.empty()) {
        std::cout << strata::cmd_ingest(entities, entity_id, message,
                                        strata::Role::User, speaker);
        entities.persist(entity_id);
        return 0;
    }

    // Interactive REPL
    entities.get(entity_id);
    std::cout << "Strata hierarchical memory\n"
              << "Entity: " << entity_id << " | Summarizer: " << port->name()
              << " | Persistence: " << sink->backend_name() << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "strata> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        entities.evict_idle(config.entities.max_idle_seconds);

        bool quit = false;
        std::string out = strata::handle_line(line, entities, entity_id, speaker, quit);
        if (quit) break;
        std::cout << out;
    }

    entities.persist_all();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
