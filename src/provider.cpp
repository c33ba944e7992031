#include "provider.hpp"
#include "plugin.hpp"

namespace strata {

std::string Provider::chat_simple(const std::string& system_prompt,
                                  const std::string& message,
                                  const std::string& model,
                                  double temperature) {
    std::vector<ChatMessage> messages;
    if (!system_prompt.empty()) {
        messages.push_back({Role::System, system_prompt});
    }
    messages.push_back({Role::User, message});
    return chat(messages, model, temperature);
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url) {
    return PluginRegistry::instance().create_provider(name, api_key, http, base_url);
}

} // namespace strata
