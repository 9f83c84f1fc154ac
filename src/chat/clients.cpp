#include "voice_bridge/chat/clients.hpp"

#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::chat {

RagQueryClient::RagQueryClient(BackendClient& client) : client_(client) {}

std::optional<std::string> RagQueryClient::ask(const std::string& question) {
    const auto response = client_.post_json("query", {{"question", question}});
    if (!response.is_object()) {
        throw BackendError("Malformed backend response: expected an object");
    }
    const auto it = response.find("answer");
    if (it == response.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw BackendError("Malformed backend response: answer is not a string");
    }
    return it->get<std::string>();
}

AcsChatClient::AcsChatClient(BackendClient& client, std::string api_version)
    : client_(client), api_version_(std::move(api_version)) {}

void AcsChatClient::send_message(const std::string& thread_id, const std::string& text) {
    const auto path = "chat/threads/" + utils::url_encode(thread_id) + "/messages";
    client_.post_json(path,
                      {{"content", text}, {"type", "text"}},
                      "api-version=" + utils::url_encode(api_version_));
    logging::info("Chat reply sent", {kv("thread_id", thread_id)});
}

}
