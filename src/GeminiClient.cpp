/**
 * GeminiClient.cpp - HTTP client for Gemini API
 *
 * Uses cpp-httplib for HTTPS requests to Gemini API. Both operations ask the
 * model for a strict JSON document and hand the text to ResponseParser.
 */

#include "hermes/GeminiClient.hpp"
#include "hermes/Console.hpp"
#include "hermes/ResponseParser.hpp"

#include <iostream>
#include <sstream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hermes {

static const std::string GEMINI_API_BASE = "generativelanguage.googleapis.com";
static const std::string DEFAULT_MODEL = "gemini-2.5-flash";

struct GeminiClient::Impl {
    std::string api_key;
    std::string model;
    bool debug;
    std::unique_ptr<httplib::SSLClient> client;

    struct Reply {
        bool success = false;
        std::string error;
        AIErrorKind error_kind = AIErrorKind::None;
        std::string text;
    };

    Impl(const std::string& key, const std::string& model_name, bool debug_enabled)
        : api_key(key),
          model(model_name.empty() ? DEFAULT_MODEL : model_name),
          debug(debug_enabled) {
        client = std::make_unique<httplib::SSLClient>(GEMINI_API_BASE);
        client->set_connection_timeout(30);
        client->set_read_timeout(60);
        client->set_write_timeout(30);
    }

    std::string buildEndpoint() const {
        return "/v1beta/models/" + model + ":generateContent?key=" + api_key;
    }

    Reply sendRequest(const std::string& prompt) {
        Reply reply;

        json contents = json::array();
        contents.push_back({
            {"role", "user"},
            {"parts", {{{"text", prompt}}}}
        });

        json request_body = {{"contents", contents}};

        auto res = client->Post(buildEndpoint(), request_body.dump(), "application/json");

        if (!res) {
            reply.error_kind = AIErrorKind::Network;
            reply.error = "gemini network error: " + httplib::to_string(res.error());
            return reply;
        }

        if (res->status != 200) {
            reply.error_kind = AIErrorKind::Api;
            reply.error = "gemini API error: HTTP " + std::to_string(res->status);
            try {
                json error_json = json::parse(res->body);
                if (error_json.contains("error") && error_json["error"].contains("message")) {
                    reply.error += " - " + error_json["error"]["message"].get<std::string>();
                }
            } catch (const json::exception&) {
                // body was not JSON, status line is all we have
            }
            return reply;
        }

        try {
            json res_json = json::parse(res->body);

            if (debug) {
                size_t candidates = res_json.contains("candidates") ? res_json["candidates"].size() : 0;
                printDebug(std::cerr, "gemini returned " + std::to_string(candidates) + " candidate(s)");
            }

            if (res_json.contains("candidates") &&
                !res_json["candidates"].empty() &&
                res_json["candidates"][0].contains("content") &&
                res_json["candidates"][0]["content"].contains("parts") &&
                !res_json["candidates"][0]["content"]["parts"].empty()) {

                reply.text = res_json["candidates"][0]["content"]["parts"][0]["text"].get<std::string>();
                reply.success = true;

                if (debug) {
                    printDebug(std::cerr, "raw model text: " + reply.text);
                }
            } else {
                reply.error_kind = AIErrorKind::Empty;
                reply.error = "no content returned from API";
            }
        } catch (const json::exception& e) {
            reply.error_kind = AIErrorKind::Parse;
            reply.error = std::string("JSON parse error: ") + e.what();
        }

        return reply;
    }
};

GeminiClient::GeminiClient(const std::string& api_key, const std::string& model, bool debug)
    : impl_(std::make_unique<Impl>(api_key, model, debug)) {}

GeminiClient::~GeminiClient() = default;

std::string GeminiClient::getDefaultModel() {
    return DEFAULT_MODEL;
}

std::string GeminiClient::buildGeneratePrompt(const std::string& query) {
    std::ostringstream prompt;
    prompt << "You are an expert system administrator that translates natural language queries into shell commands.\n\n"
           << "Respond with ONLY a JSON object, no markdown code blocks and no text before or after it:\n"
           << "{\"command\":\"<the generated shell command>\","
           << "\"safety\":\"<SAFE | ATTENTION>\","
           << "\"explanation\":\"<brief explanation of the command and safety reasoning>\"}\n\n"
           << "Safety guidelines:\n"
           << "- SAFE: read-only operations, file listing, navigation, help commands\n"
           << "- ATTENTION: file modifications, system changes, network operations, anything requiring sudo\n"
           << "Prefer ATTENTION when uncertain.\n\n"
           << "Generate the exact command needed, compatible with bash and zsh, using standard Unix utilities.\n\n"
           << "User query: " << query;
    return prompt.str();
}

std::string GeminiClient::buildExplainPrompt(const std::string& command) {
    std::ostringstream prompt;
    prompt << "You are an expert system administrator. Explain this shell command in a structured, educational format.\n\n"
           << "Respond with ONLY a JSON object, no markdown code blocks and no text before or after it:\n"
           << "{\"explanation\":[{\"text\":\"main command or section description\","
           << "\"details\":[\"flag explanations\",\"option explanations\"]}]}\n\n"
           << "Give each command of a pipeline its own object. Put flag and option explanations in \"details\".\n\n"
           << "Command to explain: " << command;
    return prompt.str();
}

GenerateResponse GeminiClient::generateCommand(const GenerateRequest& request) {
    auto reply = impl_->sendRequest(buildGeneratePrompt(request.query));
    if (!reply.success) {
        GenerateResponse response;
        response.error = reply.error;
        response.error_kind = reply.error_kind;
        return response;
    }
    return parseGenerateText(reply.text);
}

ExplainResponse GeminiClient::explainCommand(const ExplainRequest& request) {
    auto reply = impl_->sendRequest(buildExplainPrompt(request.command));
    if (!reply.success) {
        ExplainResponse response;
        response.error = reply.error;
        response.error_kind = reply.error_kind;
        return response;
    }
    return parseExplainText(reply.text);
}

bool GeminiClient::validate(std::string& error_message) {
    auto reply = impl_->sendRequest("Respond with only the word OK");
    if (!reply.success) {
        error_message = reply.error;
        return false;
    }
    return true;
}

} // namespace hermes
