/*
Relay — EnvelopeCodec
Role: Converts Envelope values to and from their JSON wire form.
Inputs/Outputs: Envelope ↔ UTF-8 JSON text.
Threading: Stateless; safe from any thread.
Observability: None; DecodeError carries the reason and the session logs it.
Related: Envelope.hpp, SessionController.cpp.
*/
#include "EnvelopeCodec.hpp"
#include <nlohmann/json.hpp>

namespace EnvelopeCodec {

std::string encode(const Envelope& envelope) {
    nlohmann::json msg;
    msg["topic"]   = envelope.topic;
    msg["type"]    = envelope.type;
    msg["payload"] = envelope.payload;
    msg["silent"]  = envelope.silent;
    // Payloads are opaque; invalid UTF-8 becomes U+FFFD instead of throwing on the strand
    return msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Envelope decode(std::string_view bytes) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("envelope is not valid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw DecodeError("envelope must be a JSON object");
    }
    const auto topic = j.find("topic");
    if (topic == j.end() || !topic->is_string()) {
        throw DecodeError("envelope is missing a string 'topic'");
    }
    const auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        throw DecodeError("envelope is missing a string 'type'");
    }

    Envelope out;
    out.topic = topic->get<std::string>();
    out.type  = type->get<std::string>();

    if (const auto payload = j.find("payload"); payload != j.end() && !payload->is_null()) {
        // Peers occasionally inline the JSON payload instead of stringifying it
        out.payload = payload->is_string() ? payload->get<std::string>() : payload->dump();
    }
    if (const auto silent = j.find("silent"); silent != j.end()) {
        if (!silent->is_boolean()) {
            throw DecodeError("envelope field 'silent' must be a boolean");
        }
        out.silent = silent->get<bool>();
    }
    return out;
}

} // namespace EnvelopeCodec
