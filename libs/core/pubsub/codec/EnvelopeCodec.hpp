#pragma once
#include <string>
#include <string_view>
#include "../model/Envelope.hpp"
#include "../ws/TransportErrors.hpp"

// JSON text codec for the wire envelope:
//   { "topic": string, "type": string, "payload": string, "silent": bool }
namespace EnvelopeCodec {

// Never throws on content: bytes that are not valid UTF-8 are replaced with U+FFFD.
std::string encode(const Envelope& envelope);

// Throws DecodeError when the bytes are not a JSON object carrying string
// "topic" and "type" fields. Missing payload/silent fall back to ""/false.
Envelope decode(std::string_view bytes);

} // namespace EnvelopeCodec
