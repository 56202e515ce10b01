#pragma once
#include <tether/bridge/payload.h>
#include <tether/core/status.h>

#include <string>
#include <string_view>

namespace tether::bridge {

// The (payload, error) pair produced by handlers and native requests.
struct Reply {
    Payload payload;
    core::Status status;

    static Reply success(Payload payload = {});
    static Reply failure(core::ErrorCode code, std::string message);
    static Reply failure(core::Status status);
};

// Envelope on the wire:
//   {"ok":true,"payload":<value>}
//   {"ok":false,"error":"<code>","message":"<text>"}
std::string encode_reply(const Reply& reply);

// Malformed envelopes decode to a DecodeError reply.
Reply decode_reply(std::string_view text);

} // namespace tether::bridge
