#pragma once

#include <string_view>
#include <nlohmann/json.hpp>

namespace MailAuth {

// JSON request/response channel to the API. Implementations throw
// AuthError(TransportError) for network, HTTP and decoding failures; the
// body of a non-2xx answer is still returned when it is JSON, so API error
// codes reach the caller.
class Transport {
public:
    virtual ~Transport() = default;

    virtual nlohmann::json post_json(std::string_view path, const nlohmann::json& body) = 0;
};

} // namespace MailAuth
