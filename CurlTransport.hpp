#pragma once

#include "ClientConfig.hpp"
#include "Transport.hpp"

namespace MailAuth {

// Blocking HTTPS transport over libcurl. One easy handle per request;
// requires initialize_mailauth_library() to have run.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(ClientConfig config);

    nlohmann::json post_json(std::string_view path, const nlohmann::json& body) override;

private:
    ClientConfig config_;
};

} // namespace MailAuth
