#include "OpenPGP.hpp"
#include <vector>
#include "logger.hpp"

namespace MailAuth {

namespace {

constexpr std::string_view kBeginSignedMessage = "-----BEGIN PGP SIGNED MESSAGE-----";
constexpr std::string_view kBeginSignature = "-----BEGIN PGP SIGNATURE-----";
constexpr std::string_view kEndSignature = "-----END PGP SIGNATURE-----";

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string_view trim_trailing_blanks(std::string_view line) {
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    return line;
}

bool is_blank(std::string_view line) {
    return trim_trailing_blanks(line).empty();
}

} // namespace

std::optional<ClearSignedMessage> ClearSignedMessage::parse(std::string_view text) {
    std::vector<std::string_view> lines = split_lines(text);
    size_t i = 0;

    while (i < lines.size() && is_blank(lines[i])) ++i;
    if (i == lines.size() || trim_trailing_blanks(lines[i]) != kBeginSignedMessage) {
        LOG_DEBUG("Clear-signed message: missing header line");
        return std::nullopt;
    }
    ++i;

    ClearSignedMessage msg;
    // Armor headers up to the first empty line
    for (; i < lines.size() && !lines[i].empty(); ++i) {
        std::string_view header = lines[i];
        size_t colon = header.find(": ");
        if (colon == std::string_view::npos) {
            LOG_DEBUG("Clear-signed message: malformed armor header");
            return std::nullopt;
        }
        if (header.substr(0, colon) == "Hash") {
            if (!msg.hash_header.empty()) msg.hash_header += ",";
            msg.hash_header += std::string(header.substr(colon + 2));
        }
    }
    if (i == lines.size()) return std::nullopt;
    ++i;

    bool first = true;
    for (; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        if (trim_trailing_blanks(line) == kBeginSignature) break;
        if (line.starts_with("- ")) {
            line.remove_prefix(2);
        } else if (line.starts_with("-")) {
            // Unescaped dash lines are only legal as armor boundaries
            LOG_DEBUG("Clear-signed message: unescaped dash line in text");
            return std::nullopt;
        }
        if (!first) {
            msg.plaintext += '\n';
            msg.signed_text += "\r\n";
        }
        msg.plaintext += line;
        msg.signed_text += trim_trailing_blanks(line);
        first = false;
    }
    if (i == lines.size()) {
        LOG_DEBUG("Clear-signed message: signature block missing");
        return std::nullopt;
    }

    std::string signature;
    bool closed = false;
    for (; i < lines.size(); ++i) {
        signature += lines[i];
        signature += '\n';
        if (trim_trailing_blanks(lines[i]) == kEndSignature) {
            closed = true;
            ++i;
            break;
        }
    }
    if (!closed) {
        LOG_DEBUG("Clear-signed message: unterminated signature block");
        return std::nullopt;
    }
    for (; i < lines.size(); ++i) {
        if (!is_blank(lines[i])) {
            LOG_DEBUG("Clear-signed message: extra data after signature");
            return std::nullopt;
        }
    }

    msg.armored_signature = std::move(signature);
    return msg;
}

} // namespace MailAuth
