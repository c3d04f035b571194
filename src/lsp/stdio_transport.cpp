#include <mcn_ls/lsp/stdio_transport.hpp>

#include <mcn_ls/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace mcn_ls {

namespace {

constexpr const char* kContentLength = "content-length:";

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Decimal digits with optional surrounding blanks. nullopt for anything
// else, including a sign or a value that does not fit.
std::optional<uint64_t> ParseLength(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = value.find_last_not_of(" \t");

    uint64_t length = 0;
    for (size_t i = first; i <= last; ++i) {
        const char c = value[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (length > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        length = length * 10 + digit;
    }
    return length;
}

} // anonymous namespace

size_t FrameLimitFor(size_t max_source_bytes) {
    constexpr size_t kMax = std::numeric_limits<size_t>::max();
    if (max_source_bytes > (kMax - kFrameEnvelopeBytes) / 2) {
        return kMax;
    }
    return max_source_bytes * 2 + kFrameEnvelopeBytes;
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, size_t max_frame_bytes)
    : in_(in), out_(out), max_frame_bytes_(max_frame_bytes) {}

OutboundHandles StdioTransport::MakeOutboundHandles() {
    OutboundHandles handles;
    handles.send_notification = [this](const std::string& method, const nlohmann::json& params) {
        WriteFrame(MakeNotification(method, params));
    };
    handles.send_request = [this](const std::string& method, const nlohmann::json& params) {
        const int64_t id = next_request_id_++;
        WriteFrame(MakeRequest(id, method, params));
        return nlohmann::json(id);
    };
    return handles;
}

std::optional<std::string> StdioTransport::ReadFrame() {
    while (true) {
        std::optional<size_t> length;
        std::string line;
        bool saw_header = false;
        bool rejected = false;

        while (std::getline(in_, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                if (saw_header) {
                    break;
                }
                continue;  // stray blank line between frames
            }
            saw_header = true;

            // The header may follow the unread body of a skipped frame.
            const auto at = ToLower(line).find(kContentLength);
            if (at != std::string::npos) {
                if (at > 0) {
                    LogWarn("transport", "Discarding " + std::to_string(at) +
                                             " bytes before Content-Length");
                }
                const auto parsed = ParseLength(
                    line.substr(at + std::char_traits<char>::length(kContentLength)));
                if (!parsed) {
                    LogWarn("transport", "Invalid Content-Length header: " + line);
                    length.reset();
                    rejected = true;
                } else if (*parsed > max_frame_bytes_) {
                    LogWarn("transport", "Skipping frame of " + std::to_string(*parsed) +
                                             " bytes (limit " +
                                             std::to_string(max_frame_bytes_) + ")");
                    length.reset();
                    rejected = true;
                } else {
                    length = static_cast<size_t>(*parsed);
                    rejected = false;
                }
            }
        }

        if (!in_) {
            return std::nullopt;
        }
        if (rejected) {
            continue;
        }
        if (!length) {
            LogWarn("transport", "Skipping header block without Content-Length");
            continue;
        }

        std::string body(*length, '\0');
        in_.read(&body[0], static_cast<std::streamsize>(*length));
        if (static_cast<size_t>(in_.gcount()) != *length) {
            LogWarn("transport", "Input ended inside a message body");
            return std::nullopt;
        }
        return body;
    }
}

void StdioTransport::WriteFrame(const nlohmann::json& message) {
    const std::string body = message.dump();
    out_ << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    out_.flush();
}

int StdioTransport::Run(LanguageServer& server) {
    LogInfo("transport", "Serving on stdio");

    while (server.Phase() != ServerPhase::Exited) {
        auto frame = ReadFrame();
        if (!frame) {
            LogInfo("transport", "End of input");
            break;
        }

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(*frame);
        } catch (const nlohmann::json::exception& e) {
            LogWarn("transport", std::string("Malformed JSON: ") + e.what());
            WriteFrame(Response::Failure(nullptr, ResponseError{ErrorCode::ParseError,
                                                                "Parse error"}).ToJson());
            continue;
        }

        if (IsClientResponse(message)) {
            LogDebug("transport", "Ignoring client response to id " + message["id"].dump());
            continue;
        }

        auto response = server.HandleMessage(message);
        if (response) {
            WriteFrame(*response);
        }
    }
    return server.ExitCode();
}

} // namespace mcn_ls
