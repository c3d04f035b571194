#pragma once

#include <mcn_ls/config/app_config.hpp>
#include <mcn_ls/lsp/language_server.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// StdioTransport: LSP base protocol over a pair of streams.
//
// Frames are "Content-Length: N\r\n\r\n" followed by N bytes of JSON. Other
// headers are ignored. A header block whose Content-Length is missing, is
// not a plain decimal number, or exceeds the frame limit is skipped without
// reading a body; reading resumes at the next Content-Length header, even
// one found partway through a line.
// ---------------------------------------------------------------------------

// Room for the JSON-RPC envelope around a document's text.
constexpr size_t kFrameEnvelopeBytes = 64 * 1024;

// Largest frame accepted when documents may be max_source_bytes long. Text
// is allowed to double under JSON escaping.
size_t FrameLimitFor(size_t max_source_bytes);

class StdioTransport {
public:
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout,
                            size_t max_frame_bytes = FrameLimitFor(kDefaultMaxSourceBytes));

    // Handles writing to this transport. Server requests get increasing
    // integer ids; send_request returns the id, replies are not awaited.
    [[nodiscard]] OutboundHandles MakeOutboundHandles();

    // Next frame body, or nullopt at end of input.
    std::optional<std::string> ReadFrame();
    void WriteFrame(const nlohmann::json& message);

    // Feed frames to the server until it exits or input ends. Returns the
    // process exit code.
    int Run(LanguageServer& server);

private:
    std::istream& in_;
    std::ostream& out_;
    size_t max_frame_bytes_;
    int64_t next_request_id_ = 1;
};

} // namespace mcn_ls
