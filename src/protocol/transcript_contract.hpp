#pragma once
#include <string>
#include <vector>

namespace crew::protocol {

    // Identity of an agent registered with the planning service.
    struct AgentDescriptor {
        std::string assistant_id;
        std::string thread_id;
        std::string name;
        std::string role;
    };

    struct ContentItem {
        std::string type;   // "output_text" or "text"
        std::string text;
    };

    struct TranscriptMessage {
        std::string role;   // "user" or "assistant"
        std::vector<ContentItem> content;
    };

    // Messages are in chronological order (oldest first).
    struct Transcript {
        std::string run_status;
        std::vector<TranscriptMessage> messages;
    };

} // namespace crew::protocol
