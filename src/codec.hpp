#pragma once
#include "backend.hpp"
#include "segment.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace mtsatori {

struct CodecContext {
    int64_t self_id = 0;   // account the bridge runs as, embedded in media urls
};

// Native limits the encoder has to respect.
struct TargetCapabilities {
    size_t max_text_length = 4096;     // UTF-16 units per text message
    size_t max_caption_length = 1024;  // UTF-16 units per media caption
    size_t max_album_size = 10;
    size_t max_buttons_per_row = 5;
};

// Native files are exposed as "internal:telegram/<self_id>/<file_id>" and
// served through the gateway proxy route.
std::string internal_media_url(int64_t self_id, const std::string& file_id);

// Returns the file id of an internal media url, nullopt for anything else.
std::optional<std::string> parse_internal_media_url(const std::string& url,
                                                    int64_t* self_id = nullptr);

// Native message -> ordered gateway segments.
Segments to_segments(const NativeMessage& message, const CodecContext& ctx);

// A logical send may need several native sends (long text, captions over
// the limit, albums over the size cap). Parts are sent in order.
struct SendPlan {
    std::vector<NativeSendRequest> parts;
    std::vector<Diagnostic> diagnostics;
};

// Gateway segments -> native sends. Never throws for content problems:
// unsupported pieces are dropped or approximated and reported as diagnostics.
SendPlan from_segments(const Segments& segments, int64_t chat_id,
                       const TargetCapabilities& caps);

struct EditPlan {
    std::string text;
    std::vector<NativeEntity> entities;
    NativeKeyboard keyboard;
    std::vector<Diagnostic> diagnostics;
};

// Text, entities and keyboard of a message edit. Media cannot be changed by
// an edit and is reported as a diagnostic.
EditPlan edit_text(const Segments& segments, const TargetCapabilities& caps);

// Entities of [offset, offset + length) re-based onto that window.
std::vector<NativeEntity> clip_entities(const std::vector<NativeEntity>& entities,
                                        size_t offset, size_t length);

} // namespace mtsatori
