//
//  download_pipeline.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "catalog_id.hpp"
#include "catalog_types.hpp"
#include "providers.hpp"
#include "status.hpp"
#include "vorbis_comment.hpp"

namespace oggfetch {

inline constexpr char kCommentVendor[] = "Ogg";

enum class DownloadResult {
    Written,        ///< A new file was written.
    AlreadyExists,  ///< Destination present; nothing fetched or overwritten.
    Skipped,        ///< Per-track failure; the run continues.
    Fatal,          ///< Configuration-level failure; the run must stop.
};

struct DownloadOutcome {
    DownloadResult result = DownloadResult::Skipped;
    std::string path;  ///< Destination, when it could be derived.
    Status status;     ///< Failure cause for Skipped/Fatal.
};

/// Everything the pipeline talks to. `console` receives progress lines and may be null.
struct PipelineContext {
    KeyProvider &keys;
    StreamProvider &streams;
    Decryptor &decryptor;
    CommentHeaderRewriter &rewriter;
    std::ostream *console = nullptr;
};

/// Run tally; errors are everything neither written nor already present.
struct RunSummary {
    size_t total = 0;
    size_t written = 0;
    size_t existing = 0;

    size_t errors() const { return total - written - existing; }
    void record(DownloadResult result);
};

// Title, album and one artist entry per listed artist, vendor kCommentVendor.
CommentHeader build_comment_header(const TrackRecord &record);

// Drop the kAudioPreambleSize bytes in front of the Ogg payload. False when nothing follows.
bool strip_audio_preamble(const std::vector<uint8_t> &decrypted, std::vector<uint8_t> &out);

// Fetch, decrypt, retag and store one resolved track under `output_template`. `requested`
// is the id the track was queued under; it is used in log lines when it differs from
// `record.id`. Keys are requested for `record.id`.
DownloadOutcome download_one(PipelineContext &ctx, const TrackId &requested,
                             const TrackRecord &record, const FileId &file,
                             const std::string &output_template);

}  // namespace oggfetch
