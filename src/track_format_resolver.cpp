//
//  track_format_resolver.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "track_format_resolver.hpp"

#include <deque>
#include <unordered_set>
#include <utility>

#include "logging.hpp"

namespace oggfetch {

bool select_audio_file(const TrackRecord &record, AudioFileFormat &format, FileId &file) {
    for (auto candidate : kPreferredFormats) {
        auto it = record.files.find(candidate);
        if (it != record.files.end()) {
            format = it->first;
            file = it->second;
            return true;
        }
    }
    return false;
}

Status resolve_playable(MetadataProvider &metadata, const TrackId &id, PlayableTrack &out) {
    std::deque<TrackId> queue{id};
    std::unordered_set<TrackId> visited;
    size_t lookups = 0;

    while (!queue.empty()) {
        const TrackId current = queue.front();
        queue.pop_front();
        if (!visited.insert(current).second) {
            continue;
        }
        if (lookups == kMaxAlternativeLookups) {
            OF_LOG("resolve", "alternatives of " << id.to_base62() << " exceed " << lookups
                                               << " lookups, giving up");
            break;
        }
        ++lookups;

        TrackRecord record;
        auto status = metadata.fetch_track(current, record);
        if (!status.ok) {
            return status;
        }

        AudioFileFormat format{};
        FileId file;
        if (select_audio_file(record, format, file)) {
            OF_LOG("resolve", "track " << current.to_base62() << " offers "
                                     << audio_file_format_name(format) << " file "
                                     << file.to_hex());
            out.record = std::move(record);
            out.format = format;
            out.file = file;
            return make_ok();
        }

        OF_LOG("resolve", "track " << current.to_base62() << " has no usable encoding, queueing "
                                 << record.alternatives.size() << " alternatives");
        queue.insert(queue.end(), record.alternatives.begin(), record.alternatives.end());
    }

    return make_error(ErrorKind::NoSuitableEncoding, "cannot find a suitable track");
}

}  // namespace oggfetch
