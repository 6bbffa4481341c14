//
//  track_set_resolver.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "track_set_resolver.hpp"

#include "logging.hpp"

namespace oggfetch {

namespace {

Status fetch_collection(MetadataProvider &metadata, ResourceKind kind, const CatalogId &id,
                        std::vector<TrackId> &out) {
    switch (kind) {
        case ResourceKind::Playlist:
            return metadata.fetch_playlist(id, out);
        case ResourceKind::Album:
            return metadata.fetch_album(id, out);
        case ResourceKind::Track:
        case ResourceKind::Artist:
            break;
    }
    return make_error(ErrorKind::Parse,
                      std::string(resource_kind_name(kind)) + " is not a track collection");
}

Status expand_groups(MetadataProvider &metadata, const std::vector<AlbumGroup> &groups,
                     TrackIdSet &tracks) {
    for (const auto &group : groups) {
        auto status = expand_collections(metadata, ResourceKind::Album, group.albums,
                                         CollectionFailurePolicy::Abort, tracks);
        if (!status.ok) {
            return status;
        }
    }
    return make_ok();
}

}  // namespace

Status expand_collections(MetadataProvider &metadata, ResourceKind kind,
                          const std::vector<CatalogId> &ids, CollectionFailurePolicy policy,
                          TrackIdSet &tracks) {
    for (const auto &id : ids) {
        std::vector<TrackId> listed;
        auto status = fetch_collection(metadata, kind, id, listed);
        if (!status.ok) {
            if (policy == CollectionFailurePolicy::Abort) {
                return status;
            }
            OF_LOG("warn", "cannot get " << resource_kind_name(kind) << " metadata: "
                                         << status.message << ", skipping...");
            continue;
        }
        const size_t before = tracks.size();
        tracks.insert(listed.begin(), listed.end());
        OF_LOG("resolve", resource_kind_name(kind) << " " << id.to_base62() << ": "
                                                 << listed.size() << " listed, "
                                                 << (tracks.size() - before) << " new");
    }
    return make_ok();
}

Status resolve_artist(MetadataProvider &metadata, const CatalogId &artist, TrackIdSet &tracks) {
    ArtistRecord record;
    auto status = metadata.fetch_artist(artist, record);
    if (!status.ok) {
        return status;
    }
    OF_LOG("resolve", "artist " << artist.to_base62() << ": " << record.albums.size()
                              << " album groups, " << record.singles.size()
                              << " single groups");
    status = expand_groups(metadata, record.albums, tracks);
    if (!status.ok) {
        return status;
    }
    return expand_groups(metadata, record.singles, tracks);
}

Status resolve_reference(MetadataProvider &metadata, const Reference &ref, TrackIdSet &tracks) {
    switch (ref.kind) {
        case ResourceKind::Track:
            tracks.insert(ref.id);
            return make_ok();
        case ResourceKind::Playlist:
        case ResourceKind::Album:
            return expand_collections(metadata, ref.kind, {ref.id},
                                      CollectionFailurePolicy::Skip, tracks);
        case ResourceKind::Artist:
            return resolve_artist(metadata, ref.id, tracks);
    }
    return make_error(ErrorKind::Parse, "unknown reference kind");
}

}  // namespace oggfetch
