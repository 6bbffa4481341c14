//
//  track_set_resolver.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <unordered_set>
#include <vector>

#include "catalog_id.hpp"
#include "providers.hpp"
#include "reference_parser.hpp"
#include "status.hpp"

namespace oggfetch {

/// Deduplicated, unordered accumulation of track ids for one run.
using TrackIdSet = std::unordered_set<TrackId>;

/// What to do when fetching one collection out of several fails.
enum class CollectionFailurePolicy {
    Skip,   ///< Log a warning and continue with the next collection.
    Abort,  ///< Stop and return the failure.
};

// Fetch each playlist or album in `ids` and insert its tracks into `tracks`. Only
// ResourceKind::Playlist and ResourceKind::Album are valid collection kinds.
Status expand_collections(MetadataProvider &metadata, ResourceKind kind,
                          const std::vector<CatalogId> &ids, CollectionFailurePolicy policy,
                          TrackIdSet &tracks);

// Expand every album of an artist, "albums" groupings before "singles" groupings. The first
// album that cannot be fetched aborts the expansion; tracks inserted up to then stay.
Status resolve_artist(MetadataProvider &metadata, const CatalogId &artist, TrackIdSet &tracks);

// Resolve one classified reference into `tracks`. Playlist and album failures are logged and
// reported as ok (the reference is skipped); an artist failure is returned to the caller.
Status resolve_reference(MetadataProvider &metadata, const Reference &ref, TrackIdSet &tracks);

}  // namespace oggfetch
