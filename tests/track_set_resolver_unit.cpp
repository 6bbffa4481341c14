// Unit coverage for expanding references into the deduplicated track id set.
#include <cstdio>
#include <string>
#include <vector>

#include "logging.hpp"
#include "test_fakes.hpp"
#include "track_set_resolver.hpp"

using namespace oggfetch;
using test_fakes::FakeCatalog;
using test_fakes::make_id;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[track_set_resolver_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

Reference ref(ResourceKind kind, uint64_t n) {
    return Reference{kind, make_id(n), make_id(n).to_base62()};
}

bool test_track_and_playlist_dedup() {
    FakeCatalog catalog;
    catalog.playlists[make_id(100)] = {make_id(1), make_id(2), make_id(1)};
    TrackIdSet tracks;
    bool ok = check(resolve_reference(catalog, ref(ResourceKind::Track, 1), tracks).ok,
                    "track reference resolves");
    ok &= check(resolve_reference(catalog, ref(ResourceKind::Playlist, 100), tracks).ok,
                "playlist reference resolves");
    ok &= check(tracks.size() == 2, "track id shared by track and playlist appears once");
    ok &= check(tracks.count(make_id(1)) == 1 && tracks.count(make_id(2)) == 1,
                "both ids present");
    ok &= check(catalog.calls.size() == 1, "a track reference needs no fetch");
    return ok;
}

bool test_collection_failure_skips() {
    FakeCatalog catalog;
    catalog.albums[make_id(200)] = {make_id(3)};
    TrackIdSet tracks;
    tracks.insert(make_id(9));
    bool ok = check(resolve_reference(catalog, ref(ResourceKind::Playlist, 404), tracks).ok,
                    "missing playlist is skipped, not propagated");
    ok &= check(resolve_reference(catalog, ref(ResourceKind::Album, 405), tracks).ok,
                "missing album is skipped, not propagated");
    ok &= check(resolve_reference(catalog, ref(ResourceKind::Album, 200), tracks).ok,
                "next album still resolves");
    ok &= check(tracks.size() == 2, "earlier ids kept, new ids added");
    return ok;
}

bool test_expand_collections_policies() {
    FakeCatalog catalog;
    catalog.albums[make_id(1)] = {make_id(11)};
    catalog.albums[make_id(3)] = {make_id(33)};
    const std::vector<CatalogId> ids = {make_id(1), make_id(2), make_id(3)};

    TrackIdSet skipped;
    bool ok = check(expand_collections(catalog, ResourceKind::Album, ids,
                                       CollectionFailurePolicy::Skip, skipped)
                        .ok,
                    "skip policy reports ok");
    ok &= check(skipped.size() == 2, "skip policy continues past the failing album");

    TrackIdSet aborted;
    auto status = expand_collections(catalog, ResourceKind::Album, ids,
                                     CollectionFailurePolicy::Abort, aborted);
    ok &= check(!status.ok && status.kind == ErrorKind::MetadataFetch,
                "abort policy returns the fetch error");
    ok &= check(aborted.size() == 1 && aborted.count(make_id(11)) == 1,
                "abort policy stops at the failing album");
    return ok;
}

bool test_artist_order() {
    FakeCatalog catalog;
    ArtistRecord artist;
    artist.id = make_id(500);
    artist.albums = {AlbumGroup{{make_id(10), make_id(11)}}, AlbumGroup{{make_id(12)}}};
    artist.singles = {AlbumGroup{{make_id(20)}}};
    catalog.artists[artist.id] = artist;
    catalog.albums[make_id(10)] = {make_id(1)};
    catalog.albums[make_id(11)] = {make_id(2)};
    catalog.albums[make_id(12)] = {make_id(3)};
    catalog.albums[make_id(20)] = {make_id(4), make_id(1)};

    TrackIdSet tracks;
    bool ok = check(resolve_reference(catalog, ref(ResourceKind::Artist, 500), tracks).ok,
                    "artist resolves");
    const std::vector<std::string> expected = {"artist:500", "album:10", "album:11", "album:12",
                                               "album:20"};
    ok &= check(catalog.calls == expected, "albums groupings expanded before singles");
    ok &= check(tracks.size() == 4, "artist tracks deduplicated");
    return ok;
}

bool test_artist_aborts_on_album_failure() {
    FakeCatalog catalog;
    ArtistRecord artist;
    artist.id = make_id(600);
    artist.albums = {AlbumGroup{{make_id(10), make_id(99), make_id(11)}}};
    artist.singles = {AlbumGroup{{make_id(20)}}};
    catalog.artists[artist.id] = artist;
    catalog.albums[make_id(10)] = {make_id(1)};
    catalog.albums[make_id(11)] = {make_id(2)};
    catalog.albums[make_id(20)] = {make_id(3)};

    TrackIdSet tracks;
    auto status = resolve_reference(catalog, ref(ResourceKind::Artist, 600), tracks);
    bool ok = check(!status.ok, "album failure propagates out of the artist");
    const std::vector<std::string> expected = {"artist:600", "album:10", "album:99"};
    ok &= check(catalog.calls == expected, "no albums or singles fetched after the failure");
    ok &= check(tracks.count(make_id(2)) == 0 && tracks.count(make_id(3)) == 0,
                "remaining artist expansion skipped");

    TrackIdSet none;
    ok &= check(!resolve_reference(catalog, ref(ResourceKind::Artist, 601), none).ok,
                "missing artist propagates");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_track_and_playlist_dedup();
    ok &= test_collection_failure_skips();
    ok &= test_expand_collections_policies();
    ok &= test_artist_order();
    ok &= test_artist_aborts_on_album_failure();
    return ok ? 0 : 1;
}
