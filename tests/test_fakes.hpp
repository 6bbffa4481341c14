//
//  test_fakes.hpp
//  OggFetch
//
//  In-memory collaborators for resolver and pipeline tests.
//

#pragma once

#include <array>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog_id.hpp"
#include "catalog_types.hpp"
#include "providers.hpp"
#include "status.hpp"

namespace test_fakes {

using namespace oggfetch;

inline CatalogId make_id(uint64_t n) { return CatalogId(0x1000, n); }

inline FileId make_file(uint8_t n) {
    std::array<uint8_t, kFileIdBytes> bytes{};
    bytes.fill(n);
    return FileId(bytes);
}

inline TrackRecord make_track(uint64_t n, const std::string &name,
                              std::map<AudioFileFormat, FileId> files = {},
                              std::vector<TrackId> alternatives = {}) {
    TrackRecord r;
    r.id = make_id(n);
    r.name = name;
    r.album_name = "Album " + std::to_string(n);
    r.artists = {"Artist " + std::to_string(n)};
    r.files = std::move(files);
    r.alternatives = std::move(alternatives);
    return r;
}

/// Metadata, keys and streams from maps; every call is appended to `calls`.
class FakeCatalog : public MetadataProvider, public KeyProvider, public StreamProvider {
   public:
    std::unordered_map<TrackId, TrackRecord> tracks;
    std::unordered_map<CatalogId, std::vector<TrackId>> albums;
    std::unordered_map<CatalogId, std::vector<TrackId>> playlists;
    std::unordered_map<CatalogId, ArtistRecord> artists;
    std::map<std::string, AudioKey> keys;                 // file hex -> key
    std::map<std::string, std::vector<uint8_t>> blobs;    // file hex -> encrypted bytes
    std::set<std::string> failing_streams;                // file hex whose stream goes bad
    std::vector<std::string> calls;

    Status fetch_track(const TrackId &id, TrackRecord &out) override {
        calls.push_back("track:" + std::to_string(id.low()));
        auto it = tracks.find(id);
        if (it == tracks.end()) {
            return make_error(ErrorKind::MetadataFetch, "no track " + std::to_string(id.low()));
        }
        out = it->second;
        return make_ok();
    }

    Status fetch_playlist(const CatalogId &id, std::vector<TrackId> &out) override {
        calls.push_back("playlist:" + std::to_string(id.low()));
        return lookup(playlists, id, out, "playlist");
    }

    Status fetch_album(const CatalogId &id, std::vector<TrackId> &out) override {
        calls.push_back("album:" + std::to_string(id.low()));
        return lookup(albums, id, out, "album");
    }

    Status fetch_artist(const CatalogId &id, ArtistRecord &out) override {
        calls.push_back("artist:" + std::to_string(id.low()));
        auto it = artists.find(id);
        if (it == artists.end()) {
            return make_error(ErrorKind::MetadataFetch, "no artist");
        }
        out = it->second;
        return make_ok();
    }

    Status request_key(const TrackId &track, const FileId &file, AudioKey &out) override {
        calls.push_back("key:" + std::to_string(track.low()));
        auto it = keys.find(file.to_hex());
        if (it == keys.end()) {
            return make_error(ErrorKind::Key, "no key");
        }
        out = it->second;
        return make_ok();
    }

    Status open(const FileId &file, std::unique_ptr<std::istream> &out) override {
        calls.push_back("open:" + file.to_hex().substr(0, 2));
        auto it = blobs.find(file.to_hex());
        if (it == blobs.end()) {
            return make_error(ErrorKind::Stream, "no blob");
        }
        auto stream = std::make_unique<std::istringstream>(
            std::string(it->second.begin(), it->second.end()));
        if (failing_streams.count(file.to_hex())) {
            stream->setstate(std::ios::badbit);
        }
        out = std::move(stream);
        return make_ok();
    }

   private:
    static Status lookup(const std::unordered_map<CatalogId, std::vector<TrackId>> &m,
                         const CatalogId &id, std::vector<TrackId> &out, const char *what) {
        auto it = m.find(id);
        if (it == m.end()) {
            return make_error(ErrorKind::MetadataFetch, std::string("no ") + what);
        }
        out = it->second;
        return make_ok();
    }
};

/// XOR with the first key byte; symmetric so fixtures can be "encrypted" the same way.
class XorDecryptor : public Decryptor {
   public:
    bool fail = false;

    Status decrypt(const AudioKey &key, const std::vector<uint8_t> &encrypted,
                   std::vector<uint8_t> &out) override {
        if (fail) {
            return make_error(ErrorKind::Decrypt, "decrypt refused");
        }
        out = encrypted;
        for (auto &b : out) {
            b ^= key[0];
        }
        return make_ok();
    }
};

}  // namespace test_fakes
