//
//  offline_catalog.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "catalog_id.hpp"
#include "catalog_types.hpp"
#include "providers.hpp"
#include "status.hpp"

namespace oggfetch {

inline constexpr char kCatalogIndexName[] = "catalog.json";
inline constexpr char kCatalogFilesDir[] = "files";

/**
 * @brief Catalog mirror on local disk.
 *
 * Layout of the catalog directory:
 *
 *     catalog.json   accounts, tracks, albums, playlists, artists and audio keys
 *     files/<hex>    encrypted audio blob per file id (40 hex digits)
 *
 * `catalog.json`:
 *
 *     {
 *       "accounts":  [{"username": "u", "password_sha256": "<64 hex>"}],
 *       "tracks":    {"<base62>": {"name": "", "album": "", "artists": [""],
 *                                  "files": {"OGG_VORBIS_320": "<40 hex>"},
 *                                  "alternatives": ["<base62>"]}},
 *       "albums":    {"<base62>": {"name": "", "tracks": ["<base62>"]}},
 *       "playlists": {"<base62>": {"name": "", "tracks": ["<base62>"]}},
 *       "artists":   {"<base62>": {"name": "", "albums": [["<base62>"]],
 *                                  "singles": [["<base62>"]]}},
 *       "keys":      [{"track": "<base62>", "file": "<40 hex>", "key": "<32 hex>"}]
 *     }
 *
 * The index is loaded by connect(); every other call fails until a connect succeeded.
 */
class OfflineCatalog : public Session,
                       public MetadataProvider,
                       public KeyProvider,
                       public StreamProvider {
   public:
    explicit OfflineCatalog(std::filesystem::path root);

    Status connect(const Credentials &credentials) override;

    Status fetch_track(const TrackId &id, TrackRecord &out) override;
    Status fetch_playlist(const CatalogId &id, std::vector<TrackId> &out) override;
    Status fetch_album(const CatalogId &id, std::vector<TrackId> &out) override;
    Status fetch_artist(const CatalogId &id, ArtistRecord &out) override;

    Status request_key(const TrackId &track, const FileId &file, AudioKey &out) override;

    Status open(const FileId &file, std::unique_ptr<std::istream> &out) override;

    bool connected() const { return connected_; }

   private:
    struct Account {
        std::string username;
        std::string password_sha256;
    };

    Status load_index();
    Status require_connection() const;

    std::filesystem::path root_;
    bool connected_ = false;

    std::vector<Account> accounts_;
    std::unordered_map<TrackId, TrackRecord> tracks_;
    std::unordered_map<CatalogId, std::vector<TrackId>> albums_;
    std::unordered_map<CatalogId, std::vector<TrackId>> playlists_;
    std::unordered_map<CatalogId, ArtistRecord> artists_;
    std::map<std::pair<std::string, std::string>, AudioKey> keys_;  // (track hex, file hex)
};

// Lowercase hex SHA-256 of `text`; empty string if the digest could not be computed.
std::string sha256_hex(const std::string &text);

}  // namespace oggfetch
