//
//  offline_catalog.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "offline_catalog.hpp"

#include <cctype>
#include <cerrno>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include "logging.hpp"

using json = nlohmann::json;

namespace oggfetch {

namespace {

Status config_error(const std::string &msg) { return make_error(ErrorKind::Config, msg); }

Status not_found(const char *what, const CatalogId &id) {
    return make_error(ErrorKind::MetadataFetch,
                      std::string(what) + " " + id.to_base62() + " not found");
}

bool parse_id_list(const json &arr, std::vector<CatalogId> &out, std::string &bad) {
    if (!arr.is_array()) {
        bad = arr.dump();
        return false;
    }
    for (const auto &v : arr) {
        const std::string text = v.is_string() ? v.get<std::string>() : v.dump();
        auto id = CatalogId::from_base62(text);
        if (!id) {
            bad = text;
            return false;
        }
        out.push_back(*id);
    }
    return true;
}

bool parse_key(const std::string &hex, AudioKey &out) {
    if (hex.size() != kAudioKeyBytes * 2) {
        return false;
    }
    for (size_t i = 0; i < kAudioKeyBytes; ++i) {
        unsigned int byte = 0;
        for (int n = 0; n < 2; ++n) {
            const char c = hex[2 * i + n];
            unsigned int d;
            if (c >= '0' && c <= '9') {
                d = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                d = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                d = c - 'A' + 10;
            } else {
                return false;
            }
            byte = (byte << 4) | d;
        }
        out[i] = static_cast<uint8_t>(byte);
    }
    return true;
}

std::string lowercase(std::string s) {
    for (auto &c : s) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace

std::string sha256_hex(const std::string &text) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(text.data(), text.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(digits[digest[i] >> 4]);
        out.push_back(digits[digest[i] & 0x0F]);
    }
    return out;
}

OfflineCatalog::OfflineCatalog(std::filesystem::path root) : root_(std::move(root)) {}

Status OfflineCatalog::connect(const Credentials &credentials) {
    connected_ = false;
    auto status = load_index();
    if (!status.ok) {
        return status;
    }
    const std::string digest = sha256_hex(credentials.password);
    for (const auto &account : accounts_) {
        if (account.username == credentials.username && account.password_sha256 == digest &&
            !digest.empty()) {
            connected_ = true;
            OF_LOG("catalog", "catalog " << root_.string() << ": " << tracks_.size() << " tracks, "
                                       << albums_.size() << " albums, " << playlists_.size()
                                       << " playlists, " << artists_.size() << " artists");
            return make_ok();
        }
    }
    return make_error(ErrorKind::Auth, "bad credentials for " + credentials.username);
}

Status OfflineCatalog::load_index() {
    const auto index_path = root_ / kCatalogIndexName;
    std::ifstream f(index_path);
    if (!f.is_open()) {
        return config_error("open failed for " + index_path.string() + " errno=" +
                            std::to_string(errno) + " (" +
                            std::generic_category().message(errno) + ")");
    }

    accounts_.clear();
    tracks_.clear();
    albums_.clear();
    playlists_.clear();
    artists_.clear();
    keys_.clear();

    try {
        json j;
        f >> j;
        std::string bad;

        for (const auto &a : j.value("accounts", json::array())) {
            accounts_.push_back(Account{a.value("username", ""),
                                        lowercase(a.value("password_sha256", ""))});
        }

        const json tracks = j.value("tracks", json::object());
        for (const auto &[key, t] : tracks.items()) {
            auto id = CatalogId::from_base62(key);
            if (!id) {
                return config_error("bad track id " + key);
            }
            TrackRecord record;
            record.id = *id;
            record.name = t.value("name", "");
            record.album_name = t.value("album", "");
            record.artists = t.value("artists", std::vector<std::string>{});
            const json files = t.value("files", json::object());
            for (const auto &[format_name, file_hex] : files.items()) {
                auto format = audio_file_format_from_name(format_name);
                auto file = FileId::from_hex(file_hex.get<std::string>());
                if (!format || !file) {
                    return config_error("bad file entry " + format_name + " on track " + key);
                }
                record.files[*format] = *file;
            }
            if (t.contains("alternatives") &&
                !parse_id_list(t["alternatives"], record.alternatives, bad)) {
                return config_error("bad alternative " + bad + " on track " + key);
            }
            tracks_[*id] = std::move(record);
        }

        auto load_collections = [&](const char *section,
                                    std::unordered_map<CatalogId, std::vector<TrackId>> &dest)
            -> Status {
            const json entries = j.value(section, json::object());
            for (const auto &[key, c] : entries.items()) {
                auto id = CatalogId::from_base62(key);
                std::vector<TrackId> ids;
                if (!id || !parse_id_list(c.value("tracks", json::array()), ids, bad)) {
                    return config_error(std::string("bad ") + section + " entry " + key);
                }
                dest[*id] = std::move(ids);
            }
            return make_ok();
        };
        auto status = load_collections("albums", albums_);
        if (!status.ok) {
            return status;
        }
        status = load_collections("playlists", playlists_);
        if (!status.ok) {
            return status;
        }

        const json artists = j.value("artists", json::object());
        for (const auto &[key, a] : artists.items()) {
            auto id = CatalogId::from_base62(key);
            if (!id) {
                return config_error("bad artist id " + key);
            }
            ArtistRecord record;
            record.id = *id;
            record.name = a.value("name", "");
            for (const auto &group : a.value("albums", json::array())) {
                AlbumGroup g;
                if (!parse_id_list(group, g.albums, bad)) {
                    return config_error("bad album " + bad + " on artist " + key);
                }
                record.albums.push_back(std::move(g));
            }
            for (const auto &group : a.value("singles", json::array())) {
                AlbumGroup g;
                if (!parse_id_list(group, g.albums, bad)) {
                    return config_error("bad single " + bad + " on artist " + key);
                }
                record.singles.push_back(std::move(g));
            }
            artists_[*id] = std::move(record);
        }

        for (const auto &k : j.value("keys", json::array())) {
            auto track = CatalogId::from_base62(k.value("track", ""));
            auto file = FileId::from_hex(k.value("file", ""));
            AudioKey key{};
            if (!track || !file || !parse_key(k.value("key", ""), key)) {
                return config_error("bad key entry " + k.dump());
            }
            keys_[{track->to_hex(), file->to_hex()}] = key;
        }
    } catch (const json::exception &e) {
        return config_error("cannot parse " + index_path.string() + ": " + e.what());
    }
    return make_ok();
}

Status OfflineCatalog::require_connection() const {
    if (!connected_) {
        return make_error(ErrorKind::Auth, "session not connected");
    }
    return make_ok();
}

Status OfflineCatalog::fetch_track(const TrackId &id, TrackRecord &out) {
    auto status = require_connection();
    if (!status.ok) {
        return status;
    }
    auto it = tracks_.find(id);
    if (it == tracks_.end()) {
        return not_found("track", id);
    }
    out = it->second;
    return make_ok();
}

Status OfflineCatalog::fetch_playlist(const CatalogId &id, std::vector<TrackId> &out) {
    auto status = require_connection();
    if (!status.ok) {
        return status;
    }
    auto it = playlists_.find(id);
    if (it == playlists_.end()) {
        return not_found("playlist", id);
    }
    out = it->second;
    return make_ok();
}

Status OfflineCatalog::fetch_album(const CatalogId &id, std::vector<TrackId> &out) {
    auto status = require_connection();
    if (!status.ok) {
        return status;
    }
    auto it = albums_.find(id);
    if (it == albums_.end()) {
        return not_found("album", id);
    }
    out = it->second;
    return make_ok();
}

Status OfflineCatalog::fetch_artist(const CatalogId &id, ArtistRecord &out) {
    auto status = require_connection();
    if (!status.ok) {
        return status;
    }
    auto it = artists_.find(id);
    if (it == artists_.end()) {
        return not_found("artist", id);
    }
    out = it->second;
    return make_ok();
}

Status OfflineCatalog::request_key(const TrackId &track, const FileId &file, AudioKey &out) {
    auto status = require_connection();
    if (!status.ok) {
        return status;
    }
    auto it = keys_.find({track.to_hex(), file.to_hex()});
    if (it == keys_.end()) {
        return make_error(ErrorKind::Key, "no key for track " + track.to_base62() + " file " +
                                              file.to_hex());
    }
    out = it->second;
    return make_ok();
}

Status OfflineCatalog::open(const FileId &file, std::unique_ptr<std::istream> &out) {
    auto status = require_connection();
    if (!status.ok) {
        return status;
    }
    const auto path = root_ / kCatalogFilesDir / file.to_hex();
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        return make_error(ErrorKind::Stream,
                          "open failed for " + path.string() + " errno=" + std::to_string(errno) +
                              " (" + std::generic_category().message(errno) + ")");
    }
    out = std::move(stream);
    return make_ok();
}

}  // namespace oggfetch
