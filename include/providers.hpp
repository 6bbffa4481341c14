//
//  providers.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "catalog_id.hpp"
#include "catalog_types.hpp"
#include "status.hpp"
#include "vorbis_comment.hpp"

/// @defgroup collaborators Collaborator Interfaces
/// Capabilities the resolvers and the download pipeline consume. All calls block until they
/// complete; payloads are returned through out-parameters and are only valid when the returned
/// Status is ok.
/// @{

namespace oggfetch {

struct Credentials {
    std::string username;
    std::string password;
};

class Session {
   public:
    virtual ~Session() = default;
    virtual Status connect(const Credentials &credentials) = 0;
};

class MetadataProvider {
   public:
    virtual ~MetadataProvider() = default;
    virtual Status fetch_track(const TrackId &id, TrackRecord &out) = 0;
    virtual Status fetch_playlist(const CatalogId &id, std::vector<TrackId> &out) = 0;
    virtual Status fetch_album(const CatalogId &id, std::vector<TrackId> &out) = 0;
    virtual Status fetch_artist(const CatalogId &id, ArtistRecord &out) = 0;
};

class KeyProvider {
   public:
    virtual ~KeyProvider() = default;
    virtual Status request_key(const TrackId &track, const FileId &file, AudioKey &out) = 0;
};

class StreamProvider {
   public:
    virtual ~StreamProvider() = default;
    // Open a readable stream over the encrypted blob; the caller owns the stream.
    virtual Status open(const FileId &file, std::unique_ptr<std::istream> &out) = 0;
};

class Decryptor {
   public:
    virtual ~Decryptor() = default;
    virtual Status decrypt(const AudioKey &key, const std::vector<uint8_t> &encrypted,
                           std::vector<uint8_t> &out) = 0;
};

class CommentHeaderRewriter {
   public:
    virtual ~CommentHeaderRewriter() = default;
    // Replace the comment header of `container` with `header`, writing the result to `out`.
    virtual Status splice(const std::vector<uint8_t> &container, const CommentHeader &header,
                          std::vector<uint8_t> &out) = 0;
};

}  // namespace oggfetch

/// @}
