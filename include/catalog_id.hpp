//
//  catalog_id.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace oggfetch {

inline constexpr size_t kBase62IdLength = 22;
inline constexpr size_t kFileIdBytes = 20;

/**
 * @brief 128-bit catalog identifier (track, album, playlist or artist).
 *
 * The textual form is a 22 character base62 string; the hex form is 32 lowercase digits.
 */
class CatalogId {
   public:
    CatalogId() = default;
    CatalogId(uint64_t high, uint64_t low) : high_(high), low_(low) {}

    // Decode a 22 character base62 id. Returns nullopt on bad length, bad digits or overflow.
    static std::optional<CatalogId> from_base62(std::string_view text);
    static std::optional<CatalogId> from_hex(std::string_view text);

    std::string to_base62() const;
    std::string to_hex() const;

    uint64_t high() const { return high_; }
    uint64_t low() const { return low_; }

    bool operator==(const CatalogId &other) const {
        return high_ == other.high_ && low_ == other.low_;
    }
    bool operator!=(const CatalogId &other) const { return !(*this == other); }

   private:
    uint64_t high_ = 0;
    uint64_t low_ = 0;
};

/// Track identifiers are plain catalog ids; the alias documents intent at call sites.
using TrackId = CatalogId;

/// Opaque handle of one encrypted audio blob (one track/encoding pair).
class FileId {
   public:
    FileId() = default;
    explicit FileId(const std::array<uint8_t, kFileIdBytes> &bytes) : bytes_(bytes) {}

    static std::optional<FileId> from_hex(std::string_view text);
    std::string to_hex() const;

    const std::array<uint8_t, kFileIdBytes> &bytes() const { return bytes_; }

    bool operator==(const FileId &other) const { return bytes_ == other.bytes_; }
    bool operator!=(const FileId &other) const { return !(*this == other); }

   private:
    std::array<uint8_t, kFileIdBytes> bytes_{};
};

}  // namespace oggfetch

template <>
struct std::hash<oggfetch::CatalogId> {
    size_t operator()(const oggfetch::CatalogId &id) const noexcept {
        const uint64_t h = id.high() ^ (id.low() + 0x9e3779b97f4a7c15ULL + (id.high() << 6) +
                                        (id.high() >> 2));
        return static_cast<size_t>(h);
    }
};
