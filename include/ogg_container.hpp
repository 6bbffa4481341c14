//
//  ogg_container.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "status.hpp"

namespace oggfetch {

inline constexpr uint8_t kOggFlagContinued = 0x01;
inline constexpr uint8_t kOggFlagBos = 0x02;
inline constexpr uint8_t kOggFlagEos = 0x04;

inline constexpr size_t kOggPageHeaderSize = 27;
inline constexpr size_t kOggMaxSegments = 255;
// Granule position of a page on which no packet ends.
inline constexpr uint64_t kOggNoGranule = 0xFFFFFFFFFFFFFFFFull;

/// One Ogg page; the checksum is recomputed on write and therefore not stored.
struct OggPage {
    uint8_t header_type = 0;
    uint64_t granule_position = 0;
    uint32_t serial = 0;
    uint32_t sequence = 0;
    std::vector<uint8_t> lacing;  ///< Segment table.
    std::vector<uint8_t> body;    ///< Concatenated segment data.

    bool continued() const { return (header_type & kOggFlagContinued) != 0; }
};

// Ogg CRC-32 (polynomial 0x04c11db7, no reflection, zero init).
uint32_t ogg_crc32(const uint8_t *data, size_t len);

// Split a byte buffer into pages. Fails on bad capture patterns, truncation or checksum
// mismatches.
Status parse_ogg_pages(const std::vector<uint8_t> &data, std::vector<OggPage> &pages);

// Serialize a page (header, segment table, body) with a freshly computed checksum.
void write_ogg_page(const OggPage &page, std::vector<uint8_t> &out);

// Lay out complete packets on consecutive pages of one logical stream. Pages on which a packet
// ends carry `granule_position`, the others kOggNoGranule. The first page gets `first_flags`.
// Pages are flushed when the segment table is full and after the last packet.
std::vector<OggPage> paginate_packets(const std::vector<std::vector<uint8_t>> &packets,
                                      uint32_t serial, uint32_t first_sequence,
                                      uint8_t first_flags, uint64_t granule_position);

/// Packets collected from the start of a logical stream.
struct OggHeaderPackets {
    std::vector<std::vector<uint8_t>> packets;
    size_t last_page = 0;  ///< Index of the page on which the last collected packet ended.
};

// Reassemble the first `count` packets of the stream starting at pages[0]. Continuation flags
// must match the packet boundaries, and the last packet must end the page it finishes on.
Status collect_header_packets(const std::vector<OggPage> &pages, size_t count,
                              OggHeaderPackets &out);

}  // namespace oggfetch
