//
//  ogg_container.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ogg_container.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "logging.hpp"

// Page layout:
//
//  "OggS"            capture pattern
//  version           (uint8 = 0)
//  header_type       (uint8, continued/bos/eos)
//  granule_position  (uint64 LE)
//  serial            (uint32 LE)
//  sequence          (uint32 LE)
//  checksum          (uint32 LE, computed with this field zeroed)
//  segment_count     (uint8)
//  lacing            (segment_count bytes)
//  body              (sum of lacing bytes)

namespace oggfetch {

namespace {

constexpr uint32_t kOggCrcPolynomial = 0x04c11db7;
constexpr size_t kOggChecksumOffset = 22;

const std::array<uint32_t, 256> &crc_table() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t r = i << 24;
            for (int bit = 0; bit < 8; ++bit) {
                r = (r & 0x80000000u) ? (r << 1) ^ kOggCrcPolynomial : (r << 1);
            }
            t[i] = r;
        }
        return t;
    }();
    return table;
}

uint32_t read_le32(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t read_le64(const uint8_t *p) {
    return static_cast<uint64_t>(read_le32(p)) | (static_cast<uint64_t>(read_le32(p + 4)) << 32);
}

void write_le32(std::vector<uint8_t> &out, uint32_t v) {
    out.push_back(v & 0xFF);
    out.push_back((v >> 8) & 0xFF);
    out.push_back((v >> 16) & 0xFF);
    out.push_back((v >> 24) & 0xFF);
}

void write_le64(std::vector<uint8_t> &out, uint64_t v) {
    write_le32(out, static_cast<uint32_t>(v & 0xFFFFFFFF));
    write_le32(out, static_cast<uint32_t>(v >> 32));
}

Status container_error(const std::string &msg) {
    return make_error(ErrorKind::Container, msg);
}

}  // namespace

uint32_t ogg_crc32(const uint8_t *data, size_t len) {
    const auto &table = crc_table();
    uint32_t crc = 0;
    for (size_t i = 0; i < len; ++i) {
        crc = (crc << 8) ^ table[((crc >> 24) ^ data[i]) & 0xFF];
    }
    return crc;
}

Status parse_ogg_pages(const std::vector<uint8_t> &data, std::vector<OggPage> &pages) {
    size_t pos = 0;
    while (pos < data.size()) {
        if (data.size() - pos < kOggPageHeaderSize) {
            return container_error("truncated page header at offset " + std::to_string(pos));
        }
        const uint8_t *h = data.data() + pos;
        if (h[0] != 'O' || h[1] != 'g' || h[2] != 'g' || h[3] != 'S') {
            OF_LOG("ogg", "bad capture pattern at " << pos << ": "
                                                    << hex_prefix(h, 4));
            return container_error("missing OggS capture pattern at offset " +
                                   std::to_string(pos));
        }
        if (h[4] != 0) {
            return container_error("unsupported page version " + std::to_string(h[4]));
        }
        const size_t segments = h[26];
        if (data.size() - pos < kOggPageHeaderSize + segments) {
            return container_error("truncated segment table at offset " + std::to_string(pos));
        }
        OggPage page;
        page.header_type = h[5];
        page.granule_position = read_le64(h + 6);
        page.serial = read_le32(h + 14);
        page.sequence = read_le32(h + 18);
        const uint32_t stored_crc = read_le32(h + kOggChecksumOffset);
        page.lacing.assign(h + kOggPageHeaderSize, h + kOggPageHeaderSize + segments);

        size_t body_size = 0;
        for (uint8_t l : page.lacing) {
            body_size += l;
        }
        const size_t header_size = kOggPageHeaderSize + segments;
        if (data.size() - pos - header_size < body_size) {
            return container_error("truncated page body at offset " + std::to_string(pos));
        }
        page.body.assign(h + header_size, h + header_size + body_size);

        std::vector<uint8_t> check(h, h + header_size + body_size);
        std::fill(check.begin() + kOggChecksumOffset, check.begin() + kOggChecksumOffset + 4, 0);
        const uint32_t computed = ogg_crc32(check.data(), check.size());
        if (computed != stored_crc) {
            return container_error("checksum mismatch on page " + std::to_string(page.sequence));
        }

        pos += header_size + body_size;
        pages.emplace_back(std::move(page));
    }
    if (pages.empty()) {
        return container_error("no Ogg pages found");
    }
    return make_ok();
}

void write_ogg_page(const OggPage &page, std::vector<uint8_t> &out) {
    const size_t start = out.size();
    out.push_back('O');
    out.push_back('g');
    out.push_back('g');
    out.push_back('S');
    out.push_back(0);  // version
    out.push_back(page.header_type);
    write_le64(out, page.granule_position);
    write_le32(out, page.serial);
    write_le32(out, page.sequence);
    write_le32(out, 0);  // checksum placeholder
    out.push_back(static_cast<uint8_t>(page.lacing.size()));
    out.insert(out.end(), page.lacing.begin(), page.lacing.end());
    out.insert(out.end(), page.body.begin(), page.body.end());

    const uint32_t crc = ogg_crc32(out.data() + start, out.size() - start);
    out[start + kOggChecksumOffset] = crc & 0xFF;
    out[start + kOggChecksumOffset + 1] = (crc >> 8) & 0xFF;
    out[start + kOggChecksumOffset + 2] = (crc >> 16) & 0xFF;
    out[start + kOggChecksumOffset + 3] = (crc >> 24) & 0xFF;
}

std::vector<OggPage> paginate_packets(const std::vector<std::vector<uint8_t>> &packets,
                                      uint32_t serial, uint32_t first_sequence,
                                      uint8_t first_flags, uint64_t granule_position) {
    std::vector<OggPage> pages;
    OggPage current;
    current.header_type = first_flags;
    current.serial = serial;
    current.sequence = first_sequence;
    bool packet_ended = false;

    auto flush = [&](bool mid_packet) {
        current.granule_position = packet_ended ? granule_position : kOggNoGranule;
        pages.push_back(std::move(current));
        current = OggPage{};
        current.header_type = mid_packet ? kOggFlagContinued : 0;
        current.serial = serial;
        current.sequence = pages.back().sequence + 1;
        packet_ended = false;
    };

    for (const auto &packet : packets) {
        size_t remaining = packet.size();
        size_t offset = 0;
        // A packet whose size is a multiple of 255 is terminated by a zero-length segment.
        while (true) {
            if (current.lacing.size() == kOggMaxSegments) {
                flush(true);
            }
            const size_t chunk = remaining < 255 ? remaining : 255;
            current.lacing.push_back(static_cast<uint8_t>(chunk));
            current.body.insert(current.body.end(), packet.begin() + offset,
                                packet.begin() + offset + chunk);
            offset += chunk;
            remaining -= chunk;
            if (chunk < 255) {
                packet_ended = true;
                break;
            }
        }
        if (current.lacing.size() == kOggMaxSegments) {
            flush(false);
        }
    }
    if (!current.lacing.empty()) {
        current.granule_position = granule_position;
        pages.push_back(std::move(current));
    }
    return pages;
}

Status collect_header_packets(const std::vector<OggPage> &pages, size_t count,
                              OggHeaderPackets &out) {
    if (pages.empty() || count == 0) {
        return container_error("no header pages");
    }
    const uint32_t serial = pages.front().serial;
    std::vector<uint8_t> packet;
    for (size_t i = 0; i < pages.size(); ++i) {
        const auto &page = pages[i];
        if (page.serial != serial) {
            return container_error("interleaved logical stream in header pages");
        }
        if (page.continued() && packet.empty()) {
            return container_error("page " + std::to_string(page.sequence) +
                                   " continues a packet that was never started");
        }
        if (!page.continued() && !packet.empty()) {
            return container_error("page " + std::to_string(page.sequence) +
                                   " does not continue the open packet");
        }
        size_t body_pos = 0;
        for (size_t s = 0; s < page.lacing.size(); ++s) {
            const uint8_t len = page.lacing[s];
            packet.insert(packet.end(), page.body.begin() + body_pos,
                          page.body.begin() + body_pos + len);
            body_pos += len;
            if (len == 255) {
                continue;
            }
            out.packets.emplace_back(std::move(packet));
            packet.clear();
            if (out.packets.size() == count) {
                if (s + 1 != page.lacing.size()) {
                    return container_error("header packets do not end on a page boundary");
                }
                out.last_page = i;
                return make_ok();
            }
        }
    }
    return container_error("stream ended after " + std::to_string(out.packets.size()) +
                           " header packets");
}

}  // namespace oggfetch
