//
//  vorbis_comment.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "vorbis_comment.hpp"

#include <cctype>
#include <cstring>
#include <utility>

// Comment packet structure:
//
//  packet_type      (uint8 = 3)
//  "vorbis"         (6 bytes)
//  vendor_length    (uint32 LE)
//  vendor           (UTF-8)
//  comment_count    (uint32 LE)
//  comment_count x  [length (uint32 LE), "KEY=value" (UTF-8)]
//  framing          (uint8, bit 0 set)

namespace oggfetch {

namespace {

constexpr uint8_t kCommentPacketType = 0x03;
constexpr char kVorbisMagic[] = "vorbis";
constexpr size_t kVorbisMagicSize = 6;

bool equals_ignore_case(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

void write_le32(std::vector<uint8_t> &out, uint32_t v) {
    out.push_back(v & 0xFF);
    out.push_back((v >> 8) & 0xFF);
    out.push_back((v >> 16) & 0xFF);
    out.push_back((v >> 24) & 0xFF);
}

void write_string(std::vector<uint8_t> &out, const std::string &s) {
    write_le32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

class PacketReader {
   public:
    explicit PacketReader(const std::vector<uint8_t> &data) : data_(data) {}

    bool read_u32(uint32_t &v) {
        if (data_.size() - pos_ < 4) {
            return false;
        }
        const uint8_t *p = data_.data() + pos_;
        v = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
            (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
        pos_ += 4;
        return true;
    }

    bool read_string(std::string &s) {
        uint32_t len = 0;
        if (!read_u32(len) || data_.size() - pos_ < len) {
            return false;
        }
        s.assign(reinterpret_cast<const char *>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool skip(size_t n) {
        if (data_.size() - pos_ < n) {
            return false;
        }
        pos_ += n;
        return true;
    }

    size_t remaining() const { return data_.size() - pos_; }
    uint8_t peek() const { return data_[pos_]; }

   private:
    const std::vector<uint8_t> &data_;
    size_t pos_ = 0;
};

}  // namespace

void CommentHeader::add_tag_single(const std::string &key, const std::string &value) {
    tags_.emplace_back(key, value);
}

std::vector<std::string> CommentHeader::get_tag(const std::string &key) const {
    std::vector<std::string> values;
    for (const auto &tag : tags_) {
        if (equals_ignore_case(tag.first, key)) {
            values.push_back(tag.second);
        }
    }
    return values;
}

std::vector<uint8_t> encode_comment_packet(const CommentHeader &header) {
    std::vector<uint8_t> out;
    out.push_back(kCommentPacketType);
    out.insert(out.end(), kVorbisMagic, kVorbisMagic + kVorbisMagicSize);
    write_string(out, header.vendor());
    write_le32(out, static_cast<uint32_t>(header.tags().size()));
    for (const auto &tag : header.tags()) {
        write_string(out, tag.first + "=" + tag.second);
    }
    out.push_back(0x01);  // framing bit
    return out;
}

bool decode_comment_packet(const std::vector<uint8_t> &packet, CommentHeader &out) {
    if (packet.size() < 1 + kVorbisMagicSize || packet[0] != kCommentPacketType ||
        std::memcmp(packet.data() + 1, kVorbisMagic, kVorbisMagicSize) != 0) {
        return false;
    }
    PacketReader reader(packet);
    if (!reader.skip(1 + kVorbisMagicSize)) {
        return false;
    }

    CommentHeader header;
    std::string vendor;
    if (!reader.read_string(vendor)) {
        return false;
    }
    header.set_vendor(vendor);

    uint32_t count = 0;
    if (!reader.read_u32(count)) {
        return false;
    }
    for (uint32_t i = 0; i < count; ++i) {
        std::string entry;
        if (!reader.read_string(entry)) {
            return false;
        }
        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            return false;
        }
        header.add_tag_single(entry.substr(0, eq), entry.substr(eq + 1));
    }
    if (reader.remaining() < 1 || (reader.peek() & 0x01) == 0) {
        return false;
    }
    out = std::move(header);
    return true;
}

}  // namespace oggfetch
