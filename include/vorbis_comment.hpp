//
//  vorbis_comment.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace oggfetch {

/**
 * @brief Vorbis comment header: vendor string plus ordered, multi-valued tags.
 *
 * Keys compare case-insensitively on lookup; insertion order is kept on write.
 */
class CommentHeader {
   public:
    using Tag = std::pair<std::string, std::string>;

    void set_vendor(const std::string &vendor) { vendor_ = vendor; }
    const std::string &vendor() const { return vendor_; }

    // Append one value; repeated keys form a multi-valued tag.
    void add_tag_single(const std::string &key, const std::string &value);

    // All values stored under `key`, in insertion order.
    std::vector<std::string> get_tag(const std::string &key) const;

    const std::vector<Tag> &tags() const { return tags_; }

   private:
    std::string vendor_;
    std::vector<Tag> tags_;
};

// Encode as a complete comment packet (type byte 3, "vorbis", fields, framing bit).
std::vector<uint8_t> encode_comment_packet(const CommentHeader &header);

// Decode a comment packet; false if the packet is not a well formed comment header.
bool decode_comment_packet(const std::vector<uint8_t> &packet, CommentHeader &out);

}  // namespace oggfetch
