//
//  ogg_comment_rewriter.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "providers.hpp"
#include "status.hpp"
#include "vorbis_comment.hpp"

namespace oggfetch {

// Replace the comment header of an Ogg Vorbis stream. The identification header keeps its own
// page, comment and setup headers are repaginated, and all following pages of the stream are
// renumbered and re-checksummed. Audio data is copied unchanged.
Status replace_comment_header(const std::vector<uint8_t> &container, const CommentHeader &header,
                              std::vector<uint8_t> &out);

// Read the comment header of an Ogg Vorbis stream.
std::optional<CommentHeader> read_comment_header(const std::vector<uint8_t> &container);

class OggCommentRewriter : public CommentHeaderRewriter {
   public:
    Status splice(const std::vector<uint8_t> &container, const CommentHeader &header,
                  std::vector<uint8_t> &out) override;
};

}  // namespace oggfetch
