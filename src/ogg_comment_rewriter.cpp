//
//  ogg_comment_rewriter.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ogg_comment_rewriter.hpp"

#include <cstring>
#include <iterator>

#include "logging.hpp"
#include "ogg_container.hpp"

namespace oggfetch {

namespace {

constexpr size_t kVorbisHeaderCount = 3;
constexpr uint8_t kIdentPacketType = 0x01;
constexpr uint8_t kCommentPacketType = 0x03;
constexpr uint8_t kSetupPacketType = 0x05;

bool is_vorbis_header(const std::vector<uint8_t> &packet, uint8_t type) {
    return packet.size() >= 7 && packet[0] == type &&
           std::memcmp(packet.data() + 1, "vorbis", 6) == 0;
}

Status read_headers(const std::vector<uint8_t> &container, std::vector<OggPage> &pages,
                    OggHeaderPackets &headers) {
    auto status = parse_ogg_pages(container, pages);
    if (!status.ok) {
        return status;
    }
    if ((pages.front().header_type & kOggFlagBos) == 0) {
        return make_error(ErrorKind::Container, "first page does not begin a stream");
    }
    status = collect_header_packets(pages, kVorbisHeaderCount, headers);
    if (!status.ok) {
        return status;
    }
    if (!is_vorbis_header(headers.packets[0], kIdentPacketType) ||
        !is_vorbis_header(headers.packets[1], kCommentPacketType) ||
        !is_vorbis_header(headers.packets[2], kSetupPacketType)) {
        return make_error(ErrorKind::Container, "stream does not start with Vorbis headers");
    }
    return make_ok();
}

}  // namespace

Status replace_comment_header(const std::vector<uint8_t> &container, const CommentHeader &header,
                              std::vector<uint8_t> &out) {
    std::vector<OggPage> pages;
    OggHeaderPackets headers;
    auto status = read_headers(container, pages, headers);
    if (!status.ok) {
        return status;
    }
    const uint32_t serial = pages.front().serial;

    auto rebuilt = paginate_packets({headers.packets[0]}, serial, 0, kOggFlagBos, 0);
    auto rest = paginate_packets({encode_comment_packet(header), headers.packets[2]}, serial,
                                 static_cast<uint32_t>(rebuilt.size()), 0, 0);
    rebuilt.insert(rebuilt.end(), std::make_move_iterator(rest.begin()),
                   std::make_move_iterator(rest.end()));

    const size_t old_header_pages = headers.last_page + 1;
    const int64_t shift =
        static_cast<int64_t>(rebuilt.size()) - static_cast<int64_t>(old_header_pages);
    OF_LOG("ogg", "header pages " << old_header_pages << " -> " << rebuilt.size()
                                  << ", audio pages " << (pages.size() - old_header_pages));

    out.clear();
    out.reserve(container.size() + 256);
    for (const auto &page : rebuilt) {
        write_ogg_page(page, out);
    }
    for (size_t i = old_header_pages; i < pages.size(); ++i) {
        OggPage page = pages[i];
        if (page.serial == serial) {
            page.sequence = static_cast<uint32_t>(static_cast<int64_t>(page.sequence) + shift);
        }
        write_ogg_page(page, out);
    }
    return make_ok();
}

std::optional<CommentHeader> read_comment_header(const std::vector<uint8_t> &container) {
    std::vector<OggPage> pages;
    OggHeaderPackets headers;
    auto status = read_headers(container, pages, headers);
    if (!status.ok) {
        OF_LOG("ogg", "cannot read comment header: " << status.message);
        return std::nullopt;
    }
    CommentHeader header;
    if (!decode_comment_packet(headers.packets[1], header)) {
        return std::nullopt;
    }
    return header;
}

Status OggCommentRewriter::splice(const std::vector<uint8_t> &container,
                                  const CommentHeader &header, std::vector<uint8_t> &out) {
    return replace_comment_header(container, header, out);
}

}  // namespace oggfetch
