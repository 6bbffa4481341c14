// Unit coverage for Ogg page parsing, checksums and packet pagination.
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "ogg_container.hpp"
#include "ogg_test_utils.hpp"

using namespace oggfetch;
using namespace ogg_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[ogg_container_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

bool test_crc_matches_reference() {
    std::vector<uint8_t> data;
    for (int i = 0; i < 1000; ++i) {
        data.push_back(static_cast<uint8_t>(i * 31 + 7));
    }
    bool ok = check(ogg_crc32(data.data(), data.size()) == crc32_bitwise(data),
                    "table CRC equals bitwise CRC");
    ok &= check(ogg_crc32(nullptr, 0) == 0, "CRC of nothing is zero");
    return ok;
}

bool test_parse_fixture() {
    auto fixture = make_vorbis_stream({"TITLE=x"}, 3);
    std::vector<OggPage> pages;
    bool ok = check(parse_ogg_pages(fixture.bytes, pages).ok, "fixture parses");
    ok &= check(pages.size() == 5, "two header pages plus three audio pages");
    if (pages.size() != 5) {
        return false;
    }
    ok &= check((pages[0].header_type & kOggFlagBos) != 0, "first page begins the stream");
    ok &= check((pages[4].header_type & kOggFlagEos) != 0, "last page ends the stream");
    ok &= check(pages[0].serial == 0x1234, "serial decoded");
    ok &= check(pages[3].sequence == 3 && pages[3].granule_position == 2048, "page fields");

    OggHeaderPackets headers;
    ok &= check(collect_header_packets(pages, 3, headers).ok, "three header packets found");
    ok &= check(headers.last_page == 1, "headers end on the second page");
    ok &= check(headers.packets.size() == 3 && headers.packets[2] == fixture.setup,
                "setup packet reassembled");
    return ok;
}

bool test_parse_rejects_damage() {
    auto fixture = make_vorbis_stream({}, 1);
    std::vector<OggPage> pages;

    auto flipped = fixture.bytes;
    flipped[flipped.size() - 1] ^= 0xFF;
    auto status = parse_ogg_pages(flipped, pages);
    bool ok = check(!status.ok && status.kind == ErrorKind::Container, "checksum mismatch");

    pages.clear();
    auto truncated = fixture.bytes;
    truncated.resize(truncated.size() - 3);
    ok &= check(!parse_ogg_pages(truncated, pages).ok, "truncated body");

    pages.clear();
    std::vector<uint8_t> garbage(64, 0xAB);
    ok &= check(!parse_ogg_pages(garbage, pages).ok, "no capture pattern");

    pages.clear();
    ok &= check(!parse_ogg_pages({}, pages).ok, "empty input");
    return ok;
}

bool test_paginate_lacing() {
    std::vector<uint8_t> exact(255 * 2, 0x01);
    std::vector<uint8_t> small(10, 0x02);
    auto pages = paginate_packets({exact, small}, 7, 4, kOggFlagBos, 0);
    bool ok = check(pages.size() == 1, "small packets share one page");
    if (pages.size() != 1) {
        return false;
    }
    const std::vector<uint8_t> lacing = {255, 255, 0, 10};
    ok &= check(pages[0].lacing == lacing, "multiple of 255 terminated by a zero segment");
    ok &= check(pages[0].sequence == 4 && pages[0].serial == 7, "sequence and serial set");
    ok &= check(pages[0].header_type == kOggFlagBos, "first flags applied");
    return ok;
}

bool test_paginate_spans_pages() {
    std::vector<uint8_t> big(255 * 300 + 17);
    for (size_t i = 0; i < big.size(); ++i) {
        big[i] = static_cast<uint8_t>(i);
    }
    auto pages = paginate_packets({big}, 1, 0, 0, 0);
    bool ok = check(pages.size() == 2, "packet of 301 segments needs two pages");
    if (pages.size() != 2) {
        return false;
    }
    ok &= check(pages[0].lacing.size() == kOggMaxSegments, "first page full");
    ok &= check(!pages[0].continued() && pages[1].continued(), "continuation flag");
    ok &= check(pages[1].sequence == 1, "sequence increments");
    ok &= check(pages[0].granule_position == kOggNoGranule, "no packet ends on the first page");
    ok &= check(pages[1].granule_position == 0, "granule on the page ending the packet");

    std::vector<uint8_t> bytes;
    for (const auto &p : pages) {
        write_ogg_page(p, bytes);
    }
    auto simple = split_pages(bytes);
    ok &= check(simple.size() == 2 && simple[0].crc_ok && simple[1].crc_ok,
                "written pages carry valid checksums");
    auto packets = split_packets(simple);
    ok &= check(packets.size() == 1 && packets[0] == big, "packet survives pagination");
    return ok;
}

OggPage header_page(uint8_t flags, uint32_t sequence, std::vector<uint8_t> lacing) {
    OggPage page;
    page.header_type = flags;
    page.serial = 9;
    page.sequence = sequence;
    for (uint8_t l : lacing) {
        page.body.insert(page.body.end(), l, static_cast<uint8_t>(sequence + 1));
    }
    page.lacing = std::move(lacing);
    return page;
}

bool test_header_continuation() {
    OggHeaderPackets headers;
    // One packet of 255 + 40 bytes spread over two pages, then a complete one.
    std::vector<OggPage> pages = {header_page(kOggFlagBos, 0, {255}),
                                  header_page(kOggFlagContinued, 1, {40, 12})};
    bool ok = check(collect_header_packets(pages, 2, headers).ok, "continued packet joins");
    ok &= check(headers.packets.size() == 2 && headers.packets[0].size() == 295,
                "joined packet size");

    headers = OggHeaderPackets{};
    pages[1].header_type = 0;
    auto status = collect_header_packets(pages, 2, headers);
    ok &= check(!status.ok && status.kind == ErrorKind::Container,
                "open packet followed by a fresh page");

    headers = OggHeaderPackets{};
    std::vector<OggPage> orphan = {header_page(kOggFlagBos | kOggFlagContinued, 0, {30}),
                                   header_page(0, 1, {20})};
    status = collect_header_packets(orphan, 2, headers);
    ok &= check(!status.ok && status.kind == ErrorKind::Container,
                "first page cannot continue a packet");

    headers = OggHeaderPackets{};
    auto paginated = paginate_packets({std::vector<uint8_t>(600, 1), std::vector<uint8_t>(5, 2)},
                                      3, 0, kOggFlagBos, 0);
    ok &= check(collect_header_packets(paginated, 2, headers).ok, "paginated packets collect");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_crc_matches_reference();
    ok &= test_parse_fixture();
    ok &= test_parse_rejects_damage();
    ok &= test_paginate_lacing();
    ok &= test_paginate_spans_pages();
    ok &= test_header_continuation();
    return ok ? 0 : 1;
}
