// Unit coverage for reference classification (URI and URL forms of all kinds).
#include <cstdio>
#include <string>

#include "reference_parser.hpp"

using oggfetch::classify_reference;
using oggfetch::match_reference;
using oggfetch::ResourceKind;

namespace {

constexpr char kId[] = "4uLU6hMCjMI75M1A2tKUQC";

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[reference_parser_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

bool test_uri_and_url_agree() {
    bool ok = true;
    const ResourceKind kinds[] = {ResourceKind::Track, ResourceKind::Playlist,
                                  ResourceKind::Album, ResourceKind::Artist};
    for (auto kind : kinds) {
        const std::string name = oggfetch::resource_kind_name(kind);
        const std::string forms[] = {
            "spotify:" + name + ":" + kId,
            "https://open.spotify.com/" + name + "/" + kId,
            "http://open.spotify.com/" + name + "/" + kId,
            "open.spotify.com/" + name + "/" + kId,
        };
        auto first = classify_reference(forms[0]);
        ok &= check(first.has_value(), name + " URI recognized");
        if (!first) {
            continue;
        }
        ok &= check(first->kind == kind, name + " URI kind");
        ok &= check(first->id_text == kId, name + " URI id text");
        for (const auto &form : forms) {
            auto ref = classify_reference(form);
            ok &= check(ref && ref->kind == first->kind && ref->id == first->id,
                        "same (kind, id) for " + form);
        }
    }
    return ok;
}

bool test_rejections() {
    bool ok = true;
    ok &= check(!classify_reference(""), "empty line");
    ok &= check(!classify_reference("hello world"), "free text");
    ok &= check(!classify_reference(std::string("spotify:episode:") + kId), "unknown kind");
    ok &= check(!classify_reference("spotify:track:4uLU6hMCjMI75M1A2tKUQ"), "21 char id");
    ok &= check(!classify_reference("spotify:track:4uLU6hMCjMI75M1A2tKUQCx"), "23 char id");
    ok &= check(!classify_reference(std::string("xspotify:track:") + kId), "anchored start");
    ok &= check(!classify_reference(std::string("https://open.spotify.com/track/") + kId +
                                    "?si=abc"),
                "query string is not part of a reference");
    ok &= check(!classify_reference(std::string("https://example.com/track/") + kId),
                "foreign host");
    ok &= check(!classify_reference(std::string("ftp://open.spotify.com/track/") + kId),
                "foreign scheme");
    return ok;
}

bool test_kind_specific_match() {
    const std::string uri = std::string("spotify:album:") + kId;
    bool ok = check(!match_reference(uri, ResourceKind::Track), "album URI is not a track");
    ok &= check(match_reference(uri, ResourceKind::Album).has_value(), "album URI is an album");
    return ok;
}

bool test_whitespace_trimmed() {
    auto ref = classify_reference(std::string("  spotify:track:") + kId + "\r\n");
    return check(ref && ref->kind == ResourceKind::Track && ref->id_text == kId,
                 "surrounding whitespace is ignored");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_uri_and_url_agree();
    ok &= test_rejections();
    ok &= test_kind_specific_match();
    ok &= test_whitespace_trimmed();
    return ok ? 0 : 1;
}
