// Output template rendering and path splitting.
#include <cstdio>
#include <string>

#include "output_path.hpp"
#include "test_fakes.hpp"

using namespace oggfetch;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[output_path_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

TrackRecord sample() {
    auto r = test_fakes::make_track(1, "AC/DC Live");
    r.album_name = "Best Of";
    r.artists = {"Main", "Guest"};
    return r;
}

bool test_default_template() {
    OutputPath path;
    bool ok = check(derive_output_path(kDefaultOutputTemplate, sample(), path).ok, "derive");
    ok &= check(path.file == "Main/Best Of/AC DC Live.ogg", "file path: " + path.file);
    ok &= check(path.folder == "Main/Best Of/", "folder: " + path.folder);
    return ok;
}

bool test_placeholders() {
    bool ok = true;
    ok &= check(render_output_template("{name}/{name}", sample()) == "AC DC Live/AC DC Live",
                "placeholders repeat");
    ok &= check(render_output_template("{year}/{name}.{ext}", sample()) ==
                    "{year}/AC DC Live.ogg",
                "unknown placeholder kept");
    ok &= check(render_output_template("{author", sample()) == "{author", "unterminated brace");

    auto braces = sample();
    braces.album_name = "{name}";
    ok &= check(render_output_template("{album}/x", braces) == "{name}/x",
                "substituted text is not expanded again");

    auto nobody = sample();
    nobody.artists.clear();
    ok &= check(render_output_template("{author}", nobody) == kUnknownArtist, "no artist");

    auto slash_album = sample();
    slash_album.album_name = "A/B";
    ok &= check(render_output_template("{album}", slash_album) == "A/B",
                "only the name has slashes replaced");
    return ok;
}

bool test_rejects_flat_template() {
    OutputPath path;
    auto status = derive_output_path("{name}.{ext}", sample(), path);
    bool ok = check(!status.ok && status.kind == ErrorKind::PathTemplate, "no folder");
    ok &= check(status.message == "invalid format string {name}.{ext}", status.message);

    ok &= check(derive_output_path("out/{name}.{ext}", sample(), path).ok, "relative folder");
    ok &= check(path.folder == "out/", "folder keeps trailing slash");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_default_template();
    ok &= test_placeholders();
    ok &= test_rejects_flat_template();
    return ok ? 0 : 1;
}
