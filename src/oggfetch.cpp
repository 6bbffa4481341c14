//
//  oggfetch.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "oggfetch.hpp"
#include "oggfetch_version.hpp"

#include <chrono>
#include <utility>

#include "audio_decrypt.hpp"
#include "logging.hpp"
#include "offline_catalog.hpp"
#include "ogg_comment_rewriter.hpp"
#include "reference_parser.hpp"
#include "track_format_resolver.hpp"

namespace oggfetch {

namespace {

RunReport make_report(RunExit exit, const RunSummary &summary, Status status = {}) {
    return RunReport{exit, summary, std::move(status)};
}

void print_track_header(std::ostream &console, const TrackId &requested,
                        const PlayableTrack &track) {
    console << " -> " << track.record.name << " (" << track.record.id.to_base62();
    if (track.record.id != requested) {
        console << " alt. " << requested.to_base62();
    }
    console << ")\n";
}

void print_summary(std::ostream &console, const RunSummary &summary) {
    console << "\n=> Processed tracks:\n"
            << " -> " << summary.errors() << " error\n"
            << " -> " << summary.existing << " already downloaded\n"
            << " -> " << summary.written << " new\n"
            << " -> " << summary.total << " total processed\n";
}

}  // namespace

std::string version_string() { return OGGFETCH_VERSION_DISPLAY; }

void resolve_inputs(MetadataProvider &metadata, const std::vector<std::string> &inputs,
                    TrackIdSet &tracks, std::ostream &console) {
    console << "\n=> Input resources:\n";
    for (const auto &line : inputs) {
        auto ref = classify_reference(line);
        if (!ref) {
            console << " -> warning: unrecognized input: " << line << ", skipping...\n";
            continue;
        }
        console << " -> " << resource_kind_name(ref->kind) << ": " << ref->id_text << "\n";
        auto status = resolve_reference(metadata, *ref, tracks);
        if (!status.ok) {
            OF_LOG("warn", "cannot get " << resource_kind_name(ref->kind)
                                         << " metadata: " << status.message << ", skipping...");
        }
    }
}

RunReport run(RunCollaborators &collaborators, const RunOptions &options,
              std::ostream &console) {
    RunSummary summary;

    auto status = collaborators.session.connect(options.credentials);
    if (!status.ok) {
        OF_LOG("error", "cannot log in: " << status.message);
        return make_report(RunExit::AuthFailed, summary, status);
    }
    console << "=> Logged in as: " << options.credentials.username << "\n";

    TrackIdSet tracks;
    resolve_inputs(collaborators.metadata, options.inputs, tracks, console);
    if (tracks.empty()) {
        console << "\nerror: didn't get any tracks, aborting...\n";
        return make_report(RunExit::NoTracks, summary);
    }

    summary.total = tracks.size();
    console << "\n=> Parsed " << tracks.size() << " tracks:\n";

    PipelineContext ctx{collaborators.keys, collaborators.streams, collaborators.decryptor,
                        collaborators.rewriter, &console};
    const auto t0 = std::chrono::steady_clock::now();

    for (const auto &requested : tracks) {
        PlayableTrack track;
        status = resolve_playable(collaborators.metadata, requested, track);
        if (!status.ok) {
            console << " -> ?? (" << requested.to_base62() << ")\n";
            OF_LOG("warn", "cannot get track from id: " << status.message << ", skipping...");
            continue;
        }
        print_track_header(console, requested, track);

        auto outcome = download_one(ctx, requested, track.record, track.file,
                                    options.output_template);
        if (outcome.result == DownloadResult::Fatal) {
            return make_report(RunExit::Aborted, summary, outcome.status);
        }
        if (outcome.result == DownloadResult::Skipped) {
            OF_LOG("run", "skipped " << requested.to_base62() << " ("
                                       << error_kind_name(outcome.status.kind) << ")");
        }
        summary.record(outcome.result);
    }

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0)
                                .count();
    OF_LOG("run", "processed " << summary.total << " tracks in " << elapsed_ms << " ms");

    print_summary(console, summary);
    return make_report(RunExit::Completed, summary);
}

RunReport run_offline(const RunOptions &options, std::ostream &console) {
    OfflineCatalog catalog(options.catalog_dir);
    AudioDecryptor decryptor;
    OggCommentRewriter rewriter;
    RunCollaborators collaborators{catalog, catalog, catalog, catalog, decryptor, rewriter};
    return run(collaborators, options, console);
}

int exit_code_for(RunExit exit) {
    switch (exit) {
        case RunExit::Completed:
        case RunExit::NoTracks:
            return 0;
        case RunExit::AuthFailed:
        case RunExit::Aborted:
            return 1;
    }
    return 1;
}

}  // namespace oggfetch
