//
//  oggfetch.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "download_pipeline.hpp"
#include "output_path.hpp"
#include "providers.hpp"
#include "track_set_resolver.hpp"

namespace oggfetch {

/// @defgroup api OggFetch Public API
/// Batch resolution and download of catalog references.
/// @{

/// Everything one invocation needs; filled from the command line.
struct RunOptions {
    Credentials credentials;
    std::string output_template = kDefaultOutputTemplate;
    std::string catalog_dir;          ///< Offline catalog root.
    std::vector<std::string> inputs;  ///< Free-form references (URIs or URLs).
};

/// Collaborators a run talks to; they usually share one session.
struct RunCollaborators {
    Session &session;
    MetadataProvider &metadata;
    KeyProvider &keys;
    StreamProvider &streams;
    Decryptor &decryptor;
    CommentHeaderRewriter &rewriter;
};

enum class RunExit {
    Completed,    ///< All tracks were attempted (individual ones may have failed).
    NoTracks,     ///< Inputs resolved to an empty set.
    AuthFailed,   ///< Session could not be established.
    Aborted,      ///< Configuration-level pipeline failure (template, directories).
};

struct RunReport {
    RunExit exit = RunExit::Completed;
    RunSummary summary;
    Status status;  ///< Cause for AuthFailed/Aborted.
};

/**
 * @brief Return the OggFetch version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3.0`).
 */
std::string version_string();  ///< @ingroup api

// Classify every input line and resolve it into `tracks`, printing one line per input.
void resolve_inputs(MetadataProvider &metadata, const std::vector<std::string> &inputs,
                    TrackIdSet &tracks, std::ostream &console);  ///< @ingroup api

/**
 * @brief Connect, resolve all inputs, then download each track sequentially.
 *
 * Progress and the final tally are printed to `console`; warnings go to the log.
 */
RunReport run(RunCollaborators &collaborators, const RunOptions &options,
              std::ostream &console);  ///< @ingroup api

/// Same as run(), backed by the offline catalog in `options.catalog_dir`.
RunReport run_offline(const RunOptions &options, std::ostream &console);  ///< @ingroup api

/// Process exit code for a run outcome.
int exit_code_for(RunExit exit);  ///< @ingroup api

/// @}

}  // namespace oggfetch
