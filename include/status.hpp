//
//  status.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace oggfetch {

/// Failure categories. Run-level kinds (Auth, PathTemplate, DirectoryCreation, Config) end the
/// run; everything else only skips the reference or track it occurred on.
enum class ErrorKind {
    None = 0,
    Parse,
    MetadataFetch,
    NoSuitableEncoding,
    Key,
    Stream,
    Decrypt,
    Container,
    Write,
    PathTemplate,
    DirectoryCreation,
    Auth,
    Config,
};

/**
 * @brief Result object with success flag, error category and optional error message.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty.
 */
struct Status {
    bool ok{false};
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

inline Status make_ok() { return Status{true, ErrorKind::None, {}}; }

inline Status make_error(ErrorKind kind, std::string msg) {
    return Status{false, kind, std::move(msg)};
}

const char *error_kind_name(ErrorKind kind);

}  // namespace oggfetch
