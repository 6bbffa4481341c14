//
//  status.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "status.hpp"

namespace oggfetch {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::MetadataFetch: return "metadata";
        case ErrorKind::NoSuitableEncoding: return "encoding";
        case ErrorKind::Key: return "key";
        case ErrorKind::Stream: return "stream";
        case ErrorKind::Decrypt: return "decrypt";
        case ErrorKind::Container: return "container";
        case ErrorKind::Write: return "write";
        case ErrorKind::PathTemplate: return "template";
        case ErrorKind::DirectoryCreation: return "directory";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

}  // namespace oggfetch
