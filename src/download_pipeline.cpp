//
//  download_pipeline.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "download_pipeline.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>
#include <utility>

#include "audio_decrypt.hpp"
#include "logging.hpp"
#include "output_path.hpp"

namespace oggfetch {

namespace {

DownloadOutcome make_outcome(DownloadResult result, std::string path, Status status = {}) {
    return DownloadOutcome{result, std::move(path), std::move(status)};
}

DownloadOutcome skip(const std::string &path, const Status &status, const char *what) {
    OF_LOG("warn", what << ": " << status.message << ", skipping...");
    return make_outcome(DownloadResult::Skipped, path, status);
}

void progress(PipelineContext &ctx, const std::string &line) {
    if (ctx.console) {
        *ctx.console << "   - " << line << "\n";
    }
}

Status read_stream(std::istream &in, std::vector<uint8_t> &out) {
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return make_error(ErrorKind::Stream, "read error after " + std::to_string(out.size()) +
                                                 " bytes");
    }
    return make_ok();
}

Status write_file(const std::string &path, const std::vector<uint8_t> &data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return make_error(ErrorKind::Write, "open failed errno=" + std::to_string(errno) + " (" +
                                                std::generic_category().message(errno) + ")");
    }
    f.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
    f.flush();
    if (!f.good()) {
        return make_error(ErrorKind::Write, "short write");
    }
    return make_ok();
}

}  // namespace

void RunSummary::record(DownloadResult result) {
    switch (result) {
        case DownloadResult::Written:
            ++written;
            break;
        case DownloadResult::AlreadyExists:
            ++existing;
            break;
        case DownloadResult::Skipped:
        case DownloadResult::Fatal:
            break;
    }
}

CommentHeader build_comment_header(const TrackRecord &record) {
    CommentHeader header;
    header.set_vendor(kCommentVendor);
    header.add_tag_single("title", record.name);
    header.add_tag_single("album", record.album_name);
    for (const auto &artist : record.artists) {
        header.add_tag_single("artist", artist);
    }
    return header;
}

bool strip_audio_preamble(const std::vector<uint8_t> &decrypted, std::vector<uint8_t> &out) {
    if (decrypted.size() <= kAudioPreambleSize) {
        return false;
    }
    out.assign(decrypted.begin() + kAudioPreambleSize, decrypted.end());
    return true;
}

DownloadOutcome download_one(PipelineContext &ctx, const TrackId &requested,
                             const TrackRecord &record, const FileId &file,
                             const std::string &output_template) {
    if (requested != record.id) {
        OF_LOG("pipeline", "downloading " << record.id.to_base62() << " as alternative of "
                                       << requested.to_base62());
    }

    OutputPath path;
    auto status = derive_output_path(output_template, record, path);
    if (!status.ok) {
        OF_LOG("error", status.message << ", aborting...");
        return make_outcome(DownloadResult::Fatal, {}, status);
    }

    std::error_code ec;
    if (std::filesystem::exists(path.file, ec)) {
        if (ctx.console) {
            *ctx.console << "   - note: output file \"" << path.file
                         << "\" already exists, skipping...\n";
        }
        return make_outcome(DownloadResult::AlreadyExists, path.file);
    }

    std::filesystem::create_directories(path.folder, ec);
    if (ec) {
        auto err = make_error(ErrorKind::DirectoryCreation,
                              "cannot create folders: " + path.folder + " (" + ec.message() + ")");
        OF_LOG("error", err.message << ", aborting...");
        return make_outcome(DownloadResult::Fatal, path.file, err);
    }

    AudioKey key{};
    status = ctx.keys.request_key(record.id, file, key);
    if (!status.ok) {
        return skip(path.file, status, "cannot get audio key");
    }

    progress(ctx, "getting encrypted audio file");
    std::unique_ptr<std::istream> stream;
    status = ctx.streams.open(file, stream);
    if (!status.ok || !stream) {
        if (status.ok) {
            status = make_error(ErrorKind::Stream, "no stream for file " + file.to_hex());
        }
        return skip(path.file, status, "cannot get audio file");
    }

    std::vector<uint8_t> encrypted;
    status = read_stream(*stream, encrypted);
    if (!status.ok) {
        return skip(path.file, status, "cannot get track file audio");
    }

    progress(ctx, "decrypting audio");
    std::vector<uint8_t> decrypted;
    status = ctx.decryptor.decrypt(key, encrypted, decrypted);
    if (!status.ok) {
        return skip(path.file, status, "cannot decrypt audio file");
    }

    std::vector<uint8_t> payload;
    if (!strip_audio_preamble(decrypted, payload)) {
        return skip(path.file,
                    make_error(ErrorKind::Container, "decrypted file holds only " +
                                                         std::to_string(decrypted.size()) +
                                                         " bytes"),
                    "cannot decrypt audio file");
    }
    OF_LOG("pipeline", "payload starts with " << hex_prefix(payload, 4));

    progress(ctx, "writing output file");
    std::vector<uint8_t> tagged;
    status = ctx.rewriter.splice(payload, build_comment_header(record), tagged);
    if (!status.ok) {
        return skip(path.file, status, "cannot rewrite comment header");
    }

    status = write_file(path.file, tagged);
    if (!status.ok) {
        OF_LOG("warn", "cannot write " << path.file << ": " << status.message << ", skipping...");
        return make_outcome(DownloadResult::Skipped, path.file, status);
    }

    progress(ctx, "wrote \"" + path.file + "\"");
    return make_outcome(DownloadResult::Written, path.file);
}

}  // namespace oggfetch
