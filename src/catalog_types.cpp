//
//  catalog_types.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "catalog_types.hpp"

#include <utility>

namespace oggfetch {

namespace {

const std::pair<AudioFileFormat, const char *> kFormatNames[] = {
    {AudioFileFormat::OggVorbis96, "OGG_VORBIS_96"},
    {AudioFileFormat::OggVorbis160, "OGG_VORBIS_160"},
    {AudioFileFormat::OggVorbis320, "OGG_VORBIS_320"},
    {AudioFileFormat::Mp3_96, "MP3_96"},
    {AudioFileFormat::Mp3_160, "MP3_160"},
    {AudioFileFormat::Mp3_256, "MP3_256"},
    {AudioFileFormat::Mp3_320, "MP3_320"},
    {AudioFileFormat::Aac24, "AAC_24"},
    {AudioFileFormat::Aac48, "AAC_48"},
    {AudioFileFormat::Flac, "FLAC_FLAC"},
};

}  // namespace

const char *audio_file_format_name(AudioFileFormat format) {
    for (const auto &entry : kFormatNames) {
        if (entry.first == format) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::optional<AudioFileFormat> audio_file_format_from_name(std::string_view name) {
    for (const auto &entry : kFormatNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

}  // namespace oggfetch
