#include "backend/BookLoader.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <system_error>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

namespace folio::backend {

namespace {

std::string tag(AVDictionary* dict, const char* key) {
    AVDictionaryEntry* entry = av_dict_get(dict, key, nullptr, 0);
    return entry && entry->value ? entry->value : "";
}

}  // namespace

std::optional<BookLoader::Probe> BookLoader::probe(const std::filesystem::path& file) {
    AVFormatContext* ctx = nullptr;
    if (avformat_open_input(&ctx, file.c_str(), nullptr, nullptr) < 0) {
        util::Logger::warn("BookLoader: Cannot open " + file.string());
        return std::nullopt;
    }
    if (avformat_find_stream_info(ctx, nullptr) < 0) {
        util::Logger::warn("BookLoader: No stream info for " + file.string());
        avformat_close_input(&ctx);
        return std::nullopt;
    }

    Probe result;
    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
        result.duration = ctx->duration / static_cast<double>(AV_TIME_BASE);
    }
    result.title = tag(ctx->metadata, "album");
    if (result.title.empty()) result.title = tag(ctx->metadata, "title");
    result.artist = tag(ctx->metadata, "artist");
    result.narrator = tag(ctx->metadata, "composer");

    for (unsigned i = 0; i < ctx->nb_chapters; ++i) {
        const AVChapter* ch = ctx->chapters[i];
        model::Chapter chapter;
        chapter.id = static_cast<int>(i);
        chapter.start = ch->start * av_q2d(ch->time_base);
        chapter.end = ch->end * av_q2d(ch->time_base);
        chapter.title = util::normalize_chapter_title(tag(ch->metadata, "title"));
        if (chapter.title.empty()) chapter.title = "Chapter " + std::to_string(i + 1);
        result.chapters.push_back(std::move(chapter));
    }

    avformat_close_input(&ctx);
    return result;
}

std::vector<std::filesystem::path> BookLoader::collect_tracks(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && util::Platform::is_audio_file(entry.path())) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        util::Logger::warn("BookLoader: Error reading " + dir.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return util::case_insensitive_compare(a.filename().string(), b.filename().string()) < 0;
    });
    return files;
}

std::string BookLoader::stem_title(const std::filesystem::path& file) {
    return util::normalize_chapter_title(file.stem().string());
}

std::optional<model::LoadRequest> BookLoader::load(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        util::Logger::error("BookLoader: " + path.string() + " does not exist");
        return std::nullopt;
    }

    model::LoadRequest request;
    request.book_id = canonical.string();
    request.is_offline = true;

    if (std::filesystem::is_regular_file(canonical, ec)) {
        if (!util::Platform::is_audio_file(canonical)) {
            util::Logger::error("BookLoader: Not an audio file: " + canonical.string());
            return std::nullopt;
        }
        auto info = probe(canonical);
        if (!info) return std::nullopt;

        request.url = canonical.string();
        request.duration = info->duration;
        request.metadata.title = info->title.empty() ? stem_title(canonical) : info->title;
        request.metadata.author = info->artist;
        request.metadata.narrator = info->narrator;
        request.chapters = std::move(info->chapters);
        if (request.chapters.empty()) {
            request.chapters.push_back({0, 0.0, request.duration, request.metadata.title});
        }
    } else if (std::filesystem::is_directory(canonical, ec)) {
        auto files = collect_tracks(canonical);
        if (files.empty()) {
            util::Logger::error("BookLoader: No audio files in " + canonical.string());
            return std::nullopt;
        }

        double offset = 0.0;
        for (const auto& file : files) {
            auto info = probe(file);
            if (!info) {
                util::Logger::warn("BookLoader: Skipping unreadable track " + file.string());
                continue;
            }
            if (request.metadata.title.empty()) {
                request.metadata.title = info->title;
                request.metadata.author = info->artist;
                request.metadata.narrator = info->narrator;
            }

            model::TrackInfo track{file.string(), stem_title(file), offset, info->duration};
            model::Chapter chapter{static_cast<int>(request.chapters.size()), offset,
                                   offset + info->duration, track.title};
            request.tracks.push_back(std::move(track));
            request.chapters.push_back(std::move(chapter));
            offset += info->duration;
        }
        if (request.tracks.empty()) {
            util::Logger::error("BookLoader: No playable tracks in " + canonical.string());
            return std::nullopt;
        }
        request.duration = offset;
        if (request.metadata.title.empty()) request.metadata.title = stem_title(canonical);
    } else {
        util::Logger::error("BookLoader: Unsupported path " + canonical.string());
        return std::nullopt;
    }

    util::Logger::info("BookLoader: '" + request.metadata.title + "' " +
                       std::to_string(request.chapters.size()) + " chapters, " +
                       std::to_string(static_cast<int>(request.duration)) + "s");
    return request;
}

}  // namespace folio::backend
