/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

// Used in generated documents whenever the book has no author.
extern const char unknown_author[];

enum class CoverFormat : int {
    Svg,
    Png,
};

struct CoverRequest {
    CoverFormat format = CoverFormat::Png;
    // Kindle Direct Publishing's recommended cover size.
    uint32_t width = 1600;
    uint32_t height = 2560;
    // In priority order. The renderer falls back to Sans if none of these work.
    std::vector<std::string> font_preferences;
    // Adds a "Generated by" line to the cover when set.
    std::optional<std::string> generator;
    // Title page shows title and author as text instead of the cover image.
    bool text_title_page = false;
};

struct Chapter {
    std::string title;
    bool show_in_toc = true;
    // Must be a complete XHTML document. Not validated.
    std::string content;
    // 1-based position in the spine, set when the book is resolved.
    int index = 0;

    std::string file_id() const;
    std::string file_name() const;
    std::string nav_id() const;
};

struct Attachment {
    std::string file_id;
    // Path inside the archive.
    std::string file_name;
    std::string mime_type;
    std::string content;
};

struct Book {
    std::string id;
    std::string title;
    std::string author;
    std::string language = "en";
    std::vector<Chapter> chapters;
    std::vector<Attachment> attachments;
    std::optional<std::string> cover_id;
    std::optional<CoverRequest> cover;
    std::optional<std::string> stylesheet;

    const std::string &author_or_placeholder() const;
    const Attachment *find_attachment(const std::string &file_id) const;
    const Attachment *cover_attachment() const;
};

enum class TocPolicy : int {
    AllChapters,
    VisibleOnly,
};

struct PackOptions {
    TocPolicy toc_policy = TocPolicy::AllChapters;
    bool strict_cover_reference = false;
    std::string generator_name = "bookbinder";
    // Fixed modification time for all archive members. Current time if unset.
    std::optional<time_t> timestamp;
};

std::string name_based_uuid(const std::string &name);
