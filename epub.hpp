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

#include <book.hpp>
#include <coverrenderer.hpp>
#include <identity.hpp>
#include <ziparchive.hpp>

#include <filesystem>
#include <string>

extern const char epub_mimetype[];
extern const char container_xml[];

class Epub {
public:
    Epub(IdGenerator &ids_, CoverRenderer &renderer_, PackOptions opts_ = PackOptions{});

    // A copy of the book with ids, chapter indices and the cover page filled in.
    // The argument is not modified.
    Book resolve(const Book &book) const;

    // If resolved is given, the book that actually got packaged is stored there.
    ZipArchive pack(const Book &book, Book *resolved = nullptr) const;

    std::string to_bytes(const Book &book) const;

    void generate(const Book &book, const std::filesystem::path &ofile) const;

    const PackOptions &options() const { return opts; }

private:
    IdGenerator &ids;
    CoverRenderer &renderer;
    PackOptions opts;
};
