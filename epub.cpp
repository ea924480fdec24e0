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

#define G_LOG_DOMAIN "bookbinder"

#include <epub.hpp>
#include <coverpage.hpp>
#include <packagedocs.hpp>

#include <glib.h>

// The contents of these files is always the same.

const char epub_mimetype[] = "application/epub+zip";

const char container_xml[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<container xmlns="urn:oasis:names:tc:opendocument:xmlns:container" version="1.0">
  <rootfiles>
    <rootfile full-path="content.opf" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>
)";

Epub::Epub(IdGenerator &ids_, CoverRenderer &renderer_, PackOptions opts_)
    : ids{ids_}, renderer{renderer_}, opts{std::move(opts_)} {}

Book Epub::resolve(const Book &book) const {
    Book resolved{book};
    assign_identities(resolved, ids);
    compose_cover(resolved, renderer, ids);
    for(size_t i = 0; i < resolved.chapters.size(); ++i) {
        resolved.chapters[i].index = int(i + 1);
    }
    // Catches attachments added by the cover composer.
    assign_identities(resolved, ids);
    check_identities(resolved);
    return resolved;
}

ZipArchive Epub::pack(const Book &book, Book *resolved) const {
    Book b = resolve(book);
    ZipArchive zf{opts.timestamp};

    // Readers expect mimetype to be the first entry and uncompressed.
    zf.add_member("mimetype", epub_mimetype, false);
    zf.add_member("META-INF/container.xml", container_xml);
    zf.add_member("content.opf", generate_content_opf(b, opts));
    zf.add_member("toc.ncx", generate_toc_ncx(b, opts));
    if(b.stylesheet) {
        zf.add_member("book.css", *b.stylesheet);
    }
    for(const auto &c : b.chapters) {
        zf.add_member(c.file_name(), c.content);
    }
    for(const auto &a : b.attachments) {
        zf.add_member(a.file_name, a.content);
    }
    g_info("Packed %s with %d chapters and %d attachments.",
           b.title.c_str(),
           int(b.chapters.size()),
           int(b.attachments.size()));

    if(resolved) {
        *resolved = std::move(b);
    }
    return zf;
}

std::string Epub::to_bytes(const Book &book) const { return pack(book).finalize(); }

void Epub::generate(const Book &book, const std::filesystem::path &ofile) const {
    // Nothing is written unless the whole archive was built.
    pack(book).write_to(ofile);
    g_info("Wrote %s.", ofile.c_str());
}
