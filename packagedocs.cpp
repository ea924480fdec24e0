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

#include <packagedocs.hpp>
#include <errors.hpp>
#include <utils.hpp>

#include <glib.h>
#include <tinyxml2.h>

namespace {

void add_manifest_item(tinyxml2::XMLElement *manifest,
                       const std::string &href,
                       const std::string &id,
                       const std::string &media_type) {
    auto item = manifest->GetDocument()->NewElement("item");
    manifest->InsertEndChild(item);
    item->SetAttribute("href", href.c_str());
    item->SetAttribute("id", id.c_str());
    item->SetAttribute("media-type", media_type.c_str());
}

void write_opf_metadata(tinyxml2::XMLElement *package, const Book &book, const Attachment *cover) {
    auto opf = package->GetDocument();
    auto metadata = opf->NewElement("metadata");
    package->InsertEndChild(metadata);
    metadata->SetAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    metadata->SetAttribute("xmlns:opf", "http://www.idpf.org/2007/opf");

    auto title = opf->NewElement("dc:title");
    metadata->InsertEndChild(title);
    title->SetText(book.title.c_str());
    auto creator = opf->NewElement("dc:creator");
    metadata->InsertEndChild(creator);
    creator->SetAttribute("opf:role", "aut");
    creator->SetText(book.author_or_placeholder().c_str());
    auto language = opf->NewElement("dc:language");
    metadata->InsertEndChild(language);
    language->SetText(book.language.c_str());
    auto identifier = opf->NewElement("dc:identifier");
    metadata->InsertEndChild(identifier);
    identifier->SetAttribute("id", "uuid_id");
    identifier->SetAttribute("opf:scheme", "uuid");
    identifier->SetText(book.id.c_str());
    if(cover) {
        auto meta = opf->NewElement("meta");
        metadata->InsertEndChild(meta);
        meta->SetAttribute("name", "cover");
        meta->SetAttribute("content", cover->file_id.c_str());
    }
}

void generate_manifest(tinyxml2::XMLElement *manifest, const Book &book) {
    for(const auto &c : book.chapters) {
        add_manifest_item(manifest, c.file_name(), c.file_id(), "application/xhtml+xml");
    }
    for(const auto &a : book.attachments) {
        add_manifest_item(manifest, a.file_name, a.file_id, a.mime_type);
    }
    add_manifest_item(manifest, "toc.ncx", "ncx", "application/x-dtbncx+xml");
    if(book.stylesheet) {
        add_manifest_item(manifest, "book.css", "stylesheet", "text/css");
    }
}

void generate_spine(tinyxml2::XMLElement *spine, const Book &book) {
    auto opf = spine->GetDocument();
    for(const auto &c : book.chapters) {
        auto itemref = opf->NewElement("itemref");
        spine->InsertEndChild(itemref);
        itemref->SetAttribute("idref", c.file_id().c_str());
    }
}

void add_ncx_meta(tinyxml2::XMLElement *head, const char *name, const std::string &content) {
    auto meta = head->GetDocument()->NewElement("meta");
    head->InsertEndChild(meta);
    meta->SetAttribute("name", name);
    meta->SetAttribute("content", content.c_str());
}

void add_text_block(tinyxml2::XMLElement *parent, const char *name, const std::string &text) {
    auto ncx = parent->GetDocument();
    auto block = ncx->NewElement(name);
    parent->InsertEndChild(block);
    auto text_element = ncx->NewElement("text");
    block->InsertEndChild(text_element);
    text_element->SetText(text.c_str());
}

void write_navmap(tinyxml2::XMLElement *root, const Book &book, TocPolicy policy) {
    auto ncx = root->GetDocument();
    auto navmap = ncx->NewElement("navMap");
    root->InsertEndChild(navmap);
    int play_order = 0;
    for(const auto &c : book.chapters) {
        if(policy == TocPolicy::VisibleOnly && !c.show_in_toc) {
            continue;
        }
        auto navpoint = ncx->NewElement("navPoint");
        navmap->InsertEndChild(navpoint);
        navpoint->SetAttribute("id", c.nav_id().c_str());
        navpoint->SetAttribute("playOrder", ++play_order);
        add_text_block(navpoint, "navLabel", c.title);
        auto content = ncx->NewElement("content");
        navpoint->InsertEndChild(content);
        content->SetAttribute("src", c.file_name().c_str());
    }
}

} // namespace

std::string generate_content_opf(const Book &book, const PackOptions &opts) {
    const Attachment *cover = book.cover_attachment();
    if(book.cover_id && !cover) {
        if(opts.strict_cover_reference) {
            throw InvalidReference("Cover id " + *book.cover_id + " does not match any attachment.");
        }
        g_debug("Cover id %s not found, leaving it out.", book.cover_id->c_str());
    }

    tinyxml2::XMLDocument opf;
    opf.InsertFirstChild(opf.NewDeclaration(nullptr));
    auto package = opf.NewElement("package");
    opf.InsertEndChild(package);
    package->SetAttribute("xmlns", "http://www.idpf.org/2007/opf");
    package->SetAttribute("unique-identifier", "uuid_id");
    package->SetAttribute("version", "2.0");

    write_opf_metadata(package, book, cover);

    auto manifest = opf.NewElement("manifest");
    package->InsertEndChild(manifest);
    generate_manifest(manifest, book);

    auto spine = opf.NewElement("spine");
    package->InsertEndChild(spine);
    spine->SetAttribute("toc", "ncx");
    generate_spine(spine, book);

    // OPF 2 does not allow an empty guide.
    if(cover) {
        auto guide = opf.NewElement("guide");
        package->InsertEndChild(guide);
        auto reference = opf.NewElement("reference");
        guide->InsertEndChild(reference);
        reference->SetAttribute("href", cover->file_name.c_str());
        reference->SetAttribute("title", "Cover");
        reference->SetAttribute("type", "cover");
    }
    return xml_to_string(opf);
}

std::string generate_toc_ncx(const Book &book, const PackOptions &opts) {
    tinyxml2::XMLDocument ncx;
    ncx.InsertFirstChild(ncx.NewDeclaration(nullptr));
    auto doctype = ncx.NewUnknown(
        R"(DOCTYPE ncx PUBLIC "-//NISO//DTD ncx 2005-1//EN" "http://www.daisy.org/z3986/2005/ncx-2005-1.dtd")");
    ncx.InsertEndChild(doctype);

    auto root = ncx.NewElement("ncx");
    ncx.InsertEndChild(root);
    root->SetAttribute("xmlns", "http://www.daisy.org/z3986/2005/ncx/");
    root->SetAttribute("version", "2005-1");
    root->SetAttribute("xml:lang", book.language.c_str());

    auto head = ncx.NewElement("head");
    root->InsertEndChild(head);
    add_ncx_meta(head, "dtb:uid", book.id);
    add_ncx_meta(head, "dtb:depth", "1");
    add_ncx_meta(head, "dtb:generator", opts.generator_name);
    add_ncx_meta(head, "dtb:totalPageCount", "0");
    add_ncx_meta(head, "dtb:maxPageNumber", "0");

    add_text_block(root, "docTitle", book.title);
    add_text_block(root, "docAuthor", book.author_or_placeholder());

    write_navmap(root, book, opts.toc_policy);
    return xml_to_string(ncx);
}
