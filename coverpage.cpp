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

#include <coverpage.hpp>
#include <utils.hpp>

#include <glib.h>
#include <tinyxml2.h>

#include <algorithm>

const char title_page_title[] = "Title Page";

namespace {

bool file_name_in_use(const Book &book, const std::string &name) {
    return std::any_of(book.attachments.begin(),
                       book.attachments.end(),
                       [&name](const Attachment &a) { return a.file_name == name; });
}

} // namespace

std::string title_page_xhtml(const Book &book, const Attachment &cover_image, bool text_only) {
    tinyxml2::XMLDocument page;
    auto body = write_xhtml_header(page, book.title, book.language, book.stylesheet.has_value());
    if(text_only) {
        auto heading = page.NewElement("h1");
        body->InsertEndChild(heading);
        heading->SetAttribute("class", "title");
        heading->SetText(book.title.c_str());
        auto author = page.NewElement("p");
        body->InsertEndChild(author);
        author->SetAttribute("class", "author");
        author->SetText(book.author_or_placeholder().c_str());
    } else {
        auto div = page.NewElement("div");
        body->InsertEndChild(div);
        div->SetAttribute("class", "cover");
        auto img = page.NewElement("img");
        div->InsertEndChild(img);
        img->SetAttribute("src", cover_image.file_name.c_str());
        img->SetAttribute("alt", book.title.c_str());
    }
    return xml_to_string(page);
}

void compose_cover(Book &book, CoverRenderer &renderer, IdGenerator &ids) {
    if(!book.cover) {
        return;
    }
    const CoverRequest request = *book.cover;
    CoverText text{book.title, book.author_or_placeholder(), request.generator};
    auto rendered =
        renderer.render(text, request.font_preferences, request.width, request.height, request.format);

    Attachment image;
    image.file_id = book.find_attachment("cover") ? generate_unique_id(book, ids) : "cover";
    image.file_name = "cover." + rendered.extension;
    if(file_name_in_use(book, image.file_name)) {
        image.file_name = image.file_id + "-" + image.file_name;
    }
    image.mime_type = std::move(rendered.mime_type);
    image.content = std::move(rendered.data);

    Chapter title_page;
    title_page.title = title_page_title;
    title_page.show_in_toc = false;
    title_page.content = title_page_xhtml(book, image, request.text_title_page);

    g_debug("Adding cover %s as %s.", image.file_name.c_str(), image.file_id.c_str());
    if(!book.cover_id) {
        book.cover_id = image.file_id;
    }
    book.chapters.insert(book.chapters.begin(), std::move(title_page));
    book.attachments.push_back(std::move(image));
    book.cover.reset();
}
