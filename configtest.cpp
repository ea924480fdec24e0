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

#include <errors.hpp>
#include <metadata.hpp>
#include <testutils.hpp>
#include <ziparchive.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace {

fs::path make_book_dir(const char *name) {
    const auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir / "images");
    write_bytes("<p>one</p>", dir / "one.html");
    write_bytes("<p>two</p>", dir / "two.html");
    write_bytes(std::string("\x89PNG\r\n", 6), dir / "images" / "Photo.PNG");
    write_bytes("body { margin: 0; }", dir / "style.css");
    return dir;
}

void test_full_definition() {
    const auto dir = make_book_dir("bookbinder-configtest-full");
    write_bytes(R"({
    "title": "Must Go Faster",
    "author": "Neia Neutuladh",
    "id": "somebook",
    "language": "fi",
    "output": "out.epub",
    "stylesheet": "style.css",
    "chapters": [
        {"title": "One", "file": "one.html"},
        {"title": "Two", "file": "two.html", "toc": false}
    ],
    "attachments": [
        {"id": "photo", "file": "images/Photo.PNG", "name": "images/photo.png"},
        {"file": "style.css", "mime": "text/x-custom"}
    ],
    "cover_id": "photo",
    "cover": {
        "format": "svg",
        "width": 350,
        "height": 475,
        "fonts": ["Droid Sans Mono", "Inconsolata"],
        "generator": "covertest",
        "text_title_page": true,
        "renderer": "markup"
    },
    "toc": "visible",
    "strict_cover": true,
    "timestamp": 1600000000
})",
                dir / "book.json");

    const auto def = load_book_json(dir / "book.json");
    const auto &b = def.book;
    CHECK(def.top_dir == dir);
    CHECK(def.ofname == dir / "out.epub");
    CHECK(b.title == "Must Go Faster");
    CHECK(b.author == "Neia Neutuladh");
    CHECK(b.id == "somebook");
    CHECK(b.language == "fi");
    CHECK(b.stylesheet && *b.stylesheet == "body { margin: 0; }");

    CHECK(b.chapters.size() == 2);
    CHECK(b.chapters[0].title == "One");
    CHECK(b.chapters[0].show_in_toc);
    CHECK(b.chapters[0].content == "<p>one</p>");
    CHECK(!b.chapters[1].show_in_toc);

    CHECK(b.attachments.size() == 2);
    CHECK(b.attachments[0].file_id == "photo");
    CHECK(b.attachments[0].file_name == "images/photo.png");
    CHECK(b.attachments[0].mime_type == "image/png");
    CHECK(b.attachments[0].content == std::string("\x89PNG\r\n", 6));
    CHECK(b.attachments[1].file_id.empty());
    CHECK(b.attachments[1].file_name == "style.css");
    CHECK(b.attachments[1].mime_type == "text/x-custom");

    CHECK(b.cover_id && *b.cover_id == "photo");
    CHECK(b.cover);
    CHECK(b.cover->format == CoverFormat::Svg);
    CHECK(b.cover->width == 350);
    CHECK(b.cover->height == 475);
    CHECK(b.cover->font_preferences.size() == 2);
    CHECK(b.cover->generator && *b.cover->generator == "covertest");
    CHECK(b.cover->text_title_page);
    CHECK(def.renderer == RendererKind::Markup);

    CHECK(def.options.toc_policy == TocPolicy::VisibleOnly);
    CHECK(def.options.strict_cover_reference);
    CHECK(def.options.timestamp && *def.options.timestamp == 1600000000);
    fs::remove_all(dir);
}

void test_minimal_definition() {
    const auto dir = make_book_dir("bookbinder-configtest-minimal");
    write_bytes(R"({"title": "T", "output": "t.epub"})", dir / "book.json");
    const auto def = load_book_json(dir / "book.json");
    CHECK(def.book.title == "T");
    CHECK(def.book.author.empty());
    CHECK(def.book.id.empty());
    CHECK(def.book.language == "en");
    CHECK(def.book.chapters.empty());
    CHECK(!def.book.cover);
    CHECK(!def.book.cover_id);
    CHECK(!def.book.stylesheet);
    CHECK(def.renderer == RendererKind::Cairo);
    CHECK(def.options.toc_policy == TocPolicy::AllChapters);
    CHECK(!def.options.strict_cover_reference);
    CHECK(!def.options.timestamp);
    fs::remove_all(dir);
}

void test_bad_definitions() {
    const auto dir = make_book_dir("bookbinder-configtest-bad");
    const auto json_file = dir / "book.json";

    CHECK_THROWS(load_book_json(dir / "missing.json"), ConfigError);

    write_bytes("{ not json", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"(["title"])", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"({"output": "t.epub"})", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"({"title": 7, "output": "t.epub"})", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"({"title": "T", "output": "t.epub", "chapters": [{"file": "nope.html"}]})",
                json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"({"title": "T", "output": "t.epub", "cover": {"format": "gif"}})", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"({"title": "T", "output": "t.epub", "cover": {"width": -5}})", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);

    write_bytes(R"({"title": "T", "output": "t.epub", "toc": "some"})", json_file);
    CHECK_THROWS(load_book_json(json_file), ConfigError);
    fs::remove_all(dir);
}

void test_mime_lookup() {
    CHECK(mime_type_for("a/b/pic.JPG") == "image/jpeg");
    CHECK(mime_type_for("font.otf") == "font/otf");
    CHECK(mime_type_for("page.xhtml") == "application/xhtml+xml");
    CHECK(mime_type_for("README") == "application/octet-stream");
}

} // namespace

int main(int, char **) {
    printf("Running book definition tests.\n");
    test_full_definition();
    test_minimal_definition();
    test_bad_definitions();
    test_mime_lookup();
    return 0;
}
