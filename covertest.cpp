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

#include <cairocover.hpp>
#include <coverpage.hpp>
#include <epub.hpp>
#include <errors.hpp>
#include <packagedocs.hpp>
#include <testutils.hpp>
#include <utils.hpp>

#include <filesystem>

namespace {

class RecordingRenderer : public CoverRenderer {
public:
    RenderedCover render(const CoverText &text,
                         const std::vector<std::string> &fonts_,
                         uint32_t width_,
                         uint32_t height_,
                         CoverFormat format_) override {
        ++calls;
        last_text = text;
        fonts = fonts_;
        width = width_;
        height = height_;
        format = format_;
        if(fail) {
            throw RenderUnavailable("No backend.");
        }
        return RenderedCover{"PNGDATA", "image/png", "png"};
    }

    int calls = 0;
    bool fail = false;
    CoverText last_text;
    std::vector<std::string> fonts;
    uint32_t width = 0;
    uint32_t height = 0;
    CoverFormat format = CoverFormat::Svg;
};

Book covered_book() {
    Book b;
    b.id = "somebook";
    b.title = "Must Go Faster";
    b.author = "Neia Neutuladh";
    for(const char *t : {"One", "Two"}) {
        Chapter c;
        c.title = t;
        c.content = "<p>text</p>";
        b.chapters.push_back(c);
    }
    CoverRequest req;
    req.generator = "covertest";
    req.font_preferences = {"Droid Sans Mono", "Inconsolata"};
    b.cover = req;
    return b;
}

void test_cover_injection() {
    RecordingRenderer r;
    SequenceIdGenerator ids({});
    Epub epub(ids, r);
    const Book b = covered_book();
    const auto resolved = epub.resolve(b);

    CHECK(r.calls == 1);
    CHECK(r.last_text.title == "Must Go Faster");
    CHECK(r.last_text.author == "Neia Neutuladh");
    CHECK(r.last_text.generator && *r.last_text.generator == "covertest");
    CHECK(r.fonts.size() == 2 && r.fonts[0] == "Droid Sans Mono");
    CHECK(r.width == 1600);
    CHECK(r.height == 2560);
    CHECK(r.format == CoverFormat::Png);

    CHECK(resolved.chapters.size() == b.chapters.size() + 1);
    CHECK(resolved.attachments.size() == b.attachments.size() + 1);
    const auto &title_page = resolved.chapters.front();
    CHECK(title_page.index == 1);
    CHECK(!title_page.show_in_toc);
    CHECK(title_page.title == title_page_title);
    CHECK(is_well_formed(title_page.content));
    CHECK(contains(title_page.content, "<img src=\"cover.png\" alt=\"Must Go Faster\"/>"));
    CHECK(resolved.chapters[1].title == "One");
    CHECK(resolved.chapters[1].index == 2);

    const auto &image = resolved.attachments.back();
    CHECK(image.file_id == "cover");
    CHECK(image.file_name == "cover.png");
    CHECK(image.mime_type == "image/png");
    CHECK(image.content == "PNGDATA");
    CHECK(resolved.cover_id && *resolved.cover_id == "cover");
    CHECK(!resolved.cover);

    // The caller's book still has its request and no title page.
    CHECK(b.cover);
    CHECK(b.chapters.size() == 2);
}

void test_cover_in_documents() {
    RecordingRenderer r;
    SequenceIdGenerator ids({});
    Epub epub(ids, r);
    const auto resolved = epub.resolve(covered_book());

    const auto opf = generate_content_opf(resolved, epub.options());
    CHECK(contains(opf, "<meta name=\"cover\" content=\"cover\"/>"));
    CHECK(contains(opf, "<reference href=\"cover.png\" title=\"Cover\" type=\"cover\"/>"));
    CHECK(count_occurrences(opf, "<itemref ") == 3);
    CHECK(opf.find("idref=\"chapter1\"") < opf.find("idref=\"chapter2\""));

    // Hidden chapters are still listed unless asked otherwise.
    const auto ncx = generate_toc_ncx(resolved, epub.options());
    CHECK(count_occurrences(ncx, "<navPoint ") == 3);
    CHECK(contains(ncx, "<text>Title Page</text>"));
    CHECK(contains(ncx, "playOrder=\"1\""));

    PackOptions visible;
    visible.toc_policy = TocPolicy::VisibleOnly;
    const auto filtered = generate_toc_ncx(resolved, visible);
    CHECK(count_occurrences(filtered, "<navPoint ") == 2);
    CHECK(!contains(filtered, "Title Page"));
    // Numbering restarts after the skipped title page.
    CHECK(contains(filtered, "playOrder=\"1\""));
    CHECK(contains(filtered, "playOrder=\"2\""));
    CHECK(!contains(filtered, "playOrder=\"3\""));
}

void test_cover_archive_layout() {
    RecordingRenderer r;
    SequenceIdGenerator ids({});
    Epub epub(ids, r);
    const auto members = extract_archive(epub.to_bytes(covered_book()));
    std::vector<std::string> names;
    for(const auto &m : members) {
        names.push_back(m.name);
    }
    const std::vector<std::string> expected{"mimetype",
                                            "META-INF/container.xml",
                                            "content.opf",
                                            "toc.ncx",
                                            "chapter1.html",
                                            "chapter2.html",
                                            "chapter3.html",
                                            "cover.png"};
    CHECK(names == expected);
    CHECK(contains(members[4].data, "cover.png"));
    CHECK(members[5].data == "<p>text</p>");
    CHECK(members[7].data == "PNGDATA");
}

void test_text_title_page() {
    RecordingRenderer r;
    SequenceIdGenerator ids({});
    Epub epub(ids, r);
    Book b = covered_book();
    b.title = "Cats & <Dogs>";
    b.author.clear();
    b.stylesheet = "h1 { text-align: center; }";
    b.cover->text_title_page = true;
    const auto resolved = epub.resolve(b);
    const auto &page = resolved.chapters.front().content;
    CHECK(is_well_formed(page));
    CHECK(contains(page, "<h1 class=\"title\">Cats &amp; &lt;Dogs&gt;</h1>"));
    CHECK(contains(page, "<p class=\"author\">Unknown</p>"));
    CHECK(contains(page, "href=\"book.css\""));
    CHECK(!contains(page, "<img"));
    CHECK(r.last_text.author == "Unknown");
    // The image is still produced and used as the cover.
    CHECK(resolved.attachments.back().file_name == "cover.png");
}

void test_cover_name_clashes() {
    RecordingRenderer r;
    SequenceIdGenerator ids({"generated-cover"});
    Epub epub(ids, r);
    Book b = covered_book();
    Attachment existing;
    existing.file_id = "cover";
    existing.file_name = "cover.png";
    existing.mime_type = "image/png";
    existing.content = "old";
    b.attachments.push_back(existing);
    b.cover_id = "cover";

    const auto resolved = epub.resolve(b);
    CHECK(resolved.attachments.size() == 2);
    const auto &image = resolved.attachments.back();
    CHECK(image.file_id == "generated-cover");
    CHECK(image.file_name == "generated-cover-cover.png");
    // A cover id given by the caller wins.
    CHECK(*resolved.cover_id == "cover");
    CHECK(contains(resolved.chapters.front().content, "generated-cover-cover.png"));

    SequenceIdGenerator fresh_ids({"generated-cover"});
    Epub fresh(fresh_ids, r);
    const auto members = extract_archive(fresh.to_bytes(b));
    CHECK(members.size() == 4 + 3 + 2);
}

void test_renderer_failure_aborts_pack() {
    RecordingRenderer r;
    r.fail = true;
    SequenceIdGenerator ids({});
    Epub epub(ids, r);
    CHECK_THROWS(epub.to_bytes(covered_book()), RenderUnavailable);
}

void test_generate_to_path() {
    namespace fs = std::filesystem;
    const auto dir = fs::temp_directory_path() / "bookbinder-covertest-generate";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const auto ofile = dir / "book.epub";
    auto tmpfile = ofile;
    tmpfile += ".tmp";

    RecordingRenderer r;
    SequenceIdGenerator ids({});
    Epub epub(ids, r);
    epub.generate(covered_book(), ofile);
    const auto good = read_file(ofile);
    const auto members = extract_archive(good);
    CHECK(members.size() == 8);
    CHECK(members[0].name == "mimetype");
    CHECK(!fs::exists(tmpfile));

    // A failing render leaves the earlier book in place.
    r.fail = true;
    CHECK_THROWS(epub.generate(covered_book(), ofile), RenderUnavailable);
    CHECK(read_file(ofile) == good);
    CHECK(!fs::exists(tmpfile));

    // So does a failing write.
    r.fail = false;
    const auto blocked = dir / "blocked";
    fs::create_directories(blocked / "keep");
    CHECK_THROWS(epub.generate(covered_book(), blocked), ContainerWriteError);
    CHECK(fs::is_directory(blocked / "keep"));
    auto blocked_tmp = blocked;
    blocked_tmp += ".tmp";
    CHECK(!fs::exists(blocked_tmp));

    CHECK_THROWS(epub.generate(covered_book(), dir / "missing" / "book.epub"),
                 ContainerWriteError);
    CHECK(read_file(ofile) == good);
    fs::remove_all(dir);
}

void test_markup_renderer() {
    MarkupCoverRenderer r;
    CoverText text{"Fish & Chips", "<Author>", std::string("covertest")};
    CHECK_THROWS(r.render(text, {}, 350, 475, CoverFormat::Png), RenderUnavailable);

    const auto svg = r.render(text, {"Droid Sans Mono", "Inconsolata"}, 350, 475, CoverFormat::Svg);
    CHECK(svg.mime_type == "image/svg+xml");
    CHECK(svg.extension == "svg");
    CHECK(is_well_formed(svg.data));
    CHECK(contains(svg.data, "Fish &amp; Chips"));
    CHECK(contains(svg.data, "&lt;Author&gt;"));
    CHECK(contains(svg.data, "Generated by covertest"));
    CHECK(contains(svg.data, "Inconsolata"));
    CHECK(contains(svg.data, "sans-serif"));

    RandomIdGenerator ids;
    Epub epub(ids, r);
    Book b = covered_book();
    CHECK_THROWS(epub.pack(b), RenderUnavailable);
    b.cover->format = CoverFormat::Svg;
    Book resolved;
    epub.pack(b, &resolved);
    CHECK(resolved.attachments.back().file_name == "cover.svg");
}

void test_cairo_renderer() {
    CHECK(CairoCoverRenderer::select_font({"No Such Font Family 1234"}) == "Sans");

    CairoCoverRenderer r;
    CoverText text{"Must Go Faster", "Neia Neutuladh", std::string("covertest")};
    const auto png = r.render(text, {"Droid Sans Mono"}, 160, 256, CoverFormat::Png);
    CHECK(png.mime_type == "image/png");
    CHECK(png.data.size() > 8);
    CHECK(png.data.compare(0, 4, "\x89PNG") == 0);

    const auto svg = r.render(text, {}, 160, 256, CoverFormat::Svg);
    CHECK(svg.mime_type == "image/svg+xml");
    CHECK(contains(svg.data, "<svg"));

    CHECK_THROWS(r.render(text, {}, 0, 256, CoverFormat::Png), RenderUnavailable);
}

} // namespace

int main(int, char **) {
    printf("Running cover tests.\n");
    test_cover_injection();
    test_cover_in_documents();
    test_cover_archive_layout();
    test_text_title_page();
    test_cover_name_clashes();
    test_renderer_failure_aborts_pack();
    test_generate_to_path();
    test_markup_renderer();
    test_cairo_renderer();
    return 0;
}
