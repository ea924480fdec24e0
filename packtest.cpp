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

#include <epub.hpp>
#include <errors.hpp>
#include <packagedocs.hpp>
#include <testutils.hpp>

namespace {

Chapter make_chapter(const char *title, const char *content, bool toc = true) {
    Chapter c;
    c.title = title;
    c.show_in_toc = toc;
    c.content = content;
    return c;
}

Attachment make_attachment(const char *id, const char *name, const char *mime) {
    Attachment a;
    a.file_id = id;
    a.file_name = name;
    a.mime_type = mime;
    a.content = std::string("\x89PNG\0\0data", 10);
    return a;
}

Book three_chapter_book() {
    Book b;
    b.id = "book-1";
    b.title = "Three";
    b.author = "Writer";
    b.chapters.push_back(make_chapter("First", "<p>1</p>"));
    b.chapters.push_back(make_chapter("Second", "<p>2</p>"));
    b.chapters.push_back(make_chapter("Third", "<p>3</p>"));
    return b;
}

std::vector<std::string> spine_idrefs(const std::string &opf) {
    tinyxml2::XMLDocument doc;
    CHECK(doc.Parse(opf.c_str(), opf.size()) == tinyxml2::XML_SUCCESS);
    std::vector<std::string> result;
    auto spine = doc.FirstChildElement("package")->FirstChildElement("spine");
    CHECK(spine);
    for(auto e = spine->FirstChildElement("itemref"); e; e = e->NextSiblingElement("itemref")) {
        result.push_back(e->Attribute("idref"));
    }
    return result;
}

struct NavEntry {
    std::string id;
    int play_order;
    std::string label;
    std::string src;
};

std::vector<NavEntry> nav_entries(const std::string &ncx) {
    tinyxml2::XMLDocument doc;
    CHECK(doc.Parse(ncx.c_str(), ncx.size()) == tinyxml2::XML_SUCCESS);
    std::vector<NavEntry> result;
    auto navmap = doc.FirstChildElement("ncx")->FirstChildElement("navMap");
    CHECK(navmap);
    for(auto p = navmap->FirstChildElement("navPoint"); p; p = p->NextSiblingElement("navPoint")) {
        NavEntry e;
        e.id = p->Attribute("id");
        e.play_order = p->IntAttribute("playOrder");
        const char *label = p->FirstChildElement("navLabel")->FirstChildElement("text")->GetText();
        e.label = label ? label : "";
        e.src = p->FirstChildElement("content")->Attribute("src");
        result.push_back(e);
    }
    return result;
}

void test_chapter_naming() {
    Chapter c = make_chapter("Ch1", "");
    c.index = 3;
    CHECK(c.file_id() == "chapter3");
    CHECK(c.file_name() == "chapter3.html");
    CHECK(c.nav_id() == "ch8be2d308316c51d89fba52bb8c75f91a");
    Chapter same = make_chapter("Ch1", "other content");
    CHECK(same.nav_id() == c.nav_id());
    Chapter untitled = make_chapter("", "");
    CHECK(untitled.nav_id() == "che129f27c51035c5c844bcdf0a15e160d");
}

void test_identity_assignment() {
    Book b;
    b.attachments.push_back(make_attachment("", "a.png", "image/png"));
    b.attachments.push_back(make_attachment("keep", "b.png", "image/png"));
    SequenceIdGenerator ids({"id-1", "id-2", "id-3"});
    assign_identities(b, ids);
    CHECK(b.id == "id-1");
    CHECK(b.attachments[0].file_id == "id-2");
    CHECK(b.attachments[1].file_id == "keep");
    CHECK(ids.used() == 2);

    assign_identities(b, ids);
    CHECK(ids.used() == 2);
    CHECK(b.id == "id-1");
    CHECK(b.attachments[0].file_id == "id-2");
}

void test_identity_collision_and_exhaustion() {
    Book b;
    b.attachments.push_back(make_attachment("taken", "a.png", "image/png"));
    SequenceIdGenerator ids({"taken", "fresh"});
    assign_identities(b, ids);
    CHECK(b.id == "fresh");

    Book empty;
    SequenceIdGenerator dry({});
    CHECK_THROWS(assign_identities(empty, dry), IdentityError);
}

void test_identity_checks() {
    Book b;
    b.attachments.push_back(make_attachment("pic", "a.png", "image/png"));
    b.attachments.push_back(make_attachment("pic", "b.png", "image/png"));
    CHECK_THROWS(check_identities(b), IdentityError);

    b.attachments[1].file_id = "ncx";
    CHECK_THROWS(check_identities(b), IdentityError);

    b.attachments[1].file_id = "chapter2";
    CHECK_THROWS(check_identities(b), IdentityError);

    b.attachments[1].file_id = "uuid_id";
    CHECK_THROWS(check_identities(b), IdentityError);

    b.attachments[1].file_id = "chapters";
    check_identities(b);
}

void test_spine_and_navmap_order() {
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto resolved = epub.resolve(three_chapter_book());
    const PackOptions opts;

    const auto opf = generate_content_opf(resolved, opts);
    const std::vector<std::string> expected{"chapter1", "chapter2", "chapter3"};
    CHECK(spine_idrefs(opf) == expected);

    const auto nav = nav_entries(generate_toc_ncx(resolved, opts));
    CHECK(nav.size() == 3);
    const char *titles[] = {"First", "Second", "Third"};
    for(size_t i = 0; i < nav.size(); ++i) {
        CHECK(nav[i].play_order == int(i + 1));
        CHECK(nav[i].label == titles[i]);
        CHECK(nav[i].src == "chapter" + std::to_string(i + 1) + ".html");
        CHECK(nav[i].id == resolved.chapters[i].nav_id());
    }
}

void test_escaping() {
    Book b;
    b.id = "esc";
    b.title = "Tom & \"Jerry\" <3";
    b.author = "O'Brien & Sons";
    b.chapters.push_back(make_chapter("A & B < C>", "<p/>"));
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto resolved = epub.resolve(b);
    const PackOptions opts;

    const auto ncx = generate_toc_ncx(resolved, opts);
    CHECK(is_well_formed(ncx));
    CHECK(!contains(ncx, "A & B"));
    const auto nav = nav_entries(ncx);
    CHECK(nav.size() == 1);
    CHECK(nav[0].label == "A & B < C>");
    CHECK(nav[0].id == "ch075bcfb15eb8504e93cbec733c2bebdb");

    const auto opf = generate_content_opf(resolved, opts);
    CHECK(is_well_formed(opf));
    tinyxml2::XMLDocument doc;
    doc.Parse(opf.c_str(), opf.size());
    auto metadata = doc.FirstChildElement("package")->FirstChildElement("metadata");
    CHECK(std::string(metadata->FirstChildElement("dc:title")->GetText()) == b.title);
    CHECK(std::string(metadata->FirstChildElement("dc:creator")->GetText()) == b.author);
}

void test_must_go_faster() {
    Book b;
    b.title = "Must Go Faster";
    b.author = "Neia Neutuladh";
    b.chapters.push_back(make_chapter("Ch1", "<p>hi</p>"));
    SequenceIdGenerator ids({"11111111-2222-4333-8444-555555555555"});
    MarkupCoverRenderer r;
    Epub epub(ids, r);

    const auto members = extract_archive(epub.to_bytes(b));
    CHECK(members.size() == 5);
    CHECK(members[0].name == "mimetype");
    CHECK(members[0].data == "application/epub+zip");
    CHECK(members[0].method == ZIP_CM_STORE);
    CHECK(members[1].name == "META-INF/container.xml");
    CHECK(contains(members[1].data, "full-path=\"content.opf\""));
    CHECK(members[2].name == "content.opf");
    CHECK(members[3].name == "toc.ncx");
    CHECK(members[4].name == "chapter1.html");
    CHECK(members[4].data == "<p>hi</p>");

    const auto &opf = members[2].data;
    CHECK(contains(opf, "<dc:title>Must Go Faster</dc:title>"));
    CHECK(contains(opf, "<dc:creator opf:role=\"aut\">Neia Neutuladh</dc:creator>"));
    CHECK(contains(opf, "11111111-2222-4333-8444-555555555555"));
    CHECK(count_occurrences(opf, "<itemref ") == 1);
    CHECK(contains(opf, "<itemref idref=\"chapter1\"/>"));
    CHECK(contains(members[3].data, "<text>Ch1</text>"));
}

void test_missing_author() {
    Book b;
    b.id = "t";
    b.title = "T";
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto resolved = epub.resolve(b);
    const auto opf = generate_content_opf(resolved, epub.options());
    CHECK(contains(opf, "<dc:creator opf:role=\"aut\">Unknown</dc:creator>"));
    CHECK(!contains(opf, "<dc:creator opf:role=\"aut\"/>"));
    const auto ncx = generate_toc_ncx(resolved, epub.options());
    CHECK(contains(ncx, "<text>Unknown</text>"));
}

void test_unresolved_cover_id() {
    Book b;
    b.id = "ghostbook";
    b.title = "Ghost";
    b.cover_id = "ghost";
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto members = extract_archive(epub.to_bytes(b));
    const auto *opf = find_member(members, "content.opf");
    CHECK(opf);
    CHECK(!contains(opf->data, "type=\"cover\""));
    CHECK(!contains(opf->data, "name=\"cover\""));
    CHECK(!contains(opf->data, "<guide"));

    PackOptions strict;
    strict.strict_cover_reference = true;
    Epub strict_epub(ids, r, strict);
    CHECK_THROWS(strict_epub.pack(b), InvalidReference);
}

void test_resolved_cover_id() {
    Book b = three_chapter_book();
    b.attachments.push_back(make_attachment("pic", "images/front.png", "image/png"));
    b.cover_id = "pic";
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto opf = generate_content_opf(epub.resolve(b), epub.options());
    CHECK(contains(opf, "<meta name=\"cover\" content=\"pic\"/>"));
    CHECK(contains(opf, "<reference href=\"images/front.png\" title=\"Cover\" type=\"cover\"/>"));
    CHECK(contains(opf,
                   "<item href=\"images/front.png\" id=\"pic\" media-type=\"image/png\"/>"));
}

void test_caller_book_untouched() {
    Book b = three_chapter_book();
    b.id.clear();
    b.attachments.push_back(make_attachment("", "x.png", "image/png"));
    SequenceIdGenerator ids({"gen-book", "gen-att"});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    Book resolved;
    auto zf = epub.pack(b, &resolved);

    CHECK(b.id.empty());
    CHECK(b.attachments[0].file_id.empty());
    for(const auto &c : b.chapters) {
        CHECK(c.index == 0);
    }
    CHECK(resolved.id == "gen-book");
    CHECK(resolved.attachments[0].file_id == "gen-att");
    for(size_t i = 0; i < resolved.chapters.size(); ++i) {
        CHECK(resolved.chapters[i].index == int(i + 1));
    }
    CHECK(zf.members().size() == 4 + 3 + 1);
    CHECK(zf.members().back().name == "x.png");
    CHECK(zf.members().back().data == b.attachments[0].content);
}

void test_visible_only_policy() {
    Book b = three_chapter_book();
    b.chapters[1].show_in_toc = false;
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto resolved = epub.resolve(b);

    PackOptions all;
    CHECK(nav_entries(generate_toc_ncx(resolved, all)).size() == 3);

    PackOptions visible;
    visible.toc_policy = TocPolicy::VisibleOnly;
    const auto nav = nav_entries(generate_toc_ncx(resolved, visible));
    CHECK(nav.size() == 2);
    CHECK(nav[0].label == "First");
    CHECK(nav[1].label == "Third");
    CHECK(nav[0].play_order == 1);
    CHECK(nav[1].play_order == 2);
    CHECK(nav[1].src == "chapter3.html");
    CHECK(spine_idrefs(generate_content_opf(resolved, visible)).size() == 3);
}

void test_resolution_is_idempotent() {
    Book b = three_chapter_book();
    b.id.clear();
    b.attachments.push_back(make_attachment("", "x.png", "image/png"));
    SequenceIdGenerator ids({"a", "b"});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto once = epub.resolve(b);
    const auto twice = epub.resolve(once);
    CHECK(ids.used() == 2);
    CHECK(generate_content_opf(once, epub.options()) == generate_content_opf(twice, epub.options()));
    CHECK(generate_toc_ncx(once, epub.options()) == generate_toc_ncx(twice, epub.options()));
}

void test_stylesheet() {
    Book b = three_chapter_book();
    b.stylesheet = "p { margin: 0; }";
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    const auto members = extract_archive(epub.to_bytes(b));
    CHECK(members[4].name == "book.css");
    CHECK(members[4].data == *b.stylesheet);
    CHECK(members[5].name == "chapter1.html");
    CHECK(contains(find_member(members, "content.opf")->data,
                   "<item href=\"book.css\" id=\"stylesheet\" media-type=\"text/css\"/>"));
}

void test_reproducible_bytes() {
    Book b = three_chapter_book();
    b.attachments.push_back(make_attachment("pic", "pic.png", "image/png"));
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    PackOptions opts;
    opts.timestamp = 1600000000;
    Epub epub(ids, r, opts);
    CHECK(epub.to_bytes(b) == epub.to_bytes(b));
}

void test_duplicate_member_names() {
    Book b = three_chapter_book();
    b.attachments.push_back(make_attachment("page", "chapter1.html", "application/xhtml+xml"));
    SequenceIdGenerator ids({});
    MarkupCoverRenderer r;
    Epub epub(ids, r);
    CHECK_THROWS(epub.pack(b), ContainerWriteError);
}

} // namespace

int main(int, char **) {
    printf("Running packaging tests.\n");
    test_chapter_naming();
    test_identity_assignment();
    test_identity_collision_and_exhaustion();
    test_identity_checks();
    test_spine_and_navmap_order();
    test_escaping();
    test_must_go_faster();
    test_missing_author();
    test_unresolved_cover_id();
    test_resolved_cover_id();
    test_caller_book_untouched();
    test_visible_only_policy();
    test_resolution_is_idempotent();
    test_stylesheet();
    test_reproducible_bytes();
    test_duplicate_member_names();
    return 0;
}
