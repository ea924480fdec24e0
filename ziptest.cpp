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
#include <testutils.hpp>
#include <utils.hpp>
#include <ziparchive.hpp>

#include <filesystem>

namespace {

void test_member_order_and_compression() {
    ZipArchive zf;
    zf.add_member("mimetype", "application/epub+zip", false);
    zf.add_member("z-last-alphabetically.txt", std::string(1000, 'z'));
    zf.add_member("a/nested/file.bin", std::string("\0\1\2\3", 4));
    CHECK(zf.members().size() == 3);

    const auto members = extract_archive(zf.finalize());
    CHECK(members.size() == 3);
    CHECK(members[0].name == "mimetype");
    CHECK(members[0].method == ZIP_CM_STORE);
    CHECK(members[1].name == "z-last-alphabetically.txt");
    CHECK(members[1].method == ZIP_CM_DEFLATE);
    CHECK(members[1].data == std::string(1000, 'z'));
    CHECK(members[2].name == "a/nested/file.bin");
    CHECK(members[2].data == std::string("\0\1\2\3", 4));
}

void test_stored_member_is_at_start() {
    // The EPUB magic number: "mimetype" stored uncompressed right after the first local header.
    ZipArchive zf;
    zf.add_member("mimetype", "application/epub+zip", false);
    zf.add_member("content.opf", "<package/>");
    const auto bytes = zf.finalize();
    CHECK(bytes.compare(0, 4, "PK\x03\x04") == 0);
    CHECK(bytes.compare(30, 8, "mimetype") == 0);
    CHECK(bytes.find("application/epub+zip") != std::string::npos);
}

void test_duplicate_names() {
    ZipArchive zf;
    zf.add_member("a.txt", "one");
    CHECK_THROWS(zf.add_member("a.txt", "two"), ContainerWriteError);
    CHECK_THROWS(zf.add_member("", "nameless"), ContainerWriteError);
    CHECK(zf.members().size() == 1);
}

void test_fixed_timestamp() {
    ZipArchive first{time_t(1600000000)};
    ZipArchive second{time_t(1600000000)};
    for(auto *zf : {&first, &second}) {
        zf->add_member("mimetype", "application/epub+zip", false);
        zf->add_member("chapter1.html", "<p>hi</p>");
    }
    CHECK(first.finalize() == second.finalize());
}

void test_write_to_path() {
    const auto dir = std::filesystem::temp_directory_path();
    const auto ofile = dir / "bookbinder-ziptest.zip";
    std::filesystem::remove(ofile);
    ZipArchive zf{time_t(1600000000)};
    zf.add_member("mimetype", "application/epub+zip", false);
    zf.write_to(ofile);
    const auto contents = read_file(ofile);
    CHECK(contents == zf.finalize());

    // An existing file is replaced as a whole.
    ZipArchive bigger{time_t(1600000000)};
    bigger.add_member("mimetype", "application/epub+zip", false);
    bigger.add_member("content.opf", std::string(5000, 'x'));
    bigger.write_to(ofile);
    CHECK(read_file(ofile) == bigger.finalize());
    auto tmpfile = ofile;
    tmpfile += ".tmp";
    CHECK(!std::filesystem::exists(tmpfile));
    std::filesystem::remove(ofile);

    CHECK_THROWS(zf.write_to(dir / "no-such-dir" / "x.zip"), ContainerWriteError);
}

} // namespace

int main(int, char **) {
    printf("Running zip tests.\n");
    test_member_order_and_compression();
    test_stored_member_is_at_start();
    test_duplicate_names();
    test_fixed_timestamp();
    test_write_to_path();
    return 0;
}
