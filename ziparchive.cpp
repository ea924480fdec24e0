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

#include <ziparchive.hpp>
#include <errors.hpp>

#include <glib.h>
#include <zip.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace {

[[noreturn]] void throw_zip_error(const std::string &what, zip_error_t *err) {
    std::string msg{what};
    msg += ": ";
    msg += zip_error_strerror(err);
    throw ContainerWriteError(msg);
}

void add_to_zip(zip_t *za, const ZipMember &m, std::optional<time_t> mtime) {
    zip_source_t *src = zip_source_buffer(za, m.data.data(), m.data.size(), 0);
    if(!src) {
        throw_zip_error("Could not create source for " + m.name, zip_get_error(za));
    }
    const zip_int64_t idx = zip_file_add(za, m.name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if(idx < 0) {
        zip_source_free(src);
        throw_zip_error("Could not add " + m.name, zip_get_error(za));
    }
    const zip_int32_t method = m.compressed ? ZIP_CM_DEFLATE : ZIP_CM_STORE;
    if(zip_set_file_compression(za, zip_uint64_t(idx), method, 0) != 0) {
        throw_zip_error("Could not set compression of " + m.name, zip_get_error(za));
    }
    if(mtime && zip_file_set_mtime(za, zip_uint64_t(idx), *mtime, 0) != 0) {
        throw_zip_error("Could not set timestamp of " + m.name, zip_get_error(za));
    }
}

std::string read_source(zip_source_t *src) {
    if(zip_source_open(src) != 0) {
        throw_zip_error("Could not open finished archive", zip_source_error(src));
    }
    std::string result;
    char buf[4096];
    zip_int64_t num_read;
    while((num_read = zip_source_read(src, buf, sizeof(buf))) > 0) {
        result.append(buf, size_t(num_read));
    }
    if(num_read < 0) {
        std::string msg{"Could not read finished archive: "};
        msg += zip_error_strerror(zip_source_error(src));
        zip_source_close(src);
        throw ContainerWriteError(msg);
    }
    zip_source_close(src);
    return result;
}

} // namespace

void ZipArchive::add_member(std::string name, std::string data, bool compressed) {
    if(name.empty()) {
        throw ContainerWriteError("Archive member has an empty name.");
    }
    auto it = std::find_if(
        entries.begin(), entries.end(), [&name](const ZipMember &m) { return m.name == name; });
    if(it != entries.end()) {
        throw ContainerWriteError("Duplicate archive member " + name + ".");
    }
    entries.emplace_back(ZipMember{std::move(name), std::move(data), compressed});
}

std::string ZipArchive::finalize() const {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t *src = zip_source_buffer_create(nullptr, 0, 0, &error);
    if(!src) {
        std::string msg{"Could not create archive buffer: "};
        msg += zip_error_strerror(&error);
        zip_error_fini(&error);
        throw ContainerWriteError(msg);
    }
    zip_t *za = zip_open_from_source(src, ZIP_CREATE | ZIP_TRUNCATE, &error);
    if(!za) {
        std::string msg{"Could not open archive: "};
        msg += zip_error_strerror(&error);
        zip_error_fini(&error);
        zip_source_free(src);
        throw ContainerWriteError(msg);
    }
    zip_error_fini(&error);
    // Keep the buffer alive after zip_close so the result can be read back.
    zip_source_keep(src);

    try {
        for(const auto &m : entries) {
            add_to_zip(za, m, mtime);
        }
    } catch(const ContainerWriteError &) {
        zip_discard(za);
        zip_source_free(src);
        throw;
    }
    if(zip_close(za) != 0) {
        std::string msg{"Could not finish archive: "};
        msg += zip_error_strerror(zip_get_error(za));
        zip_discard(za);
        zip_source_free(src);
        throw ContainerWriteError(msg);
    }

    std::string result;
    try {
        result = read_source(src);
    } catch(const ContainerWriteError &) {
        zip_source_free(src);
        throw;
    }
    zip_source_free(src);
    g_debug("Finalized archive with %d members, %d bytes.", int(entries.size()), int(result.size()));
    return result;
}

void ZipArchive::write_to(const std::filesystem::path &ofile) const {
    write_bytes(finalize(), ofile);
}

void write_bytes(const std::string &bytes, const std::filesystem::path &ofile) {
    // The destination is only replaced by a complete file.
    auto tmpfile = ofile;
    tmpfile += ".tmp";
    std::ofstream out(tmpfile, std::ios::binary | std::ios::trunc);
    if(out.fail()) {
        throw ContainerWriteError("Could not open " + tmpfile.string() + " for writing.");
    }
    out.write(bytes.data(), std::streamsize(bytes.size()));
    out.close();
    std::error_code ec;
    if(out.fail()) {
        std::filesystem::remove(tmpfile, ec);
        throw ContainerWriteError("Could not write " + ofile.string() + ".");
    }
    std::filesystem::rename(tmpfile, ofile, ec);
    if(ec) {
        std::string msg = "Could not move " + tmpfile.string() + " to " + ofile.string() + ": ";
        msg += ec.message();
        std::filesystem::remove(tmpfile, ec);
        throw ContainerWriteError(msg);
    }
}
