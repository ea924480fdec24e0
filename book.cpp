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

#include <book.hpp>
#include <glib.h>

#include <algorithm>
#include <array>
#include <cstdio>

const char unknown_author[] = "Unknown";

namespace {

const size_t sha1_size = 20;

} // namespace

// SHA-1 name based UUID in the nil namespace, without dashes.
std::string name_based_uuid(const std::string &name) {
    const std::array<guchar, 16> nil_namespace{};
    std::array<guint8, sha1_size> digest;
    gsize digest_len = digest.size();

    GChecksum *sum = g_checksum_new(G_CHECKSUM_SHA1);
    g_checksum_update(sum, nil_namespace.data(), nil_namespace.size());
    g_checksum_update(sum, (const guchar *)name.data(), name.size());
    g_checksum_get_digest(sum, digest.data(), &digest_len);
    g_checksum_free(sum);

    digest[6] = (digest[6] & 0x0F) | 0x50;
    digest[8] = (digest[8] & 0x3F) | 0x80;

    std::string result;
    result.reserve(32);
    char buf[3];
    for(size_t i = 0; i < 16; ++i) {
        snprintf(buf, sizeof(buf), "%02x", digest[i]);
        result += buf;
    }
    return result;
}

std::string Chapter::file_id() const { return "chapter" + std::to_string(index); }

std::string Chapter::file_name() const { return file_id() + ".html"; }

std::string Chapter::nav_id() const { return "ch" + name_based_uuid(title); }

const std::string &Book::author_or_placeholder() const {
    static const std::string placeholder{unknown_author};
    if(author.empty()) {
        return placeholder;
    }
    return author;
}

const Attachment *Book::find_attachment(const std::string &file_id) const {
    auto it = std::find_if(attachments.begin(), attachments.end(), [&file_id](const Attachment &a) {
        return a.file_id == file_id;
    });
    if(it == attachments.end()) {
        return nullptr;
    }
    return &(*it);
}

const Attachment *Book::cover_attachment() const {
    if(!cover_id) {
        return nullptr;
    }
    return find_attachment(*cover_id);
}
