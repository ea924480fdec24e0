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

#include <identity.hpp>
#include <errors.hpp>
#include <glib.h>

#include <algorithm>
#include <unordered_set>

namespace {

const int max_attempts = 8;

bool id_in_use(const Book &book, const std::string &id) {
    if(book.id == id) {
        return true;
    }
    return book.find_attachment(id) != nullptr;
}

bool is_reserved_id(const std::string &id) {
    if(id == "ncx" || id == "stylesheet" || id == "uuid_id") {
        return true;
    }
    const std::string prefix{"chapter"};
    if(id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return std::all_of(
        id.begin() + prefix.size(), id.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

std::string RandomIdGenerator::next_id() {
    gchar *uuid = g_uuid_string_random();
    std::string result{uuid};
    g_free(uuid);
    return result;
}

std::string generate_unique_id(const Book &book, IdGenerator &ids) {
    for(int i = 0; i < max_attempts; ++i) {
        auto candidate = ids.next_id();
        if(candidate.empty()) {
            throw IdentityError("Identifier generator returned an empty id.");
        }
        if(!id_in_use(book, candidate)) {
            return candidate;
        }
        g_warning("Generated id %s is already in use, retrying.", candidate.c_str());
    }
    throw IdentityError("Could not generate a unique identifier.");
}

void assign_identities(Book &book, IdGenerator &ids) {
    if(book.id.empty()) {
        book.id = generate_unique_id(book, ids);
        g_debug("Assigned book id %s.", book.id.c_str());
    }
    for(auto &a : book.attachments) {
        if(a.file_id.empty()) {
            a.file_id = generate_unique_id(book, ids);
        }
    }
}

void check_identities(const Book &book) {
    std::unordered_set<std::string> seen;
    for(const auto &a : book.attachments) {
        if(a.file_id.empty()) {
            throw IdentityError("Attachment " + a.file_name + " has no id.");
        }
        if(is_reserved_id(a.file_id)) {
            throw IdentityError("Attachment id " + a.file_id + " is reserved.");
        }
        if(!seen.insert(a.file_id).second) {
            throw IdentityError("Duplicate attachment id " + a.file_id + ".");
        }
    }
}
