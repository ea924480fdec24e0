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

#pragma once

#include <identity.hpp>

#include <tinyxml2.h>
#include <zip.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

// Evaluates stmt and checks that it throws exctype.
#define CHECK_THROWS(stmt, exctype)                                                                \
    {                                                                                              \
        bool thrown_ = false;                                                                      \
        try {                                                                                      \
            stmt;                                                                                  \
        } catch(const exctype &) {                                                                 \
            thrown_ = true;                                                                        \
        }                                                                                          \
        CHECK(thrown_);                                                                            \
    }

class SequenceIdGenerator : public IdGenerator {
public:
    explicit SequenceIdGenerator(std::vector<std::string> ids_) : ids{std::move(ids_)} {}

    std::string next_id() override {
        if(next >= ids.size()) {
            return std::string{};
        }
        return ids[next++];
    }

    size_t used() const { return next; }

private:
    std::vector<std::string> ids;
    size_t next = 0;
};

struct ExtractedMember {
    std::string name;
    std::string data;
    zip_int32_t method;
    time_t mtime;
};

inline std::vector<ExtractedMember> extract_archive(const std::string &bytes) {
    std::vector<ExtractedMember> members;
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t *src = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
    CHECK(src);
    zip_t *za = zip_open_from_source(src, ZIP_RDONLY, &error);
    CHECK(za);
    zip_error_fini(&error);
    const zip_int64_t num_entries = zip_get_num_entries(za, 0);
    for(zip_int64_t i = 0; i < num_entries; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        CHECK(zip_stat_index(za, zip_uint64_t(i), 0, &st) == 0);
        ExtractedMember m;
        m.name = st.name;
        m.method = zip_int32_t(st.comp_method);
        m.mtime = st.mtime;
        m.data.resize(st.size);
        zip_file_t *f = zip_fopen_index(za, zip_uint64_t(i), 0);
        CHECK(f);
        if(st.size > 0) {
            CHECK(zip_fread(f, m.data.data(), st.size) == zip_int64_t(st.size));
        }
        zip_fclose(f);
        members.emplace_back(std::move(m));
    }
    zip_discard(za);
    return members;
}

inline const ExtractedMember *find_member(const std::vector<ExtractedMember> &members,
                                          const std::string &name) {
    for(const auto &m : members) {
        if(m.name == name) {
            return &m;
        }
    }
    return nullptr;
}

inline bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

inline size_t count_occurrences(const std::string &haystack, const std::string &needle) {
    size_t count = 0;
    size_t pos = 0;
    while((pos = haystack.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

inline bool is_well_formed(const std::string &xml) {
    tinyxml2::XMLDocument doc;
    return doc.Parse(xml.c_str(), xml.size()) == tinyxml2::XML_SUCCESS;
}
