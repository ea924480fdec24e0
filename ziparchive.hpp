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

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct ZipMember {
    std::string name;
    std::string data;
    bool compressed;
};

// Collects members in memory. Nothing is handed to libzip before finalize().
class ZipArchive {
public:
    ZipArchive() = default;
    explicit ZipArchive(std::optional<time_t> mtime_) : mtime{mtime_} {}

    void add_member(std::string name, std::string data, bool compressed = true);

    const std::vector<ZipMember> &members() const { return entries; }

    // Members are written in the order they were added.
    std::string finalize() const;

    void write_to(const std::filesystem::path &ofile) const;

private:
    std::vector<ZipMember> entries;
    std::optional<time_t> mtime;
};

void write_bytes(const std::string &bytes, const std::filesystem::path &ofile);
