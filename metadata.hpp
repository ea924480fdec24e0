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

#include <book.hpp>

#include <filesystem>
#include <string>

enum class RendererKind : int {
    Cairo,
    Markup,
};

struct BookDefinition {
    // All paths in the definition are relative to this (i.e. where the JSON file was)
    std::filesystem::path top_dir;
    std::filesystem::path ofname;
    Book book;
    PackOptions options;
    RendererKind renderer = RendererKind::Cairo;
};

std::string mime_type_for(const std::filesystem::path &p);

BookDefinition load_book_json(const std::filesystem::path &path);
