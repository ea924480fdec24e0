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

#include <metadata.hpp>
#include <errors.hpp>
#include <utils.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace {

using json = nlohmann::json;

const std::unordered_map<std::string, std::string> mimemap{{".html", "application/xhtml+xml"},
                                                          {".xhtml", "application/xhtml+xml"},
                                                          {".css", "text/css"},
                                                          {".png", "image/png"},
                                                          {".jpg", "image/jpeg"},
                                                          {".jpeg", "image/jpeg"},
                                                          {".gif", "image/gif"},
                                                          {".svg", "image/svg+xml"},
                                                          {".ttf", "font/ttf"},
                                                          {".otf", "font/otf"},
                                                          {".woff", "font/woff"}};

const std::unordered_map<std::string, CoverFormat> formatmap{{"png", CoverFormat::Png},
                                                             {"svg", CoverFormat::Svg}};

const std::unordered_map<std::string, TocPolicy> tocmap{{"all", TocPolicy::AllChapters},
                                                        {"visible", TocPolicy::VisibleOnly}};

const std::unordered_map<std::string, RendererKind> renderermap{{"cairo", RendererKind::Cairo},
                                                                {"markup", RendererKind::Markup}};

std::string get_string(const json &data, const char *key) {
    if(!data.contains(key)) {
        throw ConfigError(std::string("Missing required key ") + key + ".");
    }
    const auto &value = data[key];
    if(!value.is_string()) {
        throw ConfigError(std::string("Element ") + key + " is not a string.");
    }
    return value.get<std::string>();
}

std::string get_string(const json &data, const char *key, const std::string &default_value) {
    if(!data.contains(key)) {
        return default_value;
    }
    return get_string(data, key);
}

bool get_bool(const json &data, const char *key, bool default_value) {
    if(!data.contains(key)) {
        return default_value;
    }
    const auto &value = data[key];
    if(!value.is_boolean()) {
        throw ConfigError(std::string("Element ") + key + " is not a boolean.");
    }
    return value.get<bool>();
}

uint32_t get_size(const json &data, const char *key, uint32_t default_value) {
    if(!data.contains(key)) {
        return default_value;
    }
    const auto &value = data[key];
    if(!value.is_number_unsigned() || value.get<uint64_t>() == 0 ||
       value.get<uint64_t>() > 100000) {
        throw ConfigError(std::string("Element ") + key + " is not a valid size.");
    }
    return value.get<uint32_t>();
}

std::vector<std::string> extract_stringarray(const json &data, const char *entryname) {
    std::vector<std::string> result;
    if(!data.contains(entryname)) {
        return result;
    }
    const auto &arr = data[entryname];
    if(!arr.is_array()) {
        throw ConfigError(std::string(entryname) + " must be an array of strings.");
    }
    for(const auto &e : arr) {
        if(!e.is_string()) {
            throw ConfigError(std::string("Array ") + entryname + " entry is not a string.");
        }
        result.push_back(e.get<std::string>());
    }
    return result;
}

const json &get_array(const json &data, const char *key) {
    static const json empty = json::array();
    if(!data.contains(key)) {
        return empty;
    }
    const auto &arr = data[key];
    if(!arr.is_array()) {
        throw ConfigError(std::string(key) + " must be an array.");
    }
    return arr;
}

template<typename T>
T lookup(const std::unordered_map<std::string, T> &table,
         const std::string &value,
         const char *what) {
    auto it = table.find(value);
    if(it == table.end()) {
        throw ConfigError(std::string("Unknown ") + what + " \"" + value + "\".");
    }
    return it->second;
}

Chapter load_chapter(const json &entry, const std::filesystem::path &top_dir) {
    Chapter c;
    c.title = get_string(entry, "title", "");
    c.show_in_toc = get_bool(entry, "toc", true);
    c.content = read_file(top_dir / get_string(entry, "file"));
    return c;
}

Attachment load_attachment(const json &entry, const std::filesystem::path &top_dir) {
    Attachment a;
    const std::filesystem::path file = get_string(entry, "file");
    a.file_id = get_string(entry, "id", "");
    a.file_name = get_string(entry, "name", file.filename().string());
    if(entry.contains("mime")) {
        a.mime_type = get_string(entry, "mime");
    } else {
        a.mime_type = mime_type_for(file);
    }
    a.content = read_file(top_dir / file);
    return a;
}

CoverRequest load_cover(const json &cover, RendererKind &renderer) {
    if(!cover.is_object()) {
        throw ConfigError("cover must be an object.");
    }
    CoverRequest r;
    r.format = lookup(formatmap, get_string(cover, "format", "png"), "cover format");
    r.width = get_size(cover, "width", r.width);
    r.height = get_size(cover, "height", r.height);
    r.font_preferences = extract_stringarray(cover, "fonts");
    if(cover.contains("generator")) {
        r.generator = get_string(cover, "generator");
    }
    r.text_title_page = get_bool(cover, "text_title_page", false);
    renderer = lookup(renderermap, get_string(cover, "renderer", "cairo"), "renderer");
    return r;
}

} // namespace

std::string mime_type_for(const std::filesystem::path &p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return char(std::tolower(c));
    });
    auto it = mimemap.find(ext);
    if(it == mimemap.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

BookDefinition load_book_json(const std::filesystem::path &path) {
    BookDefinition def;
    def.top_dir = path.parent_path();
    std::ifstream ifile(path);
    if(ifile.fail()) {
        throw ConfigError("Could not open file " + path.string() + ".");
    }

    json data;
    try {
        data = json::parse(ifile);
    } catch(const json::parse_error &e) {
        throw ConfigError("Could not parse " + path.string() + ": " + e.what());
    }
    if(!data.is_object()) {
        throw ConfigError("Top level element of " + path.string() + " must be an object.");
    }

    Book &b = def.book;
    b.title = get_string(data, "title");
    b.author = get_string(data, "author", "");
    b.id = get_string(data, "id", "");
    b.language = get_string(data, "language", "en");
    def.ofname = def.top_dir / get_string(data, "output");

    if(data.contains("stylesheet")) {
        b.stylesheet = read_file(def.top_dir / get_string(data, "stylesheet"));
    }
    for(const auto &entry : get_array(data, "chapters")) {
        b.chapters.emplace_back(load_chapter(entry, def.top_dir));
    }
    for(const auto &entry : get_array(data, "attachments")) {
        b.attachments.emplace_back(load_attachment(entry, def.top_dir));
    }
    if(data.contains("cover_id")) {
        b.cover_id = get_string(data, "cover_id");
    }
    if(data.contains("cover")) {
        b.cover = load_cover(data["cover"], def.renderer);
    }

    def.options.toc_policy = lookup(tocmap, get_string(data, "toc", "all"), "toc policy");
    def.options.strict_cover_reference = get_bool(data, "strict_cover", false);
    if(data.contains("timestamp")) {
        const auto &ts = data["timestamp"];
        if(!ts.is_number_integer()) {
            throw ConfigError("Element timestamp is not an integer.");
        }
        def.options.timestamp = ts.get<time_t>();
    }
    return def;
}
