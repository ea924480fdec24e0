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

#include <tinyxml2.h>

#include <filesystem>
#include <string>

std::string read_file(const std::filesystem::path &p);

std::string xml_to_string(const tinyxml2::XMLDocument &doc);

// Sets up an XHTML 1.1 skeleton and returns the body element.
tinyxml2::XMLElement *write_xhtml_header(tinyxml2::XMLDocument &doc,
                                         const std::string &title,
                                         const std::string &language,
                                         bool link_stylesheet);
