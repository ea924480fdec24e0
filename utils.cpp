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

#include <utils.hpp>
#include <errors.hpp>

#include <fstream>
#include <iterator>

std::string read_file(const std::filesystem::path &p) {
    std::ifstream input(p, std::ios::binary);
    if(input.fail()) {
        throw ConfigError("Could not open file " + p.string() + ".");
    }
    std::string contents{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if(input.bad()) {
        throw ConfigError("Could not read file " + p.string() + ".");
    }
    return contents;
}

std::string xml_to_string(const tinyxml2::XMLDocument &doc) {
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    // CStrSize includes the terminating null.
    return std::string(printer.CStr(), printer.CStrSize() - 1);
}

tinyxml2::XMLElement *write_xhtml_header(tinyxml2::XMLDocument &doc,
                                         const std::string &title,
                                         const std::string &language,
                                         bool link_stylesheet) {
    auto decl = doc.NewDeclaration(nullptr);
    doc.InsertFirstChild(decl);
    auto doctype = doc.NewUnknown(
        R"(DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.1//EN" "http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd")");
    doc.InsertEndChild(doctype);
    auto html = doc.NewElement("html");
    doc.InsertEndChild(html);
    html->SetAttribute("xmlns", "http://www.w3.org/1999/xhtml");
    html->SetAttribute("xml:lang", language.c_str());

    auto head = doc.NewElement("head");
    html->InsertEndChild(head);
    auto meta = doc.NewElement("meta");
    head->InsertEndChild(meta);
    meta->SetAttribute("http-equiv", "Content-Type");
    meta->SetAttribute("content", "application/xhtml+xml; charset=utf-8");
    auto title_element = doc.NewElement("title");
    head->InsertEndChild(title_element);
    title_element->SetText(title.c_str());
    if(link_stylesheet) {
        auto style = doc.NewElement("link");
        head->InsertEndChild(style);
        style->SetAttribute("rel", "stylesheet");
        style->SetAttribute("href", "book.css");
        style->SetAttribute("type", "text/css");
    }

    auto body = doc.NewElement("body");
    html->InsertEndChild(body);
    return body;
}
