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

#include <coverrenderer.hpp>
#include <errors.hpp>
#include <utils.hpp>

#include <tinyxml2.h>

namespace {

std::string font_family_list(const std::vector<std::string> &fonts) {
    std::string result;
    for(const auto &f : fonts) {
        result += '\'';
        result += f;
        result += "', ";
    }
    result += "sans-serif";
    return result;
}

tinyxml2::XMLElement *add_text(tinyxml2::XMLElement *svg,
                               const std::string &text,
                               double x,
                               double y,
                               double size,
                               const char *weight) {
    auto doc = svg->GetDocument();
    auto element = doc->NewElement("text");
    svg->InsertEndChild(element);
    element->SetAttribute("text-anchor", "middle");
    element->SetAttribute("x", x);
    element->SetAttribute("y", y);
    element->SetAttribute("font-size", size);
    element->SetAttribute("font-weight", weight);
    element->SetText(text.c_str());
    return element;
}

} // namespace

RenderedCover MarkupCoverRenderer::render(const CoverText &text,
                                          const std::vector<std::string> &fonts,
                                          uint32_t width,
                                          uint32_t height,
                                          CoverFormat format) {
    if(format != CoverFormat::Svg) {
        throw RenderUnavailable("Raster covers need the cairo renderer.");
    }
    if(width == 0 || height == 0) {
        throw RenderUnavailable("Cover has zero size.");
    }
    const double w = width;
    const double h = height;
    const double margin = w * 0.05;

    tinyxml2::XMLDocument svgdoc;
    svgdoc.InsertFirstChild(svgdoc.NewDeclaration(nullptr));
    auto svg = svgdoc.NewElement("svg");
    svgdoc.InsertEndChild(svg);
    svg->SetAttribute("xmlns", "http://www.w3.org/2000/svg");
    svg->SetAttribute("width", width);
    svg->SetAttribute("height", height);
    svg->SetAttribute("viewBox", ("0 0 " + std::to_string(width) + " " + std::to_string(height)).c_str());
    svg->SetAttribute("font-family", font_family_list(fonts).c_str());

    auto rect = svgdoc.NewElement("rect");
    svg->InsertEndChild(rect);
    rect->SetAttribute("x", margin);
    rect->SetAttribute("y", margin);
    rect->SetAttribute("width", w - 2 * margin);
    rect->SetAttribute("height", h - 2 * margin);
    rect->SetAttribute("stroke", "#8c1a1a");
    rect->SetAttribute("stroke-width", w * 0.02);
    rect->SetAttribute("fill", "#f2f2f2");

    const double title_size = w * 0.08;
    auto title = add_text(svg, text.title, w / 2, h * 0.25, title_size, "bold");
    title->SetAttribute("fill", "#334099");
    add_text(svg, text.author, w / 2, h * 0.5, title_size * 0.8, "normal");
    if(text.generator) {
        add_text(svg, "Generated by " + *text.generator, w / 2, h * 0.9, title_size * 0.5, "normal");
    }

    return RenderedCover{xml_to_string(svgdoc), "image/svg+xml", "svg"};
}
