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

#include <coverrenderer.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

#include <string>
#include <vector>

// Draws covers with Pango and Cairo, either into a PNG image or an SVG document.
class CairoCoverRenderer : public CoverRenderer {
public:
    RenderedCover render(const CoverText &text,
                         const std::vector<std::string> &fonts,
                         uint32_t width,
                         uint32_t height,
                         CoverFormat format) override;

    // First family in the list that fontconfig knows about, "Sans" if none.
    static std::string select_font(const std::vector<std::string> &fonts);

private:
    void draw_cover(cairo_t *cr, const CoverText &text, const std::string &family, double w, double h);
    double draw_text(cairo_t *cr,
                     PangoLayout *layout,
                     const std::string &family,
                     const std::string &text,
                     double w,
                     double y,
                     double scale);
};
