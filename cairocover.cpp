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

#include <cairocover.hpp>
#include <errors.hpp>

#include <cairo-svg.h>
#include <fontconfig/fontconfig.h>
#include <glib.h>

namespace {

const char fallback_font[] = "Sans";

const double min_font_size = 5;

cairo_status_t append_to_string(void *closure, const unsigned char *data, unsigned int length) {
    auto *out = static_cast<std::string *>(closure);
    out->append((const char *)data, length);
    return CAIRO_STATUS_SUCCESS;
}

bool font_family_exists(const std::string &family) {
    FcPattern *pattern = FcPatternCreate();
    FcPatternAddString(pattern, FC_FAMILY, (const FcChar8 *)family.c_str());
    FcObjectSet *oset = FcObjectSetBuild(FC_FAMILY, (char *)0);
    FcFontSet *fset = FcFontList(nullptr, pattern, oset);
    const bool found = fset && fset->nfont > 0;
    if(fset) {
        FcFontSetDestroy(fset);
    }
    FcObjectSetDestroy(oset);
    FcPatternDestroy(pattern);
    return found;
}

void throw_on_cairo_error(cairo_status_t status, const char *what) {
    if(status != CAIRO_STATUS_SUCCESS) {
        std::string msg{what};
        msg += ": ";
        msg += cairo_status_to_string(status);
        throw RenderUnavailable(msg);
    }
}

} // namespace

std::string CairoCoverRenderer::select_font(const std::vector<std::string> &fonts) {
    for(const auto &f : fonts) {
        if(font_family_exists(f)) {
            g_info("Successfully chose font %s.", f.c_str());
            return f;
        }
        g_info("Failed to select font %s, falling back.", f.c_str());
    }
    return fallback_font;
}

RenderedCover CairoCoverRenderer::render(const CoverText &text,
                                         const std::vector<std::string> &fonts,
                                         uint32_t width,
                                         uint32_t height,
                                         CoverFormat format) {
    if(width == 0 || height == 0) {
        throw RenderUnavailable("Cover has zero size.");
    }
    const auto family = select_font(fonts);
    RenderedCover result;
    cairo_surface_t *surf = nullptr;
    if(format == CoverFormat::Png) {
        surf = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, int(width), int(height));
        result.mime_type = "image/png";
        result.extension = "png";
    } else {
        surf = cairo_svg_surface_create_for_stream(append_to_string, &result.data, width, height);
        result.mime_type = "image/svg+xml";
        result.extension = "svg";
    }
    auto status = cairo_surface_status(surf);
    if(status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surf);
        throw_on_cairo_error(status, "Could not create cover surface");
    }

    cairo_t *cr = cairo_create(surf);
    draw_cover(cr, text, family, width, height);
    status = cairo_status(cr);
    cairo_destroy(cr);

    if(status == CAIRO_STATUS_SUCCESS) {
        if(format == CoverFormat::Png) {
            status = cairo_surface_write_to_png_stream(surf, append_to_string, &result.data);
        } else {
            cairo_surface_finish(surf);
            status = cairo_surface_status(surf);
        }
    }
    cairo_surface_destroy(surf);
    throw_on_cairo_error(status, "Cover rendering failed");
    g_debug("Rendered %s cover of %d bytes.", result.extension.c_str(), int(result.data.size()));
    return result;
}

void CairoCoverRenderer::draw_cover(
    cairo_t *cr, const CoverText &text, const std::string &family, double w, double h) {
    // Neutral gray background.
    cairo_save(cr);
    cairo_rectangle(cr, 0, 0, w, h);
    cairo_set_source_rgb(cr, 0.95, 0.95, 0.95);
    cairo_fill(cr);
    cairo_restore(cr);

    // Heavy red border.
    cairo_save(cr);
    cairo_set_source_rgb(cr, 0.55, 0.1, 0.1);
    cairo_set_line_width(cr, 30);
    const double margin = w * 0.05;
    cairo_rectangle(cr, margin, margin, w - 2 * margin, h - 2 * margin);
    cairo_stroke(cr);
    cairo_restore(cr);

    PangoLayout *layout = pango_cairo_create_layout(cr);
    const double title_scale = draw_text(cr, layout, family, text.title, w, h * 0.25, 90);
    draw_text(cr, layout, family, text.author, w, h * 0.5, title_scale * 0.8);
    if(text.generator) {
        draw_text(
            cr, layout, family, "Generated by " + *text.generator, w, h * 0.9, title_scale * 0.5);
    }
    g_object_unref(G_OBJECT(layout));
}

// Shrinks the text until it fits in 80% of the page width. Returns the size used.
double CairoCoverRenderer::draw_text(cairo_t *cr,
                                     PangoLayout *layout,
                                     const std::string &family,
                                     const std::string &text,
                                     double w,
                                     double y,
                                     double scale) {
    // TODO split long titles onto multiple lines instead of shrinking them.
    const double happy_width = w * 0.8;
    PangoFontDescription *desc = pango_font_description_new();
    pango_font_description_set_family(desc, family.c_str());
    pango_font_description_set_weight(desc, PANGO_WEIGHT_BOLD);
    pango_layout_set_text(layout, text.c_str(), -1);

    double text_width = 0;
    while(true) {
        pango_font_description_set_absolute_size(desc, scale * PANGO_SCALE);
        pango_layout_set_font_description(layout, desc);
        PangoRectangle logical;
        pango_layout_get_extents(layout, nullptr, &logical);
        text_width = double(logical.width) / PANGO_SCALE;
        if(text_width <= happy_width || scale - 5 < min_font_size) {
            break;
        }
        scale -= 5;
    }
    pango_font_description_free(desc);

    const double dx = (w - text_width) * 0.5;
    const double baseline = double(pango_layout_get_baseline(layout)) / PANGO_SCALE;
    g_info("Writing text %s at size %.0f at position (%.1f, %.1f).", text.c_str(), scale, dx, y);

    cairo_save(cr);
    cairo_move_to(cr, dx, y - baseline);
    pango_cairo_layout_path(cr, layout);
    cairo_set_source_rgb(cr, 0.2, 0.25, 0.55);
    cairo_fill_preserve(cr);
    cairo_set_source_rgb(cr, 0, 0, 0);
    cairo_set_line_width(cr, scale * 0.025);
    cairo_stroke(cr);
    cairo_restore(cr);
    return scale;
}
