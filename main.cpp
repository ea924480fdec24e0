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

#include <cairocover.hpp>
#include <epub.hpp>
#include <errors.hpp>
#include <metadata.hpp>

#include <cstdio>

int main(int argc, char **argv) {
    if(argc != 2) {
        printf("%s <bookdef.json>\n", argv[0]);
        return 1;
    }
    try {
        auto def = load_book_json(argv[1]);
        RandomIdGenerator ids;
        CairoCoverRenderer cairo_renderer;
        MarkupCoverRenderer markup_renderer;
        CoverRenderer &renderer = def.renderer == RendererKind::Markup
                                      ? static_cast<CoverRenderer &>(markup_renderer)
                                      : static_cast<CoverRenderer &>(cairo_renderer);
        Epub epub(ids, renderer, def.options);
        epub.generate(def.book, def.ofname);
    } catch(const BookError &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    return 0;
}
