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

#include <optional>
#include <string>
#include <vector>

struct CoverText {
    std::string title;
    std::string author;
    std::optional<std::string> generator;
};

struct RenderedCover {
    std::string data;
    std::string mime_type;
    // Without the dot.
    std::string extension;
};

class CoverRenderer {
public:
    virtual ~CoverRenderer() = default;

    // Throws RenderUnavailable if the format can not be produced.
    virtual RenderedCover render(const CoverText &text,
                                 const std::vector<std::string> &fonts,
                                 uint32_t width,
                                 uint32_t height,
                                 CoverFormat format) = 0;
};

// Writes SVG markup directly. Needs no graphics libraries, so it can only do vector output:
// asking it for a PNG is an error.
class MarkupCoverRenderer : public CoverRenderer {
public:
    RenderedCover render(const CoverText &text,
                         const std::vector<std::string> &fonts,
                         uint32_t width,
                         uint32_t height,
                         CoverFormat format) override;
};
