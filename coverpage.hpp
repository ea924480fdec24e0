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
#include <coverrenderer.hpp>
#include <identity.hpp>

extern const char title_page_title[];

// If the book has a cover request, renders the cover image, adds it as an attachment and
// puts a title page in front of the first chapter. The request is consumed.
void compose_cover(Book &book, CoverRenderer &renderer, IdGenerator &ids);

std::string title_page_xhtml(const Book &book, const Attachment &cover_image, bool text_only);
