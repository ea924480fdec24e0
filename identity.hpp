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

#include <string>

class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    virtual std::string next_id() = 0;
};

// Version 4 UUIDs from glib.
class RandomIdGenerator : public IdGenerator {
public:
    std::string next_id() override;
};

// Fills in the book id and attachment file ids that are empty. Existing ids are kept.
void assign_identities(Book &book, IdGenerator &ids);

// Throws IdentityError if attachment ids are duplicated or clash with reserved manifest ids.
void check_identities(const Book &book);

std::string generate_unique_id(const Book &book, IdGenerator &ids);
