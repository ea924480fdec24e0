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

#include <stdexcept>
#include <string>

class BookError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Identifier source ran dry or two entities ended up with the same id.
class IdentityError : public BookError {
public:
    using BookError::BookError;
};

class RenderUnavailable : public BookError {
public:
    using BookError::BookError;
};

// Only raised when strict cover references are requested.
class InvalidReference : public BookError {
public:
    using BookError::BookError;
};

class ContainerWriteError : public BookError {
public:
    using BookError::BookError;
};

class ConfigError : public BookError {
public:
    using BookError::BookError;
};
