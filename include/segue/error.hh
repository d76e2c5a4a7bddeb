// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace segue {

/**
 * @brief Base exception class for all segue errors
 *
 * Backends throw classes derived from this one. The transport never lets
 * them escape its public API: they are caught and reported through the
 * error event instead.
 */
class segue_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Audio backend failures
 *
 * Thrown when the backend cannot carry out a transport request, such as:
 * - Output device lost
 * - Decoder failure while loading a track
 * - Backend not initialized
 */
class backend_error : public segue_error {
public:
    using segue_error::segue_error;
};

/**
 * @brief I/O related errors
 *
 * Thrown when a track resource cannot be reached, such as:
 * - File not found
 * - Permission denied
 */
class io_error : public backend_error {
public:
    using backend_error::backend_error;
};

/**
 * @brief State related errors
 *
 * Thrown when a backend operation is attempted in an invalid state, for
 * example playing before any track was loaded.
 */
class state_error : public backend_error {
public:
    using backend_error::backend_error;
};

} // namespace segue

/*
 * Copyright (C) 2025
 *
 * This file is part of segue.
 *
 * segue is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * segue is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with segue.  If not, see <http://www.gnu.org/licenses/>.
 */
