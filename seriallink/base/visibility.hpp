/*
 * Copyright 2025 Jinwoo Sung
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

// Symbol visibility for the seriallink library. SERIALLINK_BUILD_SHARED is set by
// the build when the library is produced as a shared object, and
// SERIALLINK_BUILDING_LIBRARY only while compiling the library itself.
#if !defined(SERIALLINK_API)
#if defined(SERIALLINK_BUILD_SHARED)
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(SERIALLINK_BUILDING_LIBRARY)
#define SERIALLINK_API __declspec(dllexport)
#else
#define SERIALLINK_API __declspec(dllimport)
#endif
#else
#define SERIALLINK_API __attribute__((visibility("default")))
#endif
#else
#define SERIALLINK_API
#endif
#endif

#if !defined(SERIALLINK_LOCAL)
#if defined(_WIN32) || defined(__CYGWIN__) || !defined(SERIALLINK_BUILD_SHARED)
#define SERIALLINK_LOCAL
#else
#define SERIALLINK_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
